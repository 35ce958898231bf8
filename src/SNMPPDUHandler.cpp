#include "include/BER.h"
#include "include/SNMPParser.h"
#include "include/ValueCallbacks.h"
#include "include/defs.h"

// Accessors may hand back anything, only the wire statuses are passed through
static SNMP_ERROR_STATUS checkAccessorStatus(SNMP_ERROR_STATUS status, bool expectValue,
                                             const std::shared_ptr<BER_CONTAINER>& value, std::string& message){
    if(!SNMP_ERROR_STATUS_VALID(status)){
        if(message.empty()) message = "unknown status " + std::to_string((int)status);
        return GEN_ERR;
    }
    if(status == NO_ERROR && expectValue && !value){
        if(message.empty()) message = "no value returned";
        return GEN_ERR;
    }
    return status;
}

static SNMP_ERROR_STATUS failRequest(SNMP_ERROR_STATUS status, const std::string& message, std::string* errorMessage){
    SNMP_LOGD("Request failed with %d: %s\n", status, message.c_str());
    if(errorMessage) *errorMessage = message;
    return status;
}

SNMP_ERROR_STATUS handleRequestPDU(const ManagedObjectRegistry &registry, const VarBindList &varbindList,
                                   VarBindList &outResponseList, int *errorIndex,
                                   bool isGetNextRequest, bool isSetRequest, std::string *errorMessage) {
    SNMP_LOGD("handleRequestPDU, %lu varbinds, next: %d, set: %d\n", (unsigned long)varbindList.size(),
              isGetNextRequest, isSetRequest);
    int i = 0;
    for (const VarBind &requestVarBind : varbindList) {
        i++;
        *errorIndex = i;

        SNMP_LOGD("finding object for OID: %s\n", requestVarBind.oid->string().c_str());
        auto object = registry.lookup(*requestVarBind.oid, isGetNextRequest ? SNMP_LOOKUP_NEXT : SNMP_LOOKUP_EXACT);
        if (!object) {
            return failRequest(NO_SUCH_NAME, "no object for " + requestVarBind.oid->string(), errorMessage);
        }

        SNMP_LOGD("Object found with OID: %s\n", object->oid->string().c_str());

        std::string message;
        if (isSetRequest) {
            SNMP_ERROR_STATUS setError = checkAccessorStatus(object->setter(*object->oid, requestVarBind.value, message),
                                                             false, nullptr, message);
            if (setError != NO_ERROR) {
                return failRequest(setError, message, errorMessage);
            }
            continue;
        }

        std::shared_ptr<BER_CONTAINER> value;
        SNMP_ERROR_STATUS getError = checkAccessorStatus(object->getter(*object->oid, value, message), true, value, message);
        if (getError != NO_ERROR) {
            return failRequest(getError, message, errorMessage);
        }

        outResponseList.emplace_back(object->oid, value);
    }

    *errorIndex = 0;
    return NO_ERROR;
}
