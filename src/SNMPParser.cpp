#include "include/SNMPParser.h"
#include <string.h>
#include <string>

SNMP_PERMISSION getPermissionOfRequest(const std::string& community, const std::string& readOnlyCommunity, const std::string& readWriteCommunity){
    SNMP_PERMISSION requestPermission = SNMP_PERM_NONE;
    SNMP_LOGD("community string in packet: %s\n", community.c_str());

    if(!readOnlyCommunity.empty() && readOnlyCommunity == community) {
        requestPermission = SNMP_PERM_READ_ONLY;
    }

    if(!readWriteCommunity.empty() && readWriteCommunity == community) {
        requestPermission = SNMP_PERM_READ_WRITE;
    }
    return requestPermission;
}

SNMP_ERROR_RESPONSE handleMessage(const SNMPPacket& request, SNMPResponse& response, const ManagedObjectRegistry& registry, const std::string& readWriteCommunity, const std::string& readOnlyCommunity){
    if(request.snmpVersion != SNMP_VERSION_1){
        SNMP_LOGW("Unsupported SNMP version: %d\n", request.snmpVersion);
        return SNMP_REQUEST_INVALID_VERSION;
    }

    SNMP_PERMISSION requestPermission = getPermissionOfRequest(request.communityString, readOnlyCommunity, readWriteCommunity);
    if(requestPermission == SNMP_PERM_NONE){
        SNMP_LOGW("Invalid communitystring provided: %s, no response to give\n", request.communityString.c_str());
        return SNMP_REQUEST_INVALID_COMMUNITY;
    }

    // this will take the required stuff from request - like requestID and community string etc
    response.setVersion(request.snmpVersion);
    response.setCommunityString(request.communityString);
    response.setRequestID(request.requestID);
    response.setPDUType(GetResponsePDU);

    VarBindList outResponseList;
    int errorIndex = 0;
    std::string errorMessage;

    SNMP_ERROR_STATUS status = NO_ERROR;
    SNMP_ERROR_RESPONSE handleStatus = SNMP_NO_ERROR;

    switch(request.packetPDUType){
        case GetRequestPDU:
            status = handleRequestPDU(registry, request.varbindList, outResponseList, &errorIndex, false, false, &errorMessage);
            handleStatus = SNMP_GET_OCCURRED;
        break;
        case GetNextRequestPDU:
            status = handleRequestPDU(registry, request.varbindList, outResponseList, &errorIndex, true, false, &errorMessage);
            handleStatus = SNMP_GETNEXT_OCCURRED;
        break;
        case SetRequestPDU:
            if(requestPermission != SNMP_PERM_READ_WRITE){
                errorMessage = "set requires the read-write community";
                status = NO_SUCH_NAME;
                errorIndex = 1;
            } else {
                status = handleRequestPDU(registry, request.varbindList, outResponseList, &errorIndex, false, true, &errorMessage);
                handleStatus = SNMP_SET_OCCURRED;
            }
        break;
        case GetResponsePDU:
        case TrapPDU:
        case GetBulkRequestPDU:
        case InformRequestPDU:
        case Trapv2PDU:
            SNMP_LOGW("Not sure what to do with SNMP PDU of type: %d\n", request.packetPDUType);
            return SNMP_REQUEST_UNSUPPORTED_PDU;
        default:
            SNMP_LOGW("Not an SNMP PDU: %d\n", request.packetPDUType);
            return SNMP_REQUEST_UNSUPPORTED_PDU;
    }

    if(status == NO_ERROR && request.packetPDUType != SetRequestPDU){
        response.setVarBinds(outResponseList);
        response.setGlobalError(NO_ERROR, 0, true);
        return handleStatus;
    }

    // Sets echo the request, and nothing partial goes back on failure
    response.setVarBinds(request.varbindList);
    response.setGlobalError(status, errorIndex, true);

    if(status != NO_ERROR){
        SNMP_LOGD("Handled error when building request, error: %d at %d (%s), sending error PDU\n", status, errorIndex, errorMessage.c_str());
        return SNMP_ERROR_PACKET_SENT;
    }
    return handleStatus;
}

SNMP_ERROR_RESPONSE handlePacket(uint8_t* buffer, int packetLength, int* responseLength, int max_packet_size, const ManagedObjectRegistry& registry, const std::string& readWriteCommunity, const std::string& readOnlyCommunity){
    *responseLength = 0;
    if(!buffer || packetLength <= 0){
        return SNMP_NO_PACKET;
    }

    if(packetLength > max_packet_size){
        SNMP_LOGW("Packet of %d bytes is larger than %d\n", packetLength, max_packet_size);
        return SNMP_REQUEST_TOO_LARGE;
    }

    SNMPPacket request;

    SNMP_PACKET_PARSE_ERROR parseResult = request.parseFrom(buffer, packetLength);
    if(parseResult <= 0){
        SNMP_LOGW("Received Error code: %d when attempting to parse\n", parseResult);
        return SNMP_REQUEST_INVALID;
    }

    SNMP_LOGD("Valid SNMP Packet!\n");

    SNMPResponse response(request);

    SNMP_ERROR_RESPONSE handleStatus = handleMessage(request, response, registry, readWriteCommunity, readOnlyCommunity);
    if(handleStatus < 0){
        SNMP_LOGW("Dropping request %d: %d\n", request.requestID, handleStatus);
        return handleStatus;
    }

    memset(buffer, 0, max_packet_size);

    *responseLength = response.serialiseInto(buffer, max_packet_size);
    if(*responseLength > 0){
        return handleStatus;
    }

    SNMP_LOGW("Response to %d doesn't fit in %d bytes, sending tooBig\n", request.requestID, max_packet_size);

    SNMPResponse tooBig(request);
    tooBig.setVarBinds(request.varbindList);
    tooBig.setGlobalError(TOO_BIG, 0, true);

    memset(buffer, 0, max_packet_size);

    *responseLength = tooBig.serialiseInto(buffer, max_packet_size);
    if(*responseLength <= 0){
        SNMP_LOGW("Failed to build response packet\n");
        *responseLength = 0;
        return SNMP_FAILED_SERIALISATION;
    }

    return SNMP_ERROR_PACKET_SENT;
}
