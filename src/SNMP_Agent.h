#ifndef SNMPAgent_h
#define SNMPAgent_h

#include "include/BER.h"
#include "include/VarBinds.h"
#include "include/SNMPPacket.h"
#include "include/SNMPResponse.h"
#include "include/ValueCallbacks.h"
#include "include/ManagedObjects.h"
#include "include/SNMPParser.h"
#include "include/defs.h"

#include <string>
#include <vector>

class SNMPAgent {
    public:
        SNMPAgent(){};

        SNMPAgent(const char* readOnlyCommunity, const char* readWriteCommunity): _community(readWriteCommunity), _readOnlyCommunity(readOnlyCommunity){};

        void setReadOnlyCommunity(const std::string& community){
            this->_readOnlyCommunity = community;
        }

        void setReadWriteCommunity(const std::string& community){
            this->_community = community;
        }

        void setCommunities(const std::string& readOnlyCommunity, const std::string& readWriteCommunity){
            this->_readOnlyCommunity = readOnlyCommunity;
            this->_community = readWriteCommunity;
        }

        // Prepended to the textual OIDs given to the add*Handler and register* methods
        void setOIDPrefix(const std::string& prefix){
            this->oidPrefix = prefix;
        }

        std::string _community = "private";
        std::string _readOnlyCommunity = "public";

        SNMP_REGISTER_RESULT registerReadOnly(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter);
        SNMP_REGISTER_RESULT registerReadOnly(const char *oid, const ValueGetter& getter, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT registerReadWrite(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter, const ValueSetter& setter);
        SNMP_REGISTER_RESULT registerReadWrite(const char *oid, const ValueGetter& getter, const ValueSetter& setter, bool overwritePrefix = false);

        SNMP_REGISTER_RESULT addIntegerHandler(const char *oid, int* value, bool isSettable = false, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addReadOnlyIntegerHandler(const char *oid, int value, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addDynamicIntegerHandler(const char *oid, GETINT_FUNC callback_func, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addReadWriteStringHandler(const char *oid, std::string* value, size_t max_len = 0, bool isSettable = false, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addReadOnlyStaticStringHandler(const char *oid, const std::string& value, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addDynamicReadOnlyStringHandler(const char *oid, GETSTRING_FUNC callback_func, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addOpaqueHandler(const char *oid, std::vector<uint8_t>* value, bool isSettable = false, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addTimestampHandler(const char *oid, uint32_t* value, bool isSettable = false, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addDynamicReadOnlyTimestampHandler(const char *oid, GETUINT_FUNC callback_func, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addOIDHandler(const char *oid, const std::string& value, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addCounter32Handler(const char *oid, uint32_t* value, bool overwritePrefix = false);
        SNMP_REGISTER_RESULT addGaugeHandler(const char *oid, uint32_t* value, bool overwritePrefix = false);

        // buffer holds the request and receives the response, max_packet_size is its full size.
        // A negative result means nothing to send
        SNMP_ERROR_RESPONSE processDatagram(uint8_t* buffer, int packetLength, int* responseLength, int max_packet_size);
        SNMP_ERROR_RESPONSE processMessage(const SNMPPacket& request, SNMPResponse& response);

        const ManagedObjectRegistry& objects() const {
            return this->registry;
        }

        bool setOccurred = false;
        void resetSetOccurred(){
            setOccurred = false;
        }

    private:
        ManagedObjectRegistry registry;
        std::string oidPrefix;

        SNMP_ERROR_RESPONSE recordResult(SNMP_ERROR_RESPONSE result);
        std::shared_ptr<OIDType> buildOIDWithPrefix(const char *oid, bool overwritePrefix);
};

#endif
