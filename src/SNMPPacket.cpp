#include "include/SNMPPacket.h"

#define SNMP_PARSE_ERROR_AT_STATE(STATE) (((int)STATE * -1) - 10 + SNMP_PACKET_PARSE_ERROR_OFFSET)

#define ASN_TYPE_FOR_STATE_SNMPVERSION      INTEGER
#define ASN_TYPE_FOR_STATE_COMMUNITY        STRING
#define ASN_TYPE_FOR_STATE_REQUESTID        INTEGER
#define ASN_TYPE_FOR_STATE_ERRORSTATUS      INTEGER
#define ASN_TYPE_FOR_STATE_ERRORID          INTEGER
#define ASN_TYPE_FOR_STATE_TRAPENTERPRISE   OID
#define ASN_TYPE_FOR_STATE_TRAPAGENTADDRESS NETWORK_ADDRESS
#define ASN_TYPE_FOR_STATE_TRAPGENERIC      INTEGER
#define ASN_TYPE_FOR_STATE_TRAPSPECIFIC     INTEGER
#define ASN_TYPE_FOR_STATE_TRAPTIMESTAMP    TIMESTAMP
#define ASN_TYPE_FOR_STATE_VARBINDS         STRUCTURE
#define ASN_TYPE_FOR_STATE_VARBIND          STRUCTURE

#define STR_IMPL_(x) #x      //stringify argument
#define STR(x) STR_IMPL_(x)  //indirection to expand argument macros

#define ASSERT_ASN_TYPE_AT_STATE(value, TYPE, STATE) \
    if(!value || value->_type != TYPE) { \
        SNMP_LOGW("Expecting value to be " STR(TYPE) " for " #STATE "\n"); \
        return SNMP_PARSE_ERROR_AT_STATE(STATE); \
    }

#define ASSERT_ASN_STATE_TYPE(value, STATE) \
    if(!value || value->_type != ASN_TYPE_FOR_STATE_##STATE) { \
        SNMP_LOGW("Expecting " STR(ASN_TYPE_FOR_STATE_##STATE) " for " #STATE " failed\n"); \
        return SNMP_PARSE_ERROR_AT_STATE(STATE); \
    }

#define ASSERT_ASN_PARSING_TYPE_RANGE(value, LOW_TYPE, HIGH_TYPE) \
    if(!value || !(value->_type >= LOW_TYPE && value->_type <= HIGH_TYPE)){ \
        SNMP_LOGW("Expecting vartype for PDU failed\n"); \
        return SNMP_PARSE_ERROR_GENERIC; \
    }

// How many children the structure we enter at this state must have, -1 for any
static int expected_values_for_state(enum SNMPParsingState state){
    switch(state){
        case SNMPVERSION:
            return 3;
        case REQUESTID:
            return 4;
        case TRAPENTERPRISE:
            return 6;
        default:
            return -1;
    }
}

SNMP_PACKET_PARSE_ERROR SNMPPacket::parsePacket(ComplexType *structure, enum SNMPParsingState state) {
    int expected = expected_values_for_state(state);
    if(expected >= 0 && structure->values.size() != (size_t)expected){
        SNMP_LOGW("Expecting %d values at state %d, got %lu\n", expected, state, (unsigned long)structure->values.size());
        return SNMP_PARSE_ERROR_AT_STATE(state);
    }

    for(const auto& value : structure->values){
        if(state == DONE) break;

        switch(state) {

            case SNMPVERSION:
                ASSERT_ASN_STATE_TYPE(value, SNMPVERSION);
                this->snmpVersion = static_cast<IntegerType*>(value.get())->_value;
                state = COMMUNITY;
            break;

            case COMMUNITY:
                ASSERT_ASN_STATE_TYPE(value, COMMUNITY);
                this->communityString = static_cast<OctetType*>(value.get())->_value;
                state = PDU;
            break;

            case PDU:
                ASSERT_ASN_PARSING_TYPE_RANGE(value, ASN_PDU_TYPE_MIN_VALUE, ASN_PDU_TYPE_MAX_VALUE)
                this->packetPDUType = value->_type;
                if(this->packetPDUType == TrapPDU){
                    return this->parsePacket(static_cast<ComplexType*>(value.get()), TRAPENTERPRISE);
                }
                return this->parsePacket(static_cast<ComplexType*>(value.get()), REQUESTID);

            case REQUESTID:
                ASSERT_ASN_STATE_TYPE(value, REQUESTID);
                this->requestID = static_cast<IntegerType*>(value.get())->_value;
                state = ERRORSTATUS;
            break;

            case ERRORSTATUS:
                ASSERT_ASN_STATE_TYPE(value, ERRORSTATUS);
                this->errorStatus.errorStatus = static_cast<IntegerType*>(value.get())->_value;
                state = ERRORID;
            break;

            case ERRORID:
                ASSERT_ASN_STATE_TYPE(value, ERRORID);
                this->errorIndex.errorIndex = static_cast<IntegerType*>(value.get())->_value;
                state = VARBINDS;
            break;

            case TRAPENTERPRISE:
                ASSERT_ASN_STATE_TYPE(value, TRAPENTERPRISE);
                this->enterpriseOID = std::static_pointer_cast<OIDType>(value);
                state = TRAPAGENTADDRESS;
            break;

            case TRAPAGENTADDRESS:
                ASSERT_ASN_STATE_TYPE(value, TRAPAGENTADDRESS);
                memcpy(this->agentAddress._value, static_cast<NetworkAddress*>(value.get())->_value, 4);
                state = TRAPGENERIC;
            break;

            case TRAPGENERIC:
                ASSERT_ASN_STATE_TYPE(value, TRAPGENERIC);
                this->genericTrap = static_cast<IntegerType*>(value.get())->_value;
                state = TRAPSPECIFIC;
            break;

            case TRAPSPECIFIC:
                ASSERT_ASN_STATE_TYPE(value, TRAPSPECIFIC);
                this->specificTrap = static_cast<IntegerType*>(value.get())->_value;
                state = TRAPTIMESTAMP;
            break;

            case TRAPTIMESTAMP:
                ASSERT_ASN_STATE_TYPE(value, TRAPTIMESTAMP);
                this->trapTimestamp = static_cast<TimestampType*>(value.get())->_value;
                state = VARBINDS;
            break;

            case VARBINDS:
                ASSERT_ASN_STATE_TYPE(value, VARBINDS);
                // we have a varbind structure, lets dive into it.
                return this->parsePacket(static_cast<ComplexType*>(value.get()), VARBIND);

            case VARBIND:
            {
                ASSERT_ASN_STATE_TYPE(value, VARBIND);
                // we are in a single varbind

                auto varbindValues = std::static_pointer_cast<ComplexType>(value);

                if (varbindValues->values.size() != 2) {
                    SNMP_LOGW("Expecting VARBIND TO CONTAIN 2 OBJECTS; %lu\n",
                              (unsigned long)varbindValues->values.size());
                    return SNMP_PARSE_ERROR_AT_STATE(VARBIND);
                };

                auto vbOid = varbindValues->values[0];
                ASSERT_ASN_TYPE_AT_STATE(vbOid, OID, VARBIND);

                auto vbValue = varbindValues->values[1];
                if(vbValue->_type == STRUCTURE || vbValue->_type >= ASN_PDU_TYPE_MIN_VALUE){
                    SNMP_LOGW("VARBIND value can't be a structure\n");
                    return SNMP_PARSE_ERROR_AT_STATE(VARBIND);
                }

                this->varbindList.emplace_back(
                    std::static_pointer_cast<OIDType>(vbOid),
                    vbValue
                );
            }
            break;

            case DONE:
                return SNMP_ERROR_OK;
        }
    }
    return SNMP_ERROR_OK;
}

SNMP_PACKET_PARSE_ERROR SNMPPacket::parseFrom(const uint8_t* buf, size_t len){
    SNMP_LOGD("Parsing %lu bytes\n", (unsigned long)len);
    if(len < 2 || buf[0] != STRUCTURE) {
        SNMP_LOGD("First byte error\n");
        return SNMP_PARSE_ERROR_MAGIC_BYTE;
    }

    this->varbindList.clear();
    packet = std::make_shared<ComplexType>(STRUCTURE);

    SNMP_BUFFER_PARSE_ERROR decodePacket = packet->fromBuffer(buf, len);
    if(decodePacket <= 0){
        SNMP_LOGD("failed to fromBuffer: %d\n", decodePacket);
        return decodePacket;
    }

    if((size_t)decodePacket != len){
        SNMP_LOGD("%lu remaining bytes after message\n", (unsigned long)(len - decodePacket));
        return SNMP_PARSE_ERROR_TRAILING_BYTES;
    }

    // we now have a full ASN.1 packet in SNMPPacket
    return parsePacket(packet.get(), SNMPVERSION);
}

int SNMPPacket::serialiseInto(uint8_t* buf, size_t max_len){
    if(this->build()){
        return this->packet->serialise(buf, max_len);
    }
    return 0;
}

bool SNMPPacket::build(){
    this->packet = std::make_shared<ComplexType>(STRUCTURE);

    this->packet->addValueToList(std::make_shared<IntegerType>(this->snmpVersion));
    this->packet->addValueToList(std::make_shared<OctetType>(this->communityString));

    auto snmpPDU = std::make_shared<ComplexType>(this->packetPDUType);

    if(this->packetPDUType == TrapPDU){
        if(!this->enterpriseOID || !this->enterpriseOID->valid) return false;

        snmpPDU->addValueToList(this->enterpriseOID);
        snmpPDU->addValueToList(std::make_shared<NetworkAddress>(this->agentAddress._value[0], this->agentAddress._value[1],
                                                                 this->agentAddress._value[2], this->agentAddress._value[3]));
        snmpPDU->addValueToList(std::make_shared<IntegerType>(this->genericTrap));
        snmpPDU->addValueToList(std::make_shared<IntegerType>(this->specificTrap));
        snmpPDU->addValueToList(std::make_shared<TimestampType>(this->trapTimestamp));
    } else {
        snmpPDU->addValueToList(std::make_shared<IntegerType>(this->requestID));
        snmpPDU->addValueToList(std::make_shared<IntegerType>(this->errorStatus.errorStatus));
        snmpPDU->addValueToList(std::make_shared<IntegerType>(this->errorIndex.errorIndex));
    }

    auto varBindList = this->generateVarBindList();
    if(!varBindList) return false;

    snmpPDU->addValueToList(varBindList);

    this->packet->addValueToList(snmpPDU);

    return true;
}

void SNMPPacket::setCommunityString(const std::string &CommunityString){
    this->communityString = CommunityString;
}

void SNMPPacket::setRequestID(snmp_request_id_t RequestId){
    this->requestID = RequestId;
}

bool SNMPPacket::setPDUType(ASN_TYPE responseType){
    if(responseType >= ASN_PDU_TYPE_MIN_VALUE && responseType <= ASN_PDU_TYPE_MAX_VALUE){
        this->packetPDUType = responseType;
        return true;
    }
    return false;
}

void SNMPPacket::setVersion(int SnmpVersion){
    this->snmpVersion = SnmpVersion;
}

std::shared_ptr<ComplexType> SNMPPacket::generateVarBindList(){
    auto varBindList = std::make_shared<ComplexType>(STRUCTURE);

    for(const auto& varBindItem : varbindList){
        if(!varBindItem.oid || !varBindItem.oid->valid || !varBindItem.value){
            SNMP_LOGW("Can't encode an invalid varbind\n");
            return nullptr;
        }

        auto varBind = std::make_shared<ComplexType>(STRUCTURE);

        varBind->addValueToList(varBindItem.oid);
        varBind->addValueToList(varBindItem.value);

        varBindList->addValueToList(varBind);
    }

    return varBindList;
}
