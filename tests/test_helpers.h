#ifndef SNMP_TEST_HELPERS_h
#define SNMP_TEST_HELPERS_h

#include "include/BER.h"
#include "include/ManagedObjects.h"
#include "include/SNMPPacket.h"
#include "include/SNMPParser.h"
#include "include/SNMPResponse.h"
#include "include/VarBinds.h"

#include <initializer_list>
#include <memory>
#include <string>

// v1 GetRequest for sysUpTime.0, community "publ", request id 0x7425436c
static const uint8_t SYSUPTIME_GET_REQUEST[] = {
    0x30, 0x27, 0x02, 0x01, 0x00, 0x04, 0x04, 0x70, 0x75, 0x62, 0x6c, 0xa0,
    0x1c, 0x02, 0x04, 0x74, 0x25, 0x43, 0x6c, 0x02, 0x01, 0x00, 0x02, 0x01,
    0x00, 0x30, 0x0e, 0x30, 0x0c, 0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01,
    0x01, 0x03, 0x00, 0x05, 0x00
};

static inline std::shared_ptr<SNMPPacket> makeRequest(ASN_TYPE type, const std::string& community,
                                                      std::initializer_list<const char*> oids){
    auto packet = std::make_shared<SNMPPacket>();
    packet->setPDUType(type);
    packet->setCommunityString(community);
    packet->setRequestID(0x1234);
    packet->setVersion(SNMP_VERSION_1);

    for(auto oid : oids){
        packet->varbindList.push_back(VarBind(std::make_shared<OIDType>(oid)));
    }
    return packet;
}

// Encodes request, runs it through handlePacket and decodes the answer into response
static inline SNMP_ERROR_RESPONSE exchange(SNMPPacket& request, SNMPPacket& response, const ManagedObjectRegistry& registry,
                                           int max_packet_size = MAX_SNMP_PACKET_LENGTH,
                                           const std::string& readWriteCommunity = "private",
                                           const std::string& readOnlyCommunity = "public"){
    uint8_t buffer[MAX_SNMP_PACKET_LENGTH] = {0};
    int requestLength = request.serialiseInto(buffer, sizeof(buffer));
    if(requestLength <= 0) return SNMP_GENERIC_ERROR;

    int responseLength = 0;
    SNMP_ERROR_RESPONSE result = handlePacket(buffer, requestLength, &responseLength, max_packet_size, registry,
                                              readWriteCommunity, readOnlyCommunity);
    if(result > 0 && response.parseFrom(buffer, responseLength) != SNMP_ERROR_OK){
        return SNMP_GENERIC_ERROR;
    }
    return result;
}

#endif
