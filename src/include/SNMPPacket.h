#ifndef SNMPPacket_h
#define SNMPPacket_h

#include "VarBinds.h"
#include "defs.h"
#include <memory>
#include <string>

enum SNMPParsingState {
    SNMPVERSION,
    COMMUNITY,
    PDU,
    REQUESTID,
    ERRORSTATUS,
    ERRORID,
    TRAPENTERPRISE,
    TRAPAGENTADDRESS,
    TRAPGENERIC,
    TRAPSPECIFIC,
    TRAPTIMESTAMP,
    VARBINDS,
    VARBIND,
    DONE
};

typedef int SNMP_PACKET_PARSE_ERROR;

#define SNMP_PARSE_ERROR_TRAILING_BYTES (-3 + SNMP_PACKET_PARSE_ERROR_OFFSET)
#define SNMP_PARSE_ERROR_MAGIC_BYTE (-2 + SNMP_PACKET_PARSE_ERROR_OFFSET)
#define SNMP_PARSE_ERROR_GENERIC (-1 + SNMP_PACKET_PARSE_ERROR_OFFSET)

// GetBulk reuses the error slots
union ErrorStatus {
  int errorStatus;
  int nonRepeaters;
};

union ErrorIndex {
  int errorIndex;
  int maxRepititions;
};

// One SNMP message. packetPDUType selects which of the PDU fields are meaningful:
// the trap fields for TrapPDU, the error slots for every other kind.
class SNMPPacket {
  public:
    SNMPPacket(){};
    // Copies the envelope (version, community, request id) only
    explicit SNMPPacket(const SNMPPacket& packet){
        this->setRequestID(packet.requestID);
        this->setVersion(packet.snmpVersion);
        this->setCommunityString(packet.communityString);
    };

    virtual ~SNMPPacket() = default;

    // Fails on malformed input and when len is longer than the message
    SNMP_PACKET_PARSE_ERROR parseFrom(const uint8_t* buf, size_t len);
    // Returns the number of bytes written, or <= 0 if the message didn't fit
    int serialiseInto(uint8_t* buf, size_t max_len);

    void setCommunityString(const std::string &CommunityString);
    void setRequestID(snmp_request_id_t);
    bool setPDUType(ASN_TYPE);
    void setVersion(int);

    snmp_request_id_t requestID = 0;
    int snmpVersion = SNMP_VERSION_1;
    std::string communityString;

    ASN_TYPE packetPDUType = GetRequestPDU;

    VarBindList varbindList;

    union ErrorStatus errorStatus = { NO_ERROR };
    union ErrorIndex errorIndex = {0};

    // SNMPv1 Trap-PDU
    std::shared_ptr<OIDType> enterpriseOID;
    NetworkAddress agentAddress;
    int genericTrap = 0;
    int specificTrap = 0;
    uint32_t trapTimestamp = 0;

    std::shared_ptr<ComplexType> packet;

  protected:
    virtual bool build();

    virtual std::shared_ptr<ComplexType> generateVarBindList();

  private:
    SNMP_PACKET_PARSE_ERROR parsePacket(ComplexType* structure, enum SNMPParsingState state);
};

#endif
