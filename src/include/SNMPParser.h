#ifndef SNMP_PARSER_h
#define SNMP_PARSER_h

#include "BER.h"
#include "ManagedObjects.h"
#include "SNMPPacket.h"
#include "SNMPResponse.h"
#include "VarBinds.h"
#include "defs.h"

#include <string>

// Empty configured communities never match
SNMP_PERMISSION getPermissionOfRequest(const std::string &community, const std::string &readOnlyCommunity,
                                       const std::string &readWriteCommunity);

// Stops at the first binding that fails, errorIndex is 1-based (0 on success).
// Only Get/GetNext accumulate into outResponseList.
// errorMessage, when given, receives the reason for a failure.
SNMP_ERROR_STATUS handleRequestPDU(const ManagedObjectRegistry &registry, const VarBindList &varbindList,
                                   VarBindList &outResponseList, int *errorIndex,
                                   bool isGetNextRequest, bool isSetRequest,
                                   std::string *errorMessage = nullptr);

// Fills in response for a decoded request. A negative result means nothing should be sent.
SNMP_ERROR_RESPONSE handleMessage(const SNMPPacket &request, SNMPResponse &response,
                                  const ManagedObjectRegistry &registry,
                                  const std::string &readWriteCommunity, const std::string &readOnlyCommunity);

// Decodes buffer, handles it and encodes the response back into buffer
SNMP_ERROR_RESPONSE handlePacket(uint8_t *buffer, int packetLength, int *responseLength, int max_packet_size,
                                 const ManagedObjectRegistry &registry,
                                 const std::string &readWriteCommunity, const std::string &readOnlyCommunity);

#endif
