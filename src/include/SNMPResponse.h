#ifndef SNMPResponse_h
#define SNMPResponse_h

#include "VarBinds.h"
#include "SNMPPacket.h"
#include "defs.h"

class SNMPResponse : public SNMPPacket {
  public:
    explicit SNMPResponse(const SNMPPacket& request): SNMPPacket(request){
      this->setPDUType(GetResponsePDU);
    };

    // Replaces the varbinds with a copy of list, used to hand back the request untouched
    void setVarBinds(const VarBindList& list);

    bool setGlobalError(SNMP_ERROR_STATUS error, int index, int overwrite); // Overwrite existing error?
};

#endif
