#include "include/SNMPResponse.h"

void SNMPResponse::setVarBinds(const VarBindList& list){
    // VarBind members are const, so rebuild rather than assign
    this->varbindList.clear();
    for(const auto& item : list){
        this->varbindList.emplace_back(item);
    }
}

bool SNMPResponse::setGlobalError(SNMP_ERROR_STATUS error, int index, int overwrite){
    if(this->errorStatus.errorStatus == NO_ERROR || overwrite){
        this->errorStatus.errorStatus = error;
        this->errorIndex.errorIndex = index;
        return true;
    }
    return false;
}
