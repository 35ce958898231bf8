#include "SNMP_Agent.h"

SNMP_ERROR_RESPONSE SNMPAgent::processDatagram(uint8_t* buffer, int packetLength, int* responseLength, int max_packet_size){
    SNMP_LOGD("Received packet of size: %d\n", packetLength);

    SNMP_ERROR_RESPONSE response = handlePacket(buffer, packetLength, responseLength, max_packet_size, registry, _community, _readOnlyCommunity);
    return this->recordResult(response);
}

SNMP_ERROR_RESPONSE SNMPAgent::processMessage(const SNMPPacket& request, SNMPResponse& response){
    return this->recordResult(handleMessage(request, response, registry, _community, _readOnlyCommunity));
}

SNMP_ERROR_RESPONSE SNMPAgent::recordResult(SNMP_ERROR_RESPONSE result){
    if(result == SNMP_SET_OCCURRED){
        setOccurred = true;
    }
    return result;
}

std::shared_ptr<OIDType> SNMPAgent::buildOIDWithPrefix(const char *oid, bool overwritePrefix){
    if(!oid) return nullptr;

    std::shared_ptr<OIDType> newOid;
    if(!this->oidPrefix.empty() && !overwritePrefix){
        std::string temp;
        temp.append(this->oidPrefix);
        temp.append(oid);
        newOid = std::make_shared<OIDType>(temp);
    } else {
        newOid = std::make_shared<OIDType>(oid);
    }
    if(newOid->valid){
        return newOid;
    }
    SNMP_LOGW("Invalid OID: %s\n", oid);
    return nullptr;
}

SNMP_REGISTER_RESULT SNMPAgent::registerReadOnly(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter){
    return registry.registerObject(oid, getter);
}

SNMP_REGISTER_RESULT SNMPAgent::registerReadOnly(const char *oid, const ValueGetter& getter, bool overwritePrefix){
    return registerReadOnly(buildOIDWithPrefix(oid, overwritePrefix), getter);
}

SNMP_REGISTER_RESULT SNMPAgent::registerReadWrite(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter, const ValueSetter& setter){
    return registry.registerObject(oid, getter, setter);
}

SNMP_REGISTER_RESULT SNMPAgent::registerReadWrite(const char *oid, const ValueGetter& getter, const ValueSetter& setter, bool overwritePrefix){
    return registerReadWrite(buildOIDWithPrefix(oid, overwritePrefix), getter, setter);
}

SNMP_REGISTER_RESULT SNMPAgent::addReadWriteStringHandler(const char *oid, std::string* value, size_t max_len, bool isSettable, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    if(isSettable){
        return registerReadWrite(oid, string_getter(value), string_setter(value, max_len), overwritePrefix);
    }
    return registerReadOnly(oid, string_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addReadOnlyStaticStringHandler(const char *oid, const std::string& value, bool overwritePrefix) {
    return registerReadOnly(oid, static_string_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addDynamicReadOnlyStringHandler(const char *oid, GETSTRING_FUNC callback_func, bool overwritePrefix){
    if(!callback_func) return SNMP_REGISTER_MISSING_GETTER;

    return registerReadOnly(oid, dynamic_string_getter(callback_func), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addOpaqueHandler(const char *oid, std::vector<uint8_t>* value, bool isSettable, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    if(isSettable){
        return registerReadWrite(oid, opaque_getter(value), opaque_setter(value), overwritePrefix);
    }
    return registerReadOnly(oid, opaque_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addIntegerHandler(const char *oid, int* value, bool isSettable, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    if(isSettable){
        return registerReadWrite(oid, integer_getter(value), integer_setter(value), overwritePrefix);
    }
    return registerReadOnly(oid, integer_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addReadOnlyIntegerHandler(const char *oid, int value, bool overwritePrefix){
    return registerReadOnly(oid, static_integer_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addDynamicIntegerHandler(const char *oid, GETINT_FUNC callback_func, bool overwritePrefix){
    if(!callback_func) {
        return SNMP_REGISTER_MISSING_GETTER;
    }

    return registerReadOnly(oid, dynamic_integer_getter(callback_func), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addTimestampHandler(const char *oid, uint32_t* value, bool isSettable, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    if(isSettable){
        return registerReadWrite(oid, timestamp_getter(value), timestamp_setter(value), overwritePrefix);
    }
    return registerReadOnly(oid, timestamp_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addDynamicReadOnlyTimestampHandler(const char *oid, GETUINT_FUNC callback_func, bool overwritePrefix){
    if(!callback_func) return SNMP_REGISTER_MISSING_GETTER;

    return registerReadOnly(oid, dynamic_timestamp_getter(callback_func), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addOIDHandler(const char *oid, const std::string& value, bool overwritePrefix){
    OIDType check(value);
    if(!check.valid) return SNMP_REGISTER_INVALID_OID;

    return registerReadOnly(oid, oid_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addCounter32Handler(const char *oid, uint32_t* value, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    return registerReadOnly(oid, counter32_getter(value), overwritePrefix);
}

SNMP_REGISTER_RESULT SNMPAgent::addGaugeHandler(const char *oid, uint32_t* value, bool overwritePrefix){
    if(!value) return SNMP_REGISTER_MISSING_GETTER;

    return registerReadOnly(oid, gauge_getter(value), overwritePrefix);
}
