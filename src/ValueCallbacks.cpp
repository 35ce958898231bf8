#include "include/ValueCallbacks.h"

#define ASSERT_VALID_VALUE(value) if(!value){ message = "no value bound"; return GEN_ERR; }

// SNMPv1 has no wrongType/wrongLength, everything the setter dislikes is a badValue
#define ASSERT_VALUE_TYPE(value, TYPE) if(!value || value->_type != TYPE){ \
        message = "expected type " #TYPE; \
        return BAD_VALUE; \
    }

ValueSetter not_writable_setter(){
    return [](const OIDType& oid, const std::shared_ptr<BER_CONTAINER>&, std::string& message) -> SNMP_ERROR_STATUS {
        message = "OID " + oid.string() + " is not writable";
        return NOT_WRITABLE;
    };
}

ValueGetter integer_getter(const int* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<IntegerType>(*value);
        return NO_ERROR;
    };
}

ValueSetter integer_setter(int* value){
    return [value](const OIDType&, const std::shared_ptr<BER_CONTAINER>& rawValue, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        ASSERT_VALUE_TYPE(rawValue, INTEGER);

        *value = std::static_pointer_cast<IntegerType>(rawValue)->_value;
        return NO_ERROR;
    };
}

ValueGetter static_integer_getter(int value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string&) -> SNMP_ERROR_STATUS {
        out = std::make_shared<IntegerType>(value);
        return NO_ERROR;
    };
}

ValueGetter dynamic_integer_getter(GETINT_FUNC callback_func){
    return [callback_func](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(callback_func);
        out = std::make_shared<IntegerType>(callback_func());
        return NO_ERROR;
    };
}

ValueGetter string_getter(const std::string* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<OctetType>(*value);
        return NO_ERROR;
    };
}

ValueSetter string_setter(std::string* value, size_t max_len){
    if(max_len == 0 || max_len > OCTET_TYPE_MAX_LENGTH) max_len = OCTET_TYPE_MAX_LENGTH;

    return [value, max_len](const OIDType&, const std::shared_ptr<BER_CONTAINER>& rawValue, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        ASSERT_VALUE_TYPE(rawValue, STRING);

        auto val = std::static_pointer_cast<OctetType>(rawValue);
        if(val->_value.length() > max_len){
            message = "string longer than " + std::to_string(max_len);
            return BAD_VALUE;
        }
        *value = val->_value;
        return NO_ERROR;
    };
}

ValueGetter static_string_getter(const std::string& value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string&) -> SNMP_ERROR_STATUS {
        out = std::make_shared<OctetType>(value);
        return NO_ERROR;
    };
}

ValueGetter dynamic_string_getter(GETSTRING_FUNC callback_func){
    return [callback_func](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(callback_func);
        out = std::make_shared<OctetType>(callback_func());
        return NO_ERROR;
    };
}

ValueGetter opaque_getter(const std::vector<uint8_t>* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<OpaqueType>(*value);
        return NO_ERROR;
    };
}

ValueSetter opaque_setter(std::vector<uint8_t>* value){
    return [value](const OIDType&, const std::shared_ptr<BER_CONTAINER>& rawValue, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        ASSERT_VALUE_TYPE(rawValue, OPAQUE);

        *value = std::static_pointer_cast<OpaqueType>(rawValue)->_value;
        return NO_ERROR;
    };
}

ValueGetter timestamp_getter(const uint32_t* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<TimestampType>(*value);
        return NO_ERROR;
    };
}

ValueSetter timestamp_setter(uint32_t* value){
    return [value](const OIDType&, const std::shared_ptr<BER_CONTAINER>& rawValue, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        ASSERT_VALUE_TYPE(rawValue, TIMESTAMP);

        *value = std::static_pointer_cast<TimestampType>(rawValue)->_value;
        return NO_ERROR;
    };
}

ValueGetter dynamic_timestamp_getter(GETUINT_FUNC callback_func){
    return [callback_func](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(callback_func);
        out = std::make_shared<TimestampType>(callback_func());
        return NO_ERROR;
    };
}

ValueGetter oid_getter(const std::string& value){
    auto oid = std::make_shared<OIDType>(value);

    return [oid](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string&) -> SNMP_ERROR_STATUS {
        // An invalid OID leaves out empty, reported as genErr
        if(oid->valid) out = oid;
        return NO_ERROR;
    };
}

ValueGetter counter32_getter(const uint32_t* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<Counter32>(*value);
        return NO_ERROR;
    };
}

ValueGetter gauge_getter(const uint32_t* value){
    return [value](const OIDType&, std::shared_ptr<BER_CONTAINER>& out, std::string& message) -> SNMP_ERROR_STATUS {
        ASSERT_VALID_VALUE(value);
        out = std::make_shared<Gauge>(*value);
        return NO_ERROR;
    };
}
