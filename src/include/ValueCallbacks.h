#ifndef VALUE_CALLBACKS_h
#define VALUE_CALLBACKS_h

#include "BER.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

typedef int (*GETINT_FUNC)() ;
typedef uint32_t (*GETUINT_FUNC)();
typedef const std::string (*GETSTRING_FUNC)();

// Getters receive the resolved OID and fill in value.
// Returning NO_ERROR without a value, or a status outside SNMP_ERROR_STATUS, is reported as GEN_ERR.
// On failure message may describe the problem, it is only logged.
typedef std::function<SNMP_ERROR_STATUS(const OIDType& oid, std::shared_ptr<BER_CONTAINER>& value, std::string& message)> ValueGetter;

// Setters receive the resolved OID and the value from the request
typedef std::function<SNMP_ERROR_STATUS(const OIDType& oid, const std::shared_ptr<BER_CONTAINER>& value, std::string& message)> ValueSetter;

ValueSetter not_writable_setter();

ValueGetter integer_getter(const int* value);
ValueSetter integer_setter(int* value);
ValueGetter static_integer_getter(int value);
ValueGetter dynamic_integer_getter(GETINT_FUNC callback_func);

// max_len of 0 means OCTET_TYPE_MAX_LENGTH
ValueGetter string_getter(const std::string* value);
ValueSetter string_setter(std::string* value, size_t max_len);
ValueGetter static_string_getter(const std::string& value);
ValueGetter dynamic_string_getter(GETSTRING_FUNC callback_func);

ValueGetter opaque_getter(const std::vector<uint8_t>* value);
ValueSetter opaque_setter(std::vector<uint8_t>* value);

ValueGetter timestamp_getter(const uint32_t* value);
ValueSetter timestamp_setter(uint32_t* value);
ValueGetter dynamic_timestamp_getter(GETUINT_FUNC callback_func);

ValueGetter oid_getter(const std::string& value);

ValueGetter counter32_getter(const uint32_t* value);
ValueGetter gauge_getter(const uint32_t* value);

#endif
