#include "include/BER.h"

#include <algorithm>

std::string NetworkAddress::string() const {
    return std::to_string(_value[0]) + "." + std::to_string(_value[1]) + "." +
           std::to_string(_value[2]) + "." + std::to_string(_value[3]);
}

bool NetworkAddress::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return memcmp(_value, static_cast<const NetworkAddress*>(other)->_value, 4) == 0;
}

bool IntegerType::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return _value == static_cast<const IntegerType*>(other)->_value;
}

bool Unsigned32Type::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return _value == static_cast<const Unsigned32Type*>(other)->_value;
}

bool Counter64::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return _value == static_cast<const Counter64*>(other)->_value;
}

bool OctetType::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return _value == static_cast<const OctetType*>(other)->_value;
}

bool OpaqueType::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return _value == static_cast<const OpaqueType*>(other)->_value;
}

bool OIDType::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;
    return this->data == static_cast<const OIDType*>(other)->data;
}

bool ComplexType::equals(const BER_CONTAINER* other) const {
    if(!BER_CONTAINER::equals(other)) return false;

    auto complex = static_cast<const ComplexType*>(other);
    if(complex->values.size() != this->values.size()) return false;

    for(size_t i = 0; i < this->values.size(); i++){
        if(!this->values[i] || !this->values[i]->equals(complex->values[i].get())) return false;
    }
    return true;
}

std::string OIDType::string() const {
    std::string value;
    for(auto component : this->data){
        value += '.';
        value += std::to_string(component);
    }
    return value;
}

int OIDType::compare(const OIDType& other) const {
    const auto& map1 = this->data;
    const auto& map2 = other.data;

    size_t i = std::min(map1.size(), map2.size());

    for(size_t j = 0; j < i; j++){
        if(map1[j] != map2[j]){ // if they're the same then we're on same level
            return map1[j] < map2[j] ? -1 : 1;
        }
    }

    if(map1.size() == map2.size()) return 0;
    return map1.size() < map2.size() ? -1 : 1;
}
