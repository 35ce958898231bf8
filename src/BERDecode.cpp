#include "include/BER.h"

// Definite form only, up to 4 length octets. Returns the number of octets used or a negative error
static int decode_ber_length_integer(const uint8_t* buf, size_t max_len, size_t* decoded_integer){
    if(max_len < 1) return SNMP_BUFFER_ERROR_TLV_TOO_SMALL;

    if(*buf <= 127) {
        *decoded_integer = *buf;
        return 1;
    }

    int numBytes = *buf & 0x7F;
    if(numBytes == 0 || numBytes > 4){
        // 0x80 is the indefinite form, which SNMP never uses
        return SNMP_BUFFER_ERROR_INVALID_LENGTH;
    }
    if((size_t)numBytes + 1 > max_len) return SNMP_BUFFER_ERROR_TLV_TOO_SMALL;

    size_t special_length = 0;
    for(int k = 0; k < numBytes; k++){
        buf++;
        special_length <<= 8;
        special_length |= *buf;
    }
    *decoded_integer = special_length;
    return numBytes + 1;
}

// Big-endian two's complement, sign extended
static int64_t decode_ber_signed(const uint8_t* ptr, int length){
    int64_t value = (*ptr & 0x80) ? -1 : 0;
    for(int i = 0; i < length; i++){
        value = (int64_t)(((uint64_t)value << 8) | ptr[i]);
    }
    return value;
}

int BER_CONTAINER::fromBuffer(const uint8_t *buf, size_t max_len) {
    // In the base class we check our type and decode the length of this structure, then return bytes read
    if(max_len < 2) return SNMP_BUFFER_ERROR_TLV_TOO_SMALL; // Too small for any type

    const uint8_t* ptr = buf;
    if(*ptr != _type){
        SNMP_LOGE("Mismatched type when decoding %d, %d\n", _type, *ptr);
        return SNMP_BUFFER_ERROR_TYPE_MISMATCH;
    }
    ptr++; // type

    size_t length = 0;
    int lengthBytes = decode_ber_length_integer(ptr, max_len - 1, &length);
    CHECK_DECODE_ERR(lengthBytes);
    ptr += lengthBytes;

    size_t headerLength = ptr - buf;
    if(length > max_len - headerLength){
        // length of object is too big to read in
        return SNMP_BUFFER_ERROR_MAX_LEN_EXCEEDED;
    }
    _length = (int)length;

    return (int)headerLength;
}

int NetworkAddress::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length != 4) return SNMP_BUFFER_ERROR_INVALID_LENGTH;

    memcpy(_value, buf + i, 4);
    return i + _length;
}

int IntegerType::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length < 1 || _length > 8) return SNMP_BUFFER_ERROR_INVALID_LENGTH;

    int64_t value = decode_ber_signed(buf + i, _length);
    if(value < INT32_MIN || value > INT32_MAX) return SNMP_BUFFER_ERROR_INTEGER_OUT_OF_RANGE;
    _value = (int32_t)value;

    return i + _length;
}

int Unsigned32Type::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length < 1 || _length > 8) return SNMP_BUFFER_ERROR_INVALID_LENGTH;

    int64_t value = decode_ber_signed(buf + i, _length);
    if(value < 0 || value > (int64_t)UINT32_MAX) return SNMP_BUFFER_ERROR_INTEGER_OUT_OF_RANGE;
    _value = (uint32_t)value;

    return i + _length;
}

int Counter64::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length < 1 || _length > 9) return SNMP_BUFFER_ERROR_INVALID_LENGTH;

    const uint8_t* ptr = buf + i;
    if(*ptr & 0x80) return SNMP_BUFFER_ERROR_INTEGER_OUT_OF_RANGE; // negative
    if(_length == 9){
        // only a leading zero octet is allowed to push us to 9
        if(*ptr != 0) return SNMP_BUFFER_ERROR_INTEGER_OUT_OF_RANGE;
    }

    _value = 0;
    for(int k = 0; k < _length; k++){
        _value = (_value << 8U) | ptr[k];
    }
    return i + _length;
}

int OctetType::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length > OCTET_TYPE_MAX_LENGTH) return SNMP_BUFFER_ERROR_OCTET_TOO_BIG;

    _value.assign((const char*)(buf + i), _length);

    return i + _length;
}

int OpaqueType::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length > OCTET_TYPE_MAX_LENGTH) return SNMP_BUFFER_ERROR_OCTET_TOO_BIG;

    _value.assign(buf + i, buf + i + _length);

    return i + _length;
}

int OIDType::fromBuffer(const uint8_t *buf, size_t max_len){
    int j = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(j);
    if(_length < 1) return SNMP_BUFFER_ERROR_INVALID_OID;

    const uint8_t* ptr = buf + j;
    const uint8_t* end = ptr + _length;

    this->data.clear();
    this->valid = false;

    bool first = true;
    while(ptr < end){
        // 0x80 can't start a sub-identifier, it would be a padding byte
        if(*ptr == 0x80) return SNMP_BUFFER_ERROR_INVALID_OID;

        uint64_t subIdentifier = 0;
        bool complete = false;
        while(ptr < end){
            uint8_t octet = *ptr++;
            subIdentifier = (subIdentifier << 7) | (octet & 0x7F);
            if(subIdentifier > (uint64_t)UINT32_MAX + 80) return SNMP_BUFFER_ERROR_INVALID_OID;
            if(!(octet & 0x80)){
                complete = true;
                break;
            }
        }
        if(!complete) return SNMP_BUFFER_ERROR_INVALID_OID; // ran out of data mid sub-identifier

        if(first){
            // First sub-identifier packs the first two arcs as 40*X+Y
            if(subIdentifier < 40){
                this->data.push_back(0);
                this->data.push_back((uint32_t)subIdentifier);
            } else if(subIdentifier < 80){
                this->data.push_back(1);
                this->data.push_back((uint32_t)(subIdentifier - 40));
            } else {
                this->data.push_back(2);
                this->data.push_back((uint32_t)(subIdentifier - 80));
            }
            first = false;
        } else {
            if(subIdentifier > UINT32_MAX) return SNMP_BUFFER_ERROR_INVALID_OID;
            this->data.push_back((uint32_t)subIdentifier);
        }
    }

    this->valid = true;
    return j + _length;
}

int NullType::fromBuffer(const uint8_t *buf, size_t max_len){
    int i = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(i);
    if(_length != 0) return SNMP_BUFFER_ERROR_INVALID_LENGTH;
    return i;
}

std::shared_ptr<BER_CONTAINER> ComplexType::createObjectForType(ASN_TYPE valueType){
    SNMP_LOGD("Creating object of type: %d\n", valueType);
    switch(valueType){
        case INTEGER:
            return std::shared_ptr<BER_CONTAINER>(new IntegerType());
        case STRING:
            return std::shared_ptr<BER_CONTAINER>(new OctetType());
        case OID:
            return std::shared_ptr<BER_CONTAINER>(new OIDType());
        case NULLTYPE:
            return std::shared_ptr<BER_CONTAINER>(new NullType());

        case NOSUCHOBJECT:
            return std::shared_ptr<BER_CONTAINER>(new ImplicitNullType(NOSUCHOBJECT));
        case NOSUCHINSTANCE:
            return std::shared_ptr<BER_CONTAINER>(new ImplicitNullType(NOSUCHINSTANCE));
        case ENDOFMIBVIEW:
            return std::shared_ptr<BER_CONTAINER>(new ImplicitNullType(ENDOFMIBVIEW));

        // derived
        case NETWORK_ADDRESS:
            return std::shared_ptr<BER_CONTAINER>(new NetworkAddress());
        case TIMESTAMP:
            return std::shared_ptr<BER_CONTAINER>(new TimestampType());
        case COUNTER32:
            return std::shared_ptr<BER_CONTAINER>(new Counter32());
        case GAUGE32:
            return std::shared_ptr<BER_CONTAINER>(new Gauge());
        case COUNTER64:
            return std::shared_ptr<BER_CONTAINER>(new Counter64());
        case OPAQUE:
            return std::shared_ptr<BER_CONTAINER>(new OpaqueType());

        // Complex
        case STRUCTURE:

        case GetRequestPDU:
        case GetNextRequestPDU:
        case GetResponsePDU:
        case SetRequestPDU:
        case TrapPDU:
        case GetBulkRequestPDU:
        case InformRequestPDU:
        case Trapv2PDU:
            return std::shared_ptr<BER_CONTAINER>(new ComplexType(valueType));
        default:
            return nullptr;
    }
}

int ComplexType::fromBuffer(const uint8_t *buf, size_t max_len){
    int j = BER_CONTAINER::fromBuffer(buf, max_len);
    CHECK_DECODE_ERR(j);
    const uint8_t* ptr = buf + j;

    // Children may only use what our own length allows
    size_t remaining = (size_t)_length;
    while(remaining > 0){
        ASN_TYPE valueType = (ASN_TYPE)*ptr;

        auto newObj = ComplexType::createObjectForType(valueType);
        if(!newObj){
            SNMP_LOGD("Couldn't create object of type: %d\n", valueType);
            return SNMP_BUFFER_ERROR_UNKNOWN_TYPE;
        }

        int used_length = newObj->fromBuffer(ptr, remaining);
        if(used_length <= 0){
            // Problem de-serialising
            SNMP_LOGD("Problem deserialising structure of type: %d, reason: %d\n", valueType, used_length);
            return SNMP_BUFFER_ERROR_PROBLEM_DESERIALISING;
        }

        addValueToList(newObj);

        ptr += used_length;
        remaining -= used_length;
    }
    return j + _length;
}
