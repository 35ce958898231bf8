#include "include/BER.h"

#include <stdlib.h>

static size_t encode_ber_length_integer_count(const size_t integer) {
    size_t bytes_used = 1;
    if (integer >= 128) {
        size_t remaining = integer;
        while (remaining > 0) {
            bytes_used++;
            remaining >>= 8;
        }
    }
    return bytes_used;
}

static size_t encode_ber_length_integer(uint8_t *buf, const size_t integer) {
    size_t bytes_used = encode_ber_length_integer_count(integer);
    if (bytes_used == 1) {
        *buf = integer & 0xFF;
        return 1;
    }

    *buf++ = ((bytes_used - 1) | 0x80) & 0xFF;
    for (size_t k = bytes_used - 1; k > 0; k--) {
        *buf++ = (integer >> (8 * (k - 1))) & 0xFF;
    }
    return bytes_used;
}

// Minimal two's complement, at most 8 octets
static size_t encode_ber_signed(uint8_t *out, const int64_t integer) {
    size_t length = 8;
    while (length > 1) {
        uint8_t top = (integer >> (8 * (length - 1))) & 0xFF;
        uint8_t next = (integer >> (8 * (length - 2))) & 0xFF;
        // drop redundant sign octets
        if ((top == 0x00 && !(next & 0x80)) || (top == 0xFF && (next & 0x80))) {
            length--;
        } else {
            break;
        }
    }
    for (size_t k = 0; k < length; k++) {
        out[k] = (integer >> (8 * (length - 1 - k))) & 0xFF;
    }
    return length;
}

// Non-negative INTEGER, a leading zero octet is added when the top bit is set
static size_t encode_ber_unsigned(uint8_t *out, const uint64_t integer) {
    uint8_t temp[8];
    size_t length = 0;
    uint64_t remaining = integer;
    do {
        temp[length++] = remaining & 0xFF;
        remaining >>= 8;
    } while (remaining > 0);

    size_t i = 0;
    if (temp[length - 1] & 0x80) {
        out[i++] = 0x00;
    }
    for (size_t k = length; k > 0; k--) {
        out[i++] = temp[k - 1];
    }
    return i;
}

static size_t encode_ber_longform_integer(uint8_t *buf, uint64_t integer) {
    uint8_t temp[10];
    size_t length = 0;
    do {
        temp[length++] = integer & 0x7F;
        integer >>= 7;
    } while (integer > 0);

    for (size_t k = length; k > 0; k--) {
        *buf++ = temp[k - 1] | (k > 1 ? 0x80 : 0x00);
    }
    return length;
}

int BER_CONTAINER::serialise(uint8_t *buf, const size_t max_len) const {
    if (max_len < 2) return SNMP_BUFFER_ENCODE_ERR_LEN_EXCEEDED;
    *buf = _type;
    return 1;
}

int BER_CONTAINER::serialise(uint8_t *buf, const size_t max_len, const size_t known_length) const {
    size_t header = 1 + encode_ber_length_integer_count(known_length);
    if (max_len < known_length + header) return SNMP_BUFFER_ENCODE_ERR_LEN_EXCEEDED;

    int i = BER_CONTAINER::serialise(buf, max_len);
    CHECK_ENCODE_ERR(i);
    i += encode_ber_length_integer(buf + i, known_length);
    return i;
}

int NetworkAddress::serialise(uint8_t *buf, const size_t max_len) const {
    int i = BER_CONTAINER::serialise(buf, max_len, 4);
    CHECK_ENCODE_ERR(i);
    uint8_t *ptr = buf + i;

    memcpy(ptr, _value, 4);
    ptr += 4;

    return ptr - buf;
}

int IntegerType::serialise(uint8_t *buf, const size_t max_len) const {
    uint8_t content[8];
    size_t length = encode_ber_signed(content, _value);

    int i = BER_CONTAINER::serialise(buf, max_len, length);
    CHECK_ENCODE_ERR(i);
    memcpy(buf + i, content, length);

    return i + length;
}

int Unsigned32Type::serialise(uint8_t *buf, const size_t max_len) const {
    uint8_t content[9];
    size_t length = encode_ber_unsigned(content, _value);

    int i = BER_CONTAINER::serialise(buf, max_len, length);
    CHECK_ENCODE_ERR(i);
    memcpy(buf + i, content, length);

    return i + length;
}

int Counter64::serialise(uint8_t *buf, const size_t max_len) const {
    uint8_t content[9];
    size_t length = encode_ber_unsigned(content, _value);

    int i = BER_CONTAINER::serialise(buf, max_len, length);
    CHECK_ENCODE_ERR(i);
    memcpy(buf + i, content, length);

    return i + length;
}

int NullType::serialise(uint8_t *buf, const size_t max_len) const {
    return BER_CONTAINER::serialise(buf, max_len, 0);
}

int OctetType::serialise(uint8_t *buf, const size_t max_len) const {
    int i = BER_CONTAINER::serialise(buf, max_len, _value.length());
    CHECK_ENCODE_ERR(i);
    uint8_t *ptr = buf + i;

    memcpy(ptr, _value.data(), _value.length());
    ptr += _value.length();

    return ptr - buf;
}

int OpaqueType::serialise(uint8_t *buf, const size_t max_len) const {
    int i = BER_CONTAINER::serialise(buf, max_len, _value.size());
    CHECK_ENCODE_ERR(i);
    uint8_t *ptr = buf + i;

    if (!_value.empty()) {
        memcpy(ptr, _value.data(), _value.size());
    }
    ptr += _value.size();

    return ptr - buf;
}

int OIDType::serialise(uint8_t *buf, const size_t max_len) const {
    if (!this->valid) return SNMP_BUFFER_ENCODE_ERROR_INVALID_OID;

    // 40*X+Y can need five octets when X is 2, every later arc fits in five as well
    std::vector<uint8_t> content(5 * this->data.size());
    size_t length = encode_ber_longform_integer(content.data(), (uint64_t)this->data[0] * 40 + this->data[1]);
    for (size_t k = 2; k < this->data.size(); k++) {
        length += encode_ber_longform_integer(content.data() + length, this->data[k]);
    }

    int i = BER_CONTAINER::serialise(buf, max_len, length);
    CHECK_ENCODE_ERR(i);
    memcpy(buf + i, content.data(), length);

    return i + length;
}

static bool parse_oid_component(const std::string &item, uint32_t *out) {
    if (item.empty() || item.length() > 10) return false;

    uint64_t value = 0;
    for (char c : item) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    if (value > UINT32_MAX) return false;

    *out = (uint32_t) value;
    return true;
}

bool OIDType::generateInternalData(const std::string &value) {
    this->data.clear();

    size_t start = 0;
    if (!value.empty() && value[0] == '.') start = 1;
    if (start >= value.length()) return false;

    while (true) {
        size_t end = value.find('.', start);
        std::string item = value.substr(start, end == std::string::npos ? std::string::npos : end - start);

        uint32_t component;
        if (!parse_oid_component(item, &component)) {
            // Covers empty items too, so '..' and a trailing dot are invalid
            this->data.clear();
            return false;
        }
        this->data.push_back(component);

        if (end == std::string::npos) break;
        start = end + 1;
    }

    return this->checkComponents();
}

bool OIDType::checkComponents() const {
    if (this->data.size() < 2) return false;
    if (this->data[0] > 2) return false;
    if (this->data[0] < 2 && this->data[1] >= 40) return false;
    return true;
}

static inline void shift_arr_right(uint8_t *ptr, const int num_length_bytes, const size_t length) {
    memmove(ptr + num_length_bytes, ptr, length);
}

int ComplexType::serialise(uint8_t *buf, const size_t max_len) const {
    int i = BER_CONTAINER::serialise(buf, max_len);
    CHECK_ENCODE_ERR(i);

    uint8_t *ptr = buf + i;
    uint8_t *len_ptr = ptr++;

    uint8_t *internalPtr = ptr;// This is V*

    // Type byte and a single length byte are already reserved
    size_t available = max_len - 2;
    size_t internalLength = 0;

    for (const auto &item : values) {
        if (!item) return SNMP_BUFFER_ENCODE_ERROR_INVALID_ITEM;
        int length = item->serialise(internalPtr, available - internalLength);
        if (length < 0) {
            SNMP_LOGD("Item failed to serialiseInto: %d, reason: %d\n", item->_type, length);
            CHECK_ENCODE_ERR(length);
        }
        internalPtr += length;
        internalLength += length;
    }

    size_t num_length_bytes = encode_ber_length_integer_count(internalLength);
    if (max_len < (size_t) i + internalLength + num_length_bytes) return SNMP_BUFFER_ENCODE_ERR_LEN_EXCEEDED;
    if (num_length_bytes > 1) {
        shift_arr_right(ptr, num_length_bytes - 1, internalLength);
    }

    // then write the length value
    i += encode_ber_length_integer(len_ptr, internalLength);
    return internalLength + i;
}
