#ifndef BER_h
#define BER_h

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "include/defs.h"

typedef enum ASN_TYPE_WITH_VALUE {
    // Primatives
    INTEGER = 0x02,
    STRING = 0x04,
    NULLTYPE = 0x05,
    OID = 0x06,

    // Complex
    STRUCTURE = 0x30,
    NETWORK_ADDRESS = 0x40,
    COUNTER32 = 0x41,
    GAUGE32 = 0x42,
    USIGNED32 = 0x42, // Same as Gauge32
    TIMESTAMP = 0x43,
    OPAQUE = 0x44,
    COUNTER64 = 0x46,

    /*
        FROM: RFC3416
    */
    NOSUCHOBJECT = 0x80,
    NOSUCHINSTANCE = 0x81,
    ENDOFMIBVIEW = 0x82,

    // Structure Types
    GetRequestPDU = 0xA0,
    GetNextRequestPDU = 0xA1,
    GetResponsePDU = 0xA2,
    SetRequestPDU = 0xA3,
    TrapPDU = 0xA4,
    GetBulkRequestPDU = 0xA5,
    InformRequestPDU = 0xA6,
    Trapv2PDU = 0xA7

} ASN_TYPE;

#define ASN_PDU_TYPE_MIN_VALUE GetRequestPDU
#define ASN_PDU_TYPE_MAX_VALUE Trapv2PDU

typedef int SNMP_BUFFER_PARSE_ERROR;
typedef int SNMP_BUFFER_ENCODE_ERROR;

#define SNMP_BUFFER_ERROR_MAX_LEN_EXCEEDED (-1 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_TLV_TOO_SMALL (-2 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_PROBLEM_DESERIALISING (-3 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_UNKNOWN_TYPE (-4 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_TYPE_MISMATCH (-5 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_OCTET_TOO_BIG (-6 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_INVALID_OID (-7 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_INVALID_LENGTH (-8 + SNMP_BUFFER_PARSE_ERROR_OFFSET)
#define SNMP_BUFFER_ERROR_INTEGER_OUT_OF_RANGE (-9 + SNMP_BUFFER_PARSE_ERROR_OFFSET)

#define SNMP_BUFFER_ENCODE_ERR_LEN_EXCEEDED (-1 + SNMP_BUFFER_ENCODE_ERROR_OFFSET)
#define SNMP_BUFFER_ENCODE_ERROR_INVALID_ITEM (-2 + SNMP_BUFFER_ENCODE_ERROR_OFFSET)
#define SNMP_BUFFER_ENCODE_ERROR_INVALID_OID (-7 + SNMP_BUFFER_ENCODE_ERROR_OFFSET)

#define CHECK_DECODE_ERR(i) if((i) < 0) return i
#define CHECK_ENCODE_ERR(i) if((i) < 0) return i

// primitive types inherit straight off the container, complex come off ComplexType.
// all types serialise themselves (type, length, data) straight into the packet buffer.
// for deserialising, the parent container checks the type, creates an object of that type and calls fromBuffer,
// complex types split their data into children the same way.

class BER_CONTAINER {
  public:
    explicit BER_CONTAINER(ASN_TYPE type) : _type(type){};
    virtual ~BER_CONTAINER() = default;

    ASN_TYPE _type;
    int _length = 0;

    // Same ASN type and same value
    virtual bool equals(const BER_CONTAINER* other) const {
        return other && other->_type == this->_type;
    }

  protected:
    // Serialise object in BER notation into buf, with a maximum size of max_len; returns number of bytes used
    virtual int serialise(uint8_t* buf, size_t max_len) const;
    // Writes the type and length header for a value of known_length, returns header size
    int serialise(uint8_t* buf, size_t max_len, size_t known_length) const;

    // returns number of bytes used from buf, limited by max_len, negative if failed to parse
    virtual int fromBuffer(const uint8_t *buf, size_t max_len);

    friend class ComplexType;
};

class NetworkAddress: public BER_CONTAINER {
  public:
    NetworkAddress(): BER_CONTAINER(NETWORK_ADDRESS) {};
    NetworkAddress(uint8_t first, uint8_t second, uint8_t third, uint8_t fourth): NetworkAddress(){
        _value[0] = first;
        _value[1] = second;
        _value[2] = third;
        _value[3] = fourth;
    };

    uint8_t _value[4] = {0, 0, 0, 0};

    std::string string() const;
    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;
};

class IntegerType: public BER_CONTAINER {
  public:
    IntegerType(): BER_CONTAINER(INTEGER) {};
    explicit IntegerType(int32_t value): IntegerType(){
        _value = value;
    };

    int32_t _value = 0;

    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;
};

// Counter32, Gauge32 and TimeTicks are non-negative 32bit INTEGERs with an application tag
class Unsigned32Type: public BER_CONTAINER {
  public:
    Unsigned32Type(): BER_CONTAINER(USIGNED32) {};
    explicit Unsigned32Type(uint32_t value): Unsigned32Type(){
        _value = value;
    };

    uint32_t _value = 0;

    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;
};

class TimestampType: public Unsigned32Type {
  public:
    TimestampType(): Unsigned32Type(){
        _type = TIMESTAMP;
    };
    explicit TimestampType(uint32_t value): Unsigned32Type(value){
        _type = TIMESTAMP;
    };
};

class Counter32: public Unsigned32Type {
  public:
    Counter32(): Unsigned32Type(){
        _type = COUNTER32;
    };
    explicit Counter32(uint32_t value): Unsigned32Type(value){
        _type = COUNTER32;
    };
};

class Gauge: public Unsigned32Type {
  public:
    Gauge(): Unsigned32Type(){
        _type = GAUGE32;
    };
    explicit Gauge(uint32_t value): Unsigned32Type(value){
        _type = GAUGE32;
    };
};

class OctetType: public BER_CONTAINER {
  public:
    explicit OctetType(const std::string& value): BER_CONTAINER(STRING), _value(value){};

    std::string _value;

    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;

    OctetType(): BER_CONTAINER(STRING) {};
    friend class ComplexType; // So ComplexType can use the empty constructor
};

class OpaqueType: public BER_CONTAINER {
  public:
    OpaqueType(const uint8_t* value, size_t length): BER_CONTAINER(OPAQUE), _value(value, value + length){};
    explicit OpaqueType(const std::vector<uint8_t>& value): BER_CONTAINER(OPAQUE), _value(value){};

    std::vector<uint8_t> _value;

    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;

    OpaqueType(): BER_CONTAINER(OPAQUE) {};
    friend class ComplexType; // So ComplexType can use the empty constructor
};

class OIDType: public BER_CONTAINER {
  public:
    // Dotted decimal, with or without the leading dot
    explicit OIDType(const std::string& value): BER_CONTAINER(OID) {
        this->valid = this->generateInternalData(value);
    };

    explicit OIDType(const std::vector<uint32_t>& components): BER_CONTAINER(OID), data(components) {
        this->valid = this->checkComponents();
    };

    std::shared_ptr<OIDType> cloneOID() const {
        return std::make_shared<OIDType>(this->data);
    };

    // Always rendered with a leading dot, eg: .1.3.6.1.2.1.1.3.0
    std::string string() const;
    bool valid = false;

    const std::vector<uint32_t>& components() const {
        return this->data;
    }

    // Lexicographic over components, a prefix sorts before anything it prefixes
    int compare(const OIDType& other) const;

    bool equals(const OIDType* oid) const {
        return oid && this->data == oid->data;
    }

    bool equals(const BER_CONTAINER* other) const override;

    bool operator<(const OIDType& other) const {
        return this->compare(other) < 0;
    }

    bool operator==(const OIDType& other) const {
        return this->data == other.data;
    }

  protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;

    friend class ComplexType; // So ComplexType gets the empty constructor
    OIDType(): BER_CONTAINER(OID) {};

    std::vector<uint32_t> data;

  private:
    bool generateInternalData(const std::string& value);
    bool checkComponents() const;
};

class NullType: public BER_CONTAINER {
  public:
    NullType(): BER_CONTAINER(NULLTYPE) {};

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;
};

// noSuchObject, noSuchInstance and endOfMibView carry no data
class ImplicitNullType: public NullType {
  public:
    explicit ImplicitNullType(ASN_TYPE type): NullType(){
        _type = type;
    };
};

class Counter64: public BER_CONTAINER {
  public:
    Counter64(): BER_CONTAINER(COUNTER64) {};
    explicit Counter64(uint64_t value): Counter64(){
        _value = value;
    };

    uint64_t _value = 0;

    bool equals(const BER_CONTAINER* other) const override;

protected:
    int serialise(uint8_t* buf, size_t max_len) const override;
    int fromBuffer(const uint8_t *buf, size_t max_len) override;
};

class ComplexType: public BER_CONTAINER {
  public:
    explicit ComplexType(ASN_TYPE type): BER_CONTAINER(type) {};

    std::vector<std::shared_ptr<BER_CONTAINER>> values;

    int fromBuffer(const uint8_t *buf, size_t max_len) override;
    int serialise(uint8_t* buf, size_t max_len) const override;

    bool equals(const BER_CONTAINER* other) const override;

    std::shared_ptr<BER_CONTAINER> addValueToList(const std::shared_ptr<BER_CONTAINER>& newObj){
        this->values.push_back(newObj);
        return newObj;
    }

  private:
    static std::shared_ptr<BER_CONTAINER> createObjectForType(ASN_TYPE valueType);
};

#endif
