#include <catch2/catch.hpp>

#include "include/ManagedObjects.h"
#include "include/ValueCallbacks.h"

#include <string>
#include <vector>

static ValueGetter constantGetter(int value){
    return static_integer_getter(value);
}

TEST_CASE( "Registry keeps objects sorted", "[registry]" ){
    ManagedObjectRegistry registry;
    REQUIRE( registry.empty() );

    // Deliberately out of order, with prefixes and multi digit arcs
    std::vector<std::string> oids = {
        ".1.3.6.1.4.1.5.10",
        ".1.3.6.1.4.1.5.2",
        ".1.3.6.1.2.1.1.3.0",
        ".1.3.6.1.4.1.5",
        ".1.3.6.1.4.1.5.2.1",
        ".1.3.6.1.2.1.1.1.0",
        ".1.3.6.1.4.1.52420"
    };

    int i = 0;
    for(const auto& oid : oids){
        REQUIRE( registry.registerObject(std::make_shared<OIDType>(oid), constantGetter(i++)) == SNMP_REGISTER_OK );
    }
    REQUIRE( registry.size() == oids.size() );

    std::vector<std::string> ordered;
    for(const auto& object : registry){
        ordered.push_back(object->oid->string());
    }

    std::vector<std::string> expected = {
        ".1.3.6.1.2.1.1.1.0",
        ".1.3.6.1.2.1.1.3.0",
        ".1.3.6.1.4.1.5",
        ".1.3.6.1.4.1.5.2",
        ".1.3.6.1.4.1.5.2.1",
        ".1.3.6.1.4.1.5.10",
        ".1.3.6.1.4.1.52420"
    };
    REQUIRE( ordered == expected );

    SECTION( "Exact lookup" ){
        for(const auto& oid : expected){
            auto object = registry.lookup(OIDType(oid), SNMP_LOOKUP_EXACT);
            REQUIRE( object );
            REQUIRE( object->oid->string() == oid );
        }

        REQUIRE_FALSE( registry.lookup(OIDType(".1.3.6.1.4.1.5.3"), SNMP_LOOKUP_EXACT) );
        REQUIRE_FALSE( registry.lookup(OIDType(".1.3.6.1.2.1.1.3"), SNMP_LOOKUP_EXACT) );
        REQUIRE_FALSE( registry.lookup(OIDType(".1.3.6.1.2.1.1.3.0.0"), SNMP_LOOKUP_EXACT) );
    }

    SECTION( "Next lookup is strictly greater" ){
        for(size_t k = 0; k + 1 < expected.size(); k++){
            auto object = registry.lookup(OIDType(expected[k]), SNMP_LOOKUP_NEXT);
            REQUIRE( object );
            REQUIRE( object->oid->string() == expected[k + 1] );
        }

        REQUIRE_FALSE( registry.lookup(OIDType(expected.back()), SNMP_LOOKUP_NEXT) );
        REQUIRE_FALSE( registry.lookup(OIDType(".2.0"), SNMP_LOOKUP_NEXT) );
    }

    SECTION( "Next lookup of an unregistered OID" ){
        REQUIRE( registry.lookup(OIDType(".1.3"), SNMP_LOOKUP_NEXT)->oid->string() == ".1.3.6.1.2.1.1.1.0" );
        REQUIRE( registry.lookup(OIDType(".1.3.6.1.2.1.1.3"), SNMP_LOOKUP_NEXT)->oid->string() == ".1.3.6.1.2.1.1.3.0" );
        REQUIRE( registry.lookup(OIDType(".1.3.6.1.4.1.5.3"), SNMP_LOOKUP_NEXT)->oid->string() == ".1.3.6.1.4.1.5.10" );
        REQUIRE( registry.lookup(OIDType(".1.3.6.1.4.1.5.2.1.7"), SNMP_LOOKUP_NEXT)->oid->string() == ".1.3.6.1.4.1.5.10" );
    }
}

TEST_CASE( "Registry rejects bad registrations", "[registry]" ){
    ManagedObjectRegistry registry;
    int calls = 0;
    ValueGetter first = [&calls](const OIDType&, std::shared_ptr<BER_CONTAINER>& value, std::string&) -> SNMP_ERROR_STATUS {
        calls++;
        value = std::make_shared<IntegerType>(1);
        return NO_ERROR;
    };

    REQUIRE( registry.registerObject(std::make_shared<OIDType>(".1.3.6.1.4.1.5.1"), first) == SNMP_REGISTER_OK );

    SECTION( "Duplicate OIDs leave the registry untouched" ){
        REQUIRE( registry.registerObject(std::make_shared<OIDType>("1.3.6.1.4.1.5.1"), constantGetter(2)) == SNMP_REGISTER_ALREADY_REGISTERED );
        REQUIRE( registry.size() == 1 );

        auto object = registry.lookup(OIDType(".1.3.6.1.4.1.5.1"), SNMP_LOOKUP_EXACT);
        REQUIRE( object );
        std::shared_ptr<BER_CONTAINER> value;
        std::string message;
        REQUIRE( object->getter(*object->oid, value, message) == NO_ERROR );
        REQUIRE( calls == 1 );
    }

    SECTION( "Missing getter" ){
        REQUIRE( registry.registerObject(std::make_shared<OIDType>(".1.3.6.1.4.1.5.2"), nullptr) == SNMP_REGISTER_MISSING_GETTER );
        REQUIRE( registry.size() == 1 );
    }

    SECTION( "Invalid OID" ){
        REQUIRE( registry.registerObject(std::make_shared<OIDType>(".1.3.6..1"), constantGetter(2)) == SNMP_REGISTER_INVALID_OID );
        REQUIRE( registry.registerObject(nullptr, constantGetter(2)) == SNMP_REGISTER_INVALID_OID );
        REQUIRE( registry.size() == 1 );
    }
}

TEST_CASE( "Registry owns its OIDs", "[registry]" ){
    ManagedObjectRegistry registry;
    auto oid = std::make_shared<OIDType>(".1.3.6.1.4.1.5.1");
    REQUIRE( registry.registerObject(oid, constantGetter(1)) == SNMP_REGISTER_OK );

    auto object = registry.lookup(*oid, SNMP_LOOKUP_EXACT);
    REQUIRE( object );
    REQUIRE( object->oid.get() != oid.get() );
}

TEST_CASE( "Objects without a setter are not writable", "[registry]" ){
    ManagedObjectRegistry registry;
    int target = 5;
    std::string message;
    REQUIRE( registry.registerObject(std::make_shared<OIDType>(".1.3.6.1.4.1.5.1"), integer_getter(&target)) == SNMP_REGISTER_OK );
    REQUIRE( registry.registerObject(std::make_shared<OIDType>(".1.3.6.1.4.1.5.2"), integer_getter(&target), integer_setter(&target)) == SNMP_REGISTER_OK );

    auto readOnly = registry.lookup(OIDType(".1.3.6.1.4.1.5.1"), SNMP_LOOKUP_EXACT);
    REQUIRE( readOnly->setter(*readOnly->oid, std::make_shared<IntegerType>(9), message) == NOT_WRITABLE );
    REQUIRE( message == "OID .1.3.6.1.4.1.5.1 is not writable" );
    REQUIRE( target == 5 );

    auto readWrite = registry.lookup(OIDType(".1.3.6.1.4.1.5.2"), SNMP_LOOKUP_EXACT);
    REQUIRE( readWrite->setter(*readWrite->oid, std::make_shared<IntegerType>(9), message) == NO_ERROR );
    REQUIRE( target == 9 );
}

TEST_CASE( "Typed accessor helpers", "[registry]" ){
    OIDType oid(".1.3.6.1.4.1.5.1");
    std::shared_ptr<BER_CONTAINER> value;
    std::string message;

    SECTION( "Strings" ){
        std::string name = "agent";
        auto setter = string_setter(&name, 8);

        REQUIRE( setter(oid, std::make_shared<OctetType>("new name"), message) == NO_ERROR );
        REQUIRE( name == "new name" );
        REQUIRE( message.empty() );

        REQUIRE( setter(oid, std::make_shared<OctetType>("too long name"), message) == BAD_VALUE );
        REQUIRE( message == "string longer than 8" );
        REQUIRE( setter(oid, std::make_shared<IntegerType>(1), message) == BAD_VALUE );
        REQUIRE( message == "expected type STRING" );
        REQUIRE( name == "new name" );

        REQUIRE( string_getter(&name)(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == STRING );
        REQUIRE( std::static_pointer_cast<OctetType>(value)->_value == "new name" );
    }

    SECTION( "Opaque" ){
        std::vector<uint8_t> data = {1, 2, 3};
        REQUIRE( opaque_setter(&data)(oid, std::make_shared<OpaqueType>(std::vector<uint8_t>({9, 8})), message) == NO_ERROR );
        REQUIRE( data == std::vector<uint8_t>({9, 8}) );
        REQUIRE( opaque_setter(&data)(oid, std::make_shared<OctetType>("x"), message) == BAD_VALUE );

        REQUIRE( opaque_getter(&data)(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == OPAQUE );
    }

    SECTION( "Unsigned types keep their tag" ){
        uint32_t number = 7;
        REQUIRE( counter32_getter(&number)(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == COUNTER32 );
        REQUIRE( gauge_getter(&number)(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == GAUGE32 );
        REQUIRE( timestamp_getter(&number)(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == TIMESTAMP );

        REQUIRE( timestamp_setter(&number)(oid, std::make_shared<Counter32>(3), message) == BAD_VALUE );
        REQUIRE( timestamp_setter(&number)(oid, std::make_shared<TimestampType>(3), message) == NO_ERROR );
        REQUIRE( number == 3 );
    }

    SECTION( "Unbound variables" ){
        REQUIRE( integer_getter(nullptr)(oid, value, message) == GEN_ERR );
        REQUIRE( message == "no value bound" );
    }

    SECTION( "OID values" ){
        REQUIRE( oid_getter(".1.3.6.1.4.1.52420")(oid, value, message) == NO_ERROR );
        REQUIRE( value->_type == OID );
        REQUIRE( std::static_pointer_cast<OIDType>(value)->string() == ".1.3.6.1.4.1.52420" );

        std::shared_ptr<BER_CONTAINER> invalid;
        REQUIRE( oid_getter(".1.3.")(oid, invalid, message) == NO_ERROR );
        REQUIRE_FALSE( invalid );
    }
}
