#ifndef SNMP_DEFS_h
#define SNMP_DEFS_h

#include <stdint.h>
#include <stdio.h>

#ifndef SNMP_DEBUG
    #define SNMP_DEBUG      0       /* 0  or  1  or  2 */
#endif

// Negative values mean the datagram is dropped and nothing is sent back
typedef enum SNMP_ERROR_RESPONSE {
    SNMP_REQUEST_UNSUPPORTED_PDU = -7,
    SNMP_REQUEST_INVALID_VERSION = -6,
    SNMP_REQUEST_TOO_LARGE = -5,
    SNMP_REQUEST_INVALID = -4,
    SNMP_REQUEST_INVALID_COMMUNITY = -3,
    SNMP_FAILED_SERIALISATION = -2,
    SNMP_GENERIC_ERROR = -1,
    SNMP_NO_PACKET = 0,
    SNMP_NO_ERROR = 1,
    SNMP_GET_OCCURRED = 2,
    SNMP_GETNEXT_OCCURRED = 3,
    SNMP_SET_OCCURRED = 4,
    SNMP_ERROR_PACKET_SENT = 5 // A packet indicating that an error occurred was sent
} SNMP_ERROR_RESPONSE;

typedef int32_t snmp_request_id_t;

typedef enum SnmpVersionEnum {
    SNMP_VERSION_1 = 0,
    SNMP_VERSION_2C = 1
} SNMP_VERSION;

typedef enum {
     SNMP_PERM_NONE,
     SNMP_PERM_READ_ONLY,
     SNMP_PERM_READ_WRITE
} SNMP_PERMISSION;

typedef enum SNMP_REGISTER_RESULT {
    SNMP_REGISTER_MISSING_GETTER = -3,
    SNMP_REGISTER_INVALID_OID = -2,
    SNMP_REGISTER_ALREADY_REGISTERED = -1,
    SNMP_REGISTER_OK = 1
} SNMP_REGISTER_RESULT;

#define MAX_SNMP_PACKET_LENGTH 1400
#define OCTET_TYPE_MAX_LENGTH 500

#define SNMP_ERROR_OK 1

#define SNMP_PACKET_PARSE_ERROR_OFFSET -20
#define SNMP_BUFFER_PARSE_ERROR_OFFSET -10
#define SNMP_BUFFER_ENCODE_ERROR_OFFSET -30

// Wire values, do not renumber
typedef enum ERROR_STATUS_WITH_VALUE {
    // V1 Errors
    NO_ERROR = 0,
    TOO_BIG = 1,
    NO_SUCH_NAME = 2,
    BAD_VALUE = 3,
    READ_ONLY = 4,
    GEN_ERR = 5,

    // V2c Errors
    NO_ACCESS = 6,
    WRONG_TYPE = 7,
    WRONG_LENGTH = 8,
    WRONG_ENCODING = 9,
    WRONG_VALUE = 10,
    NO_CREATION = 11,
    INCONSISTENT_VALUE = 12,
    RESOURCE_UNAVAILABLE = 13,
    COMMIT_FAILED = 14,
    UNDO_FAILED = 15,
    AUTHORIZATION_ERROR = 16,
    NOT_WRITABLE = 17,
    INCONSISTENT_NAME = 18
} SNMP_ERROR_STATUS;

#define SNMP_MAX_ERROR_STATUS INCONSISTENT_NAME

#define SNMP_ERROR_STATUS_VALID(status) ((int)(status) >= NO_ERROR && (int)(status) <= SNMP_MAX_ERROR_STATUS)

// RFC1213 OIDs
#define RFC1213_OID_sysDescr            (".1.3.6.1.2.1.1.1.0")
#define RFC1213_OID_sysObjectID         (".1.3.6.1.2.1.1.2.0")
#define RFC1213_OID_sysUpTime           (".1.3.6.1.2.1.1.3.0")
#define RFC1213_OID_sysContact          (".1.3.6.1.2.1.1.4.0")
#define RFC1213_OID_sysName             (".1.3.6.1.2.1.1.5.0")
#define RFC1213_OID_sysLocation         (".1.3.6.1.2.1.1.6.0")
#define RFC1213_OID_sysServices         (".1.3.6.1.2.1.1.7.0")

// DEBUG
#define _LOGD(...)          printf(__VA_ARGS__)
#define _LOGI(...)          printf(__VA_ARGS__)
#define _LOGW(...)          fprintf(stderr, __VA_ARGS__)
#define _LOGE(...)          fprintf(stderr, __VA_ARGS__)

// ----
#if (SNMP_DEBUG == 1)
    #define SNMP_LOGD           _LOGD
    #define SNMP_LOGI           _LOGI
    #define SNMP_LOGW           _LOGW
    #define SNMP_LOGE           _LOGE
#elif (SNMP_DEBUG == 2)
    #define SNMP_LOGD(...)
    #define SNMP_LOGI           _LOGI
    #define SNMP_LOGW           _LOGW
    #define SNMP_LOGE           _LOGE
#else
    #define SNMP_LOGD(...)
    #define SNMP_LOGI(...)
    #define SNMP_LOGW(...)
    #define SNMP_LOGE(...)
#endif

#endif
