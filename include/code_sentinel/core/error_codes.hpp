#pragma once

namespace code_sentinel {
namespace core {

// The hundreds digit selects the family.
enum class CoreErrorCode {
    CONFIG_EMPTY_CATALOG = 100,
    CONFIG_NO_ANALYZERS = 101,
    CONFIG_UNKNOWN_ANALYZER = 102,
    CONFIG_INVALID_VALUE = 103,

    ANALYZER_EXECUTION_FAILED = 200,
    ANALYZER_MALFORMED_INPUT = 201,
    ANALYZER_DEEP_TIER_FAILED = 202,

    TASK_TIMEOUT = 300,
    TASK_CANCELLED = 301,

    FINDING_MALFORMED = 400,

    CATALOG_NOT_FOUND = 500,
    CATALOG_PARSE_FAILED = 501,
    CATALOG_READ_FAILED = 502
};

enum class ErrorFamily {
    CONFIGURATION,
    ANALYZER,
    TASK,
    AGGREGATION,
    CATALOG,
    UNKNOWN
};

class CoreErrorCodeHelper {
public:
    static const char* toString(CoreErrorCode code);
    static const char* getMessage(CoreErrorCode code);
    static ErrorFamily family(CoreErrorCode code);
};

const char* to_string(ErrorFamily family);

}}
