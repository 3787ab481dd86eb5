#include "code_sentinel/core/error_codes.hpp"

namespace code_sentinel {
namespace core {

namespace {

struct CodeEntry {
    CoreErrorCode code;
    const char* name;
    const char* message;
};

constexpr CodeEntry CODE_TABLE[] = {
    {CoreErrorCode::CONFIG_EMPTY_CATALOG, "CONFIG_EMPTY_CATALOG", "File catalog is empty"},
    {CoreErrorCode::CONFIG_NO_ANALYZERS, "CONFIG_NO_ANALYZERS", "No analyzers enabled"},
    {CoreErrorCode::CONFIG_UNKNOWN_ANALYZER, "CONFIG_UNKNOWN_ANALYZER", "Unknown analyzer id"},
    {CoreErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE", "Invalid configuration value"},
    {CoreErrorCode::ANALYZER_EXECUTION_FAILED, "ANALYZER_EXECUTION_FAILED", "Analyzer failed while processing file"},
    {CoreErrorCode::ANALYZER_MALFORMED_INPUT, "ANALYZER_MALFORMED_INPUT", "Analyzer rejected malformed input"},
    {CoreErrorCode::ANALYZER_DEEP_TIER_FAILED, "ANALYZER_DEEP_TIER_FAILED", "Deep inspection failed"},
    {CoreErrorCode::TASK_TIMEOUT, "TASK_TIMEOUT", "Task exceeded its time allowance"},
    {CoreErrorCode::TASK_CANCELLED, "TASK_CANCELLED", "Task abandoned after cancellation"},
    {CoreErrorCode::FINDING_MALFORMED, "FINDING_MALFORMED", "Finding is missing a required field"},
    {CoreErrorCode::CATALOG_NOT_FOUND, "CATALOG_NOT_FOUND", "Catalog source not found"},
    {CoreErrorCode::CATALOG_PARSE_FAILED, "CATALOG_PARSE_FAILED", "Catalog could not be parsed"},
    {CoreErrorCode::CATALOG_READ_FAILED, "CATALOG_READ_FAILED", "Catalog entry could not be read"}
};

const CodeEntry* findEntry(CoreErrorCode code) {
    for (const auto& entry : CODE_TABLE) {
        if (entry.code == code) {
            return &entry;
        }
    }
    return nullptr;
}

}

const char* CoreErrorCodeHelper::toString(CoreErrorCode code) {
    const auto* entry = findEntry(code);
    return entry ? entry->name : "UNKNOWN";
}

const char* CoreErrorCodeHelper::getMessage(CoreErrorCode code) {
    const auto* entry = findEntry(code);
    return entry ? entry->message : "Unknown error";
}

ErrorFamily CoreErrorCodeHelper::family(CoreErrorCode code) {
    switch (static_cast<int>(code) / 100) {
        case 1: return ErrorFamily::CONFIGURATION;
        case 2: return ErrorFamily::ANALYZER;
        case 3: return ErrorFamily::TASK;
        case 4: return ErrorFamily::AGGREGATION;
        case 5: return ErrorFamily::CATALOG;
        default: return ErrorFamily::UNKNOWN;
    }
}

const char* to_string(ErrorFamily family) {
    switch (family) {
        case ErrorFamily::CONFIGURATION: return "configuration";
        case ErrorFamily::ANALYZER: return "analyzer";
        case ErrorFamily::TASK: return "task";
        case ErrorFamily::AGGREGATION: return "aggregation";
        case ErrorFamily::CATALOG: return "catalog";
        case ErrorFamily::UNKNOWN: return "unknown";
    }
    return "unknown";
}

}}
