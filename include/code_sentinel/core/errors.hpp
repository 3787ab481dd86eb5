#pragma once

#include "error_codes.hpp"
#include <map>
#include <stdexcept>
#include <string>

namespace code_sentinel {
namespace core {

// Where an error was raised, rendered as "component=X | key=value" in logs.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;

    bool empty() const { return component.empty() && details.empty(); }

    std::string format() const {
        std::string result;
        if (!component.empty()) {
            result = "component=" + component;
        }
        for (const auto& [key, value] : details) {
            if (!result.empty()) {
                result += " | ";
            }
            result += key + "=" + value;
        }
        return result;
    }
};

class AnalysisError : public std::runtime_error {
public:
    AnalysisError(CoreErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    AnalysisError(CoreErrorCode code, const std::string& message, ErrorContext context)
        : std::runtime_error(message), code_(code), context_(std::move(context)) {}

    CoreErrorCode code() const { return code_; }
    const char* codeString() const { return CoreErrorCodeHelper::toString(code_); }
    const ErrorContext& context() const { return context_; }

private:
    CoreErrorCode code_;
    ErrorContext context_;
};

// Fatal for the whole run; raised before any task is scheduled.
class ConfigurationError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

class AnalyzerError : public AnalysisError {
public:
    explicit AnalyzerError(const std::string& message)
        : AnalysisError(CoreErrorCode::ANALYZER_EXECUTION_FAILED, message) {}

    AnalyzerError(CoreErrorCode code, const std::string& message)
        : AnalysisError(code, message) {}
};

class TaskTimeout : public AnalysisError {
public:
    explicit TaskTimeout(const std::string& message)
        : AnalysisError(CoreErrorCode::TASK_TIMEOUT, message) {}
};

class TaskCancelled : public AnalysisError {
public:
    explicit TaskCancelled(const std::string& message)
        : AnalysisError(CoreErrorCode::TASK_CANCELLED, message) {}
};

class CatalogError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

}}
