#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy and Result type shared by every buckle module
 *
 * Every fallible operation returns a Result<T>. Exceptions thrown by
 * third-party libraries (yaml-cpp, std::filesystem) are caught where they
 * occur and translated into an Error with the matching ErrorCode.
 */

#include <optional>
#include <string>
#include <utility>

namespace buckle {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    DEPENDENCY_ERROR,     // unknown or circular package reference
    CONFIGURATION_ERROR,  // malformed variable file, package.yml or disallowed extension
    TEMPLATE_ERROR,       // render-time failure
    EXECUTION_ERROR,      // non-zero exit or failed start of a required script
    PERMISSION_ERROR,     // filesystem write failure
    IO_ERROR,             // read failure or missing expected directory
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DEPENDENCY_ERROR: return "DependencyError";
        case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
        case ErrorCode::TEMPLATE_ERROR: return "TemplateError";
        case ErrorCode::EXECUTION_ERROR: return "ExecutionError";
        case ErrorCode::PERMISSION_ERROR: return "PermissionError";
        case ErrorCode::IO_ERROR: return "IOError";
        default: return "Error";
    }
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error with code, message and optional location
 *
 * The location fields are filled in by whichever layer knows them: the
 * variable parser sets path and line, the orchestrator adds the package id.
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withPath(const std::string& path) {
        path_ = path;
        return *this;
    }

    Error& withPackage(const std::string& package_id) {
        if (package_id_.empty()) package_id_ = package_id;
        return *this;
    }

    Error& withLine(int line) {
        line_ = line;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const char* kind_name() const { return error_code_to_string(code_); }
    const std::string& message() const { return message_; }
    const std::string& path() const { return path_; }
    const std::string& package_id() const { return package_id_; }
    int line() const { return line_; }

    // "<Kind>: <message> (package 'id', path:line)"
    std::string toString() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string path_;
    std::string package_id_;
    int line_ = 0;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace buckle
