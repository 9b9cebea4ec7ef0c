#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace sessiondb {

// Error codes organized by category
enum class ErrorCode {
    // Validation errors (1000-1999)
    INVALID_INPUT = 1000,
    MISSING_FIELD = 1001,

    // Configuration errors (2000-2999)
    CONFIGURATION_ERROR = 2000,

    // Database errors (3000-3999)
    DATABASE_ERROR = 3000,
    CONNECTION_FAILED = 3001,
    CONSTRAINT_VIOLATION = 3002,

    // Codec errors (4000-4999)
    SERIALIZATION_ERROR = 4000,
    DESERIALIZATION_ERROR = 4001
};

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

const char* getErrorCodeDescription(ErrorCode code);

// Base exception class with error context and correlation ID support
class SessionDbException : public std::exception {
public:
    SessionDbException(ErrorCode code, std::string message, ErrorContext context = {});

    SessionDbException(const SessionDbException& other) = default;
    SessionDbException& operator=(const SessionDbException& other) = default;
    SessionDbException(SessionDbException&& other) noexcept = default;
    SessionDbException& operator=(SessionDbException&& other) noexcept = default;

    virtual ~SessionDbException() = default;

    ErrorCode getCode() const { return errorCode_; }
    const std::string& getMessage() const { return message_; }
    const ErrorContext& getContext() const { return context_; }
    const std::string& getCorrelationId() const { return correlationId_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    const char* what() const noexcept override { return message_.c_str(); }

    // Serialization for logging
    virtual std::string toLogString() const;
    std::string toJsonString() const;

    void addContext(const std::string& key, const std::string& value);
    void setCorrelationId(const std::string& correlationId);

protected:
    ErrorCode errorCode_;
    std::string message_;
    ErrorContext context_;
    std::string correlationId_;
    std::chrono::system_clock::time_point timestamp_;

    static std::string generateCorrelationId();
};

// Invalid arguments passed to a store operation or layout
class ValidationException : public SessionDbException {
public:
    ValidationException(ErrorCode code, std::string message,
                        std::string field = "", std::string value = "",
                        ErrorContext context = {});

    const std::string& getField() const { return field_; }
    const std::string& getValue() const { return value_; }

    std::string toLogString() const override;

private:
    std::string field_;
    std::string value_;
};

// Configuration loading or resolution errors
class ConfigException : public SessionDbException {
public:
    ConfigException(ErrorCode code, std::string message,
                    std::string configKey = "",
                    ErrorContext context = {});

    const std::string& getConfigKey() const { return configKey_; }

    std::string toLogString() const override;

private:
    std::string configKey_;
};

// Failures reported by a database driver
class DatabaseException : public SessionDbException {
public:
    DatabaseException(ErrorCode code, std::string message,
                      std::string driver = "", std::string query = "",
                      ErrorContext context = {});

    const std::string& getDriver() const { return driver_; }
    const std::string& getQuery() const { return query_; }

    std::string toLogString() const override;

private:
    std::string driver_;
    std::string query_;
};

// Encoding or decoding failures of a codec
class SerializationException : public SessionDbException {
public:
    SerializationException(ErrorCode code, std::string message,
                           std::string codec = "",
                           ErrorContext context = {});

    const std::string& getCodec() const { return codec_; }

    std::string toLogString() const override;

private:
    std::string codec_;
};

bool isValidationError(const std::exception& ex);
bool isDatabaseError(const std::exception& ex);
bool isSerializationError(const std::exception& ex);

template<typename ExceptionType>
const ExceptionType* asException(const std::exception& ex) {
    return dynamic_cast<const ExceptionType*>(&ex);
}

} // namespace sessiondb
