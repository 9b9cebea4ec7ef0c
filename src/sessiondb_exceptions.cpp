#include "sessiondb_exceptions.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace sessiondb {

const char* getErrorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::MISSING_FIELD: return "Missing required field";
        case ErrorCode::CONFIGURATION_ERROR: return "Configuration error";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::CONNECTION_FAILED: return "Database connection failed";
        case ErrorCode::CONSTRAINT_VIOLATION: return "Database constraint violation";
        case ErrorCode::SERIALIZATION_ERROR: return "Value could not be serialized";
        case ErrorCode::DESERIALIZATION_ERROR: return "Stored data could not be deserialized";
    }
    return "Unknown error";
}

std::string SessionDbException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

SessionDbException::SessionDbException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string SessionDbException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        // Sorted so log lines are stable
        std::map<std::string, std::string> ordered(context_.begin(), context_.end());
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : ordered) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

std::string SessionDbException::toJsonString() const {
    nlohmann::json doc = {
        {"correlationId", correlationId_},
        {"errorCode", static_cast<int>(errorCode_)},
        {"message", message_},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp_.time_since_epoch()).count()}
    };

    if (!context_.empty()) {
        doc["context"] = nlohmann::json(context_);
    }

    // Driver messages are not guaranteed to be valid UTF-8
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void SessionDbException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void SessionDbException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

// ValidationException implementation
ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : SessionDbException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {

    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << SessionDbException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

// ConfigException implementation
ConfigException::ConfigException(ErrorCode code, std::string message,
                                 std::string configKey, ErrorContext context)
    : SessionDbException(code, std::move(message), std::move(context)),
      configKey_(std::move(configKey)) {

    if (!configKey_.empty()) {
        addContext("config_key", configKey_);
    }
}

std::string ConfigException::toLogString() const {
    std::stringstream ss;
    ss << "[CONFIG] " << SessionDbException::toLogString();
    if (!configKey_.empty()) {
        ss << " Key=\"" << configKey_ << "\"";
    }
    return ss.str();
}

// DatabaseException implementation
DatabaseException::DatabaseException(ErrorCode code, std::string message,
                                     std::string driver, std::string query,
                                     ErrorContext context)
    : SessionDbException(code, std::move(message), std::move(context)),
      driver_(std::move(driver)), query_(std::move(query)) {

    if (!driver_.empty()) {
        addContext("driver", driver_);
    }
}

std::string DatabaseException::toLogString() const {
    std::stringstream ss;
    ss << "[DATABASE] " << SessionDbException::toLogString();
    if (!query_.empty()) {
        ss << " Query=\"" << query_ << "\"";
    }
    return ss.str();
}

// SerializationException implementation
SerializationException::SerializationException(ErrorCode code, std::string message,
                                               std::string codec, ErrorContext context)
    : SessionDbException(code, std::move(message), std::move(context)),
      codec_(std::move(codec)) {

    if (!codec_.empty()) {
        addContext("codec", codec_);
    }
}

std::string SerializationException::toLogString() const {
    std::stringstream ss;
    ss << "[CODEC] " << SessionDbException::toLogString();
    return ss.str();
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isDatabaseError(const std::exception& ex) {
    return dynamic_cast<const DatabaseException*>(&ex) != nullptr;
}

bool isSerializationError(const std::exception& ex) {
    return dynamic_cast<const SerializationException*>(&ex) != nullptr;
}

} // namespace sessiondb
