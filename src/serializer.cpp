#include "serializer.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace sessiondb {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string toBlob(const std::vector<std::uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

[[noreturn]] void encodeFailed(const std::string &codec,
                               const nlohmann::json::exception &e) {
  CODEC_LOG_DEBUG("{} encode failed: {}", codec, e.what());
  SerializationException error(ErrorCode::SERIALIZATION_ERROR,
                               codec + " encode failed: " + e.what(), codec);
  error.addContext("codec_error_id", std::to_string(e.id));
  throw error;
}

[[noreturn]] void decodeFailed(const std::string &codec,
                               const nlohmann::json::exception &e) {
  CODEC_LOG_DEBUG("{} decode failed: {}", codec, e.what());
  SerializationException error(ErrorCode::DESERIALIZATION_ERROR,
                               codec + " decode failed: " + e.what(), codec);
  error.addContext("codec_error_id", std::to_string(e.id));
  throw error;
}

void requireKnownOptions(const SerializerConfig &config,
                         const std::vector<std::string> &known) {
  if (!config.options.is_object()) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Serializer options for " + config.name +
                              " must be an object",
                          "store.serializer");
  }
  for (const auto &item : config.options.items()) {
    if (std::find(known.begin(), known.end(), item.key()) == known.end()) {
      throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                            "Unknown option '" + item.key() +
                                "' for serializer " + config.name,
                            "store.serializer." + item.key());
    }
  }
}

template <typename T>
T optionValue(const SerializerConfig &config, const std::string &key,
              T fallback) {
  auto it = config.options.find(key);
  if (it == config.options.end()) {
    return fallback;
  }
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception &) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Invalid value for serializer option '" + key + "'",
                          "store.serializer." + key);
  }
}

} // namespace

// JSON

JsonSerializer::JsonSerializer(int indent, bool ensureAscii)
    : indent_(indent), ensureAscii_(ensureAscii) {}

std::string JsonSerializer::serialize(const nlohmann::json &value) const {
  try {
    // Strict error handler: invalid UTF-8 is an encode failure
    return value.dump(indent_, ' ', ensureAscii_,
                      nlohmann::json::error_handler_t::strict);
  } catch (const nlohmann::json::exception &e) {
    encodeFailed(name(), e);
  }
}

nlohmann::json JsonSerializer::deserialize(const std::string &blob) const {
  try {
    return nlohmann::json::parse(blob);
  } catch (const nlohmann::json::exception &e) {
    decodeFailed(name(), e);
  }
}

// CBOR

std::string CborSerializer::serialize(const nlohmann::json &value) const {
  try {
    return toBlob(nlohmann::json::to_cbor(value));
  } catch (const nlohmann::json::exception &e) {
    encodeFailed(name(), e);
  }
}

nlohmann::json CborSerializer::deserialize(const std::string &blob) const {
  try {
    return nlohmann::json::from_cbor(blob);
  } catch (const nlohmann::json::exception &e) {
    decodeFailed(name(), e);
  }
}

// MessagePack

std::string
MessagePackSerializer::serialize(const nlohmann::json &value) const {
  try {
    return toBlob(nlohmann::json::to_msgpack(value));
  } catch (const nlohmann::json::exception &e) {
    encodeFailed(name(), e);
  }
}

nlohmann::json
MessagePackSerializer::deserialize(const std::string &blob) const {
  try {
    return nlohmann::json::from_msgpack(blob);
  } catch (const nlohmann::json::exception &e) {
    decodeFailed(name(), e);
  }
}

// BSON

std::string BsonSerializer::serialize(const nlohmann::json &value) const {
  try {
    return toBlob(nlohmann::json::to_bson(value));
  } catch (const nlohmann::json::exception &e) {
    encodeFailed(name(), e);
  }
}

nlohmann::json BsonSerializer::deserialize(const std::string &blob) const {
  try {
    return nlohmann::json::from_bson(blob);
  } catch (const nlohmann::json::exception &e) {
    decodeFailed(name(), e);
  }
}

// UBJSON

UbjsonSerializer::UbjsonSerializer(bool useSize, bool useType)
    : useSize_(useSize), useType_(useType) {}

std::string UbjsonSerializer::serialize(const nlohmann::json &value) const {
  try {
    return toBlob(nlohmann::json::to_ubjson(value, useSize_, useType_));
  } catch (const nlohmann::json::exception &e) {
    encodeFailed(name(), e);
  }
}

nlohmann::json UbjsonSerializer::deserialize(const std::string &blob) const {
  try {
    return nlohmann::json::from_ubjson(blob);
  } catch (const nlohmann::json::exception &e) {
    decodeFailed(name(), e);
  }
}

// Factory

std::shared_ptr<Serializer>
SerializerFactory::create(const SerializerOption &option) {
  if (const auto *name = std::get_if<std::string>(&option)) {
    SerializerConfig config;
    config.name = *name;
    return create(config);
  }
  if (const auto *config = std::get_if<SerializerConfig>(&option)) {
    return create(*config);
  }

  auto instance = std::get<std::shared_ptr<Serializer>>(option);
  if (!instance) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Serializer instance must not be null",
                              "serializer");
  }
  CODEC_LOG_DEBUG("Using caller-supplied serializer {}", instance->name());
  return instance;
}

std::shared_ptr<Serializer>
SerializerFactory::create(const SerializerConfig &config) {
  const std::string codec = toLower(config.name);
  std::shared_ptr<Serializer> serializer;

  if (codec == "json") {
    requireKnownOptions(config, {"indent", "ensure_ascii"});
    serializer = std::make_shared<JsonSerializer>(
        optionValue<int>(config, "indent", -1),
        optionValue<bool>(config, "ensure_ascii", false));
  } else if (codec == "cbor") {
    requireKnownOptions(config, {});
    serializer = std::make_shared<CborSerializer>();
  } else if (codec == "messagepack" || codec == "msgpack") {
    requireKnownOptions(config, {});
    serializer = std::make_shared<MessagePackSerializer>();
  } else if (codec == "bson") {
    requireKnownOptions(config, {});
    serializer = std::make_shared<BsonSerializer>();
  } else if (codec == "ubjson") {
    requireKnownOptions(config, {"use_size", "use_type"});
    serializer = std::make_shared<UbjsonSerializer>(
        optionValue<bool>(config, "use_size", false),
        optionValue<bool>(config, "use_type", false));
  } else {
    CODEC_LOG_ERROR("Unknown serializer: {}", config.name);
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Unknown serializer: " + config.name,
                          "store.serializer");
  }

  CODEC_LOG_DEBUG("Created {} serializer", serializer->name());
  return serializer;
}

std::vector<std::string> SerializerFactory::availableCodecs() {
  return {"JSON", "CBOR", "MessagePack", "BSON", "UBJSON"};
}

} // namespace sessiondb
