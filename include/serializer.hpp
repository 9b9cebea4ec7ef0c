#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace sessiondb {

/**
 * Turns a session value into the opaque blob stored in the data column and
 * back. deserialize(serialize(v)) == v for every value the codec can encode.
 *
 * Encoding failures raise SerializationException(SERIALIZATION_ERROR),
 * decoding failures SerializationException(DESERIALIZATION_ERROR).
 */
class Serializer {
public:
  virtual ~Serializer() = default;

  virtual std::string serialize(const nlohmann::json &value) const = 0;
  virtual nlohmann::json deserialize(const std::string &blob) const = 0;

  virtual std::string name() const = 0;
  // False when every encoded blob is valid UTF-8 text
  virtual bool isBinary() const = 0;
};

class JsonSerializer : public Serializer {
public:
  // indent < 0 produces the compact form
  explicit JsonSerializer(int indent = -1, bool ensureAscii = false);

  std::string serialize(const nlohmann::json &value) const override;
  nlohmann::json deserialize(const std::string &blob) const override;
  std::string name() const override { return "JSON"; }
  bool isBinary() const override { return false; }

private:
  int indent_;
  bool ensureAscii_;
};

class CborSerializer : public Serializer {
public:
  std::string serialize(const nlohmann::json &value) const override;
  nlohmann::json deserialize(const std::string &blob) const override;
  std::string name() const override { return "CBOR"; }
  bool isBinary() const override { return true; }
};

class MessagePackSerializer : public Serializer {
public:
  std::string serialize(const nlohmann::json &value) const override;
  nlohmann::json deserialize(const std::string &blob) const override;
  std::string name() const override { return "MessagePack"; }
  bool isBinary() const override { return true; }
};

// BSON documents must be objects at the top level
class BsonSerializer : public Serializer {
public:
  std::string serialize(const nlohmann::json &value) const override;
  nlohmann::json deserialize(const std::string &blob) const override;
  std::string name() const override { return "BSON"; }
  bool isBinary() const override { return true; }
};

class UbjsonSerializer : public Serializer {
public:
  explicit UbjsonSerializer(bool useSize = false, bool useType = false);

  std::string serialize(const nlohmann::json &value) const override;
  nlohmann::json deserialize(const std::string &blob) const override;
  std::string name() const override { return "UBJSON"; }
  bool isBinary() const override { return true; }

private:
  bool useSize_;
  bool useType_;
};

// A codec name plus codec-specific options
struct SerializerConfig {
  std::string name = "JSON";
  nlohmann::json options = nlohmann::json::object();
};

using SerializerOption =
    std::variant<std::string, SerializerConfig, std::shared_ptr<Serializer>>;

class SerializerFactory {
public:
  // Names are matched case-insensitively
  static std::shared_ptr<Serializer> create(const SerializerOption &option);
  static std::shared_ptr<Serializer> create(const SerializerConfig &config);

  static std::vector<std::string> availableCodecs();
};

} // namespace sessiondb
