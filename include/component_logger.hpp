#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace sessiondb {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class SqlStore> {
  static constexpr const char *name = "SqlStore";
};

template <> struct ComponentTrait<class PostgresDatabase> {
  static constexpr const char *name = "PostgresDatabase";
};

template <> struct ComponentTrait<class SqliteDatabase> {
  static constexpr const char *name = "SqliteDatabase";
};

template <> struct ComponentTrait<class SerializerFactory> {
  static constexpr const char *name = "SerializerFactory";
};

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class CommandLine> {
  static constexpr const char *name = "CommandLine";
};

/**
 * ComponentLogger - compile-time component tagging on top of Logger.
 *
 * The component name comes from ComponentTrait, so a missing specialization
 * is a compile error rather than a mistyped string. Messages may carry "{}"
 * placeholders that are filled from the trailing arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    emit(LogLevel::DEBUG, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    emit(LogLevel::INFO, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    emit(LogLevel::WARN, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    emit(LogLevel::ERROR, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    emit(LogLevel::FATAL, message, std::forward<Args>(args)...);
  }

  static void debugWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().debug(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

private:
  template <typename... Args>
  static void emit(LogLevel level, const std::string &message, Args &&...args) {
    // Skip formatting entirely when the message would be filtered
    if (!getLogger().shouldLog(level, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().log(level, component_name,
                      format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().log(level, component_name, message);
    }
  }

  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }
};

using StoreLogger = ComponentLogger<class SqlStore>;
using PostgresLogger = ComponentLogger<class PostgresDatabase>;
using SqliteLogger = ComponentLogger<class SqliteDatabase>;
using CodecLogger = ComponentLogger<class SerializerFactory>;
using ConfigLogger = ComponentLogger<class ConfigManager>;
using CliLogger = ComponentLogger<class CommandLine>;

} // namespace sessiondb
