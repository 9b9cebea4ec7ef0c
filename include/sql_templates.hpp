#pragma once

#include "database_handle.hpp"
#include <string>

namespace sessiondb {

// Table and column names the session statements are built from
struct TableLayout {
  std::string table = "sessions";
  std::string keyColumn = "key";
  std::string dataColumn = "data";
  std::string expirationColumn = "expiration";

  // Throws ValidationException naming the first bad field
  void validate() const;
};

/**
 * The statements a session store runs, derived once from a TableLayout.
 *
 * Names are interpolated when the templates are built; every value is a
 * bind parameter. Parameter order:
 *   insert / upsert: key, data, expiration
 *   update:          data, expiration, key
 *   exists / select: key, now
 *   remove:          key
 */
struct SqlTemplates {
  std::string insert;
  std::string update;
  std::string exists;
  std::string select;
  std::string remove;
  std::string upsert;

  static SqlTemplates build(const TableLayout &layout, PlaceholderStyle style);
};

} // namespace sessiondb
