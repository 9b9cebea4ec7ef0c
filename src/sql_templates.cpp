#include "sql_templates.hpp"
#include "sessiondb_exceptions.hpp"

namespace sessiondb {

namespace {

constexpr size_t MAX_NAME_LENGTH = 255;

void validateName(const std::string &field, const std::string &value) {
  if (value.empty()) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              field + " must not be empty", field, value);
  }
  if (value.size() > MAX_NAME_LENGTH) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              field + " must be at most " +
                                  std::to_string(MAX_NAME_LENGTH) +
                                  " characters",
                              field, value.substr(0, 32) + "...");
  }
  if (value.find_first_of("\r\n") != std::string::npos) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              field + " must not contain line breaks", field,
                              value);
  }
}

// Hands out placeholders in bind order
class PlaceholderSequence {
public:
  explicit PlaceholderSequence(PlaceholderStyle style) : style_(style) {}

  std::string next() {
    if (style_ == PlaceholderStyle::NUMBERED) {
      return "$" + std::to_string(++index_);
    }
    return "?";
  }

private:
  PlaceholderStyle style_;
  int index_ = 0;
};

} // namespace

void TableLayout::validate() const {
  validateName("table", table);
  validateName("key_column", keyColumn);
  validateName("data_column", dataColumn);
  validateName("expiration_column", expirationColumn);
}

SqlTemplates SqlTemplates::build(const TableLayout &layout,
                                 PlaceholderStyle style) {
  const std::string &t = layout.table;
  const std::string &k = layout.keyColumn;
  const std::string &d = layout.dataColumn;
  const std::string &e = layout.expirationColumn;

  SqlTemplates templates;

  {
    PlaceholderSequence p(style);
    std::string a = p.next(), b = p.next(), c = p.next();
    templates.insert = "INSERT INTO " + t + " (" + k + ", " + d + ", " + e +
                       ") VALUES (" + a + ", " + b + ", " + c + ")";
  }
  {
    PlaceholderSequence p(style);
    std::string a = p.next(), b = p.next(), c = p.next();
    templates.update = "UPDATE " + t + " SET " + d + "=" + a + ", " + e + "=" +
                       b + " WHERE " + k + "=" + c;
  }
  {
    PlaceholderSequence p(style);
    std::string a = p.next(), b = p.next();
    templates.exists = "SELECT 1 FROM " + t + " WHERE " + k + " = " + a +
                       " AND " + e + " > " + b;
  }
  {
    PlaceholderSequence p(style);
    std::string a = p.next(), b = p.next();
    templates.select = "SELECT " + d + " FROM " + t + " WHERE " + k + " = " +
                       a + " AND " + e + " > " + b;
  }
  {
    PlaceholderSequence p(style);
    templates.remove = "DELETE FROM " + t + " WHERE " + k + " = " + p.next();
  }
  {
    PlaceholderSequence p(style);
    std::string a = p.next(), b = p.next(), c = p.next();
    templates.upsert = "INSERT INTO " + t + " (" + k + ", " + d + ", " + e +
                       ") VALUES (" + a + ", " + b + ", " + c +
                       ") ON CONFLICT (" + k + ") DO UPDATE SET " + d +
                       " = excluded." + d + ", " + e + " = excluded." + e;
  }

  return templates;
}

} // namespace sessiondb
