#include "sessiondb_exceptions.hpp"
#include "sql_templates.hpp"
#include <gtest/gtest.h>

namespace sessiondb {

TEST(SqlTemplatesTest, DefaultLayoutQuestionMarks) {
  auto t = SqlTemplates::build(TableLayout{}, PlaceholderStyle::QUESTION_MARK);

  EXPECT_EQ(t.insert,
            "INSERT INTO sessions (key, data, expiration) VALUES (?, ?, ?)");
  EXPECT_EQ(t.update, "UPDATE sessions SET data=?, expiration=? WHERE key=?");
  EXPECT_EQ(t.exists, "SELECT 1 FROM sessions WHERE key = ? AND expiration > ?");
  EXPECT_EQ(t.select,
            "SELECT data FROM sessions WHERE key = ? AND expiration > ?");
  EXPECT_EQ(t.remove, "DELETE FROM sessions WHERE key = ?");
  EXPECT_EQ(t.upsert,
            "INSERT INTO sessions (key, data, expiration) VALUES (?, ?, ?) "
            "ON CONFLICT (key) DO UPDATE SET data = excluded.data, "
            "expiration = excluded.expiration");
}

TEST(SqlTemplatesTest, NumberedPlaceholdersFollowBindOrder) {
  auto t = SqlTemplates::build(TableLayout{}, PlaceholderStyle::NUMBERED);

  EXPECT_EQ(t.insert,
            "INSERT INTO sessions (key, data, expiration) VALUES ($1, $2, $3)");
  EXPECT_EQ(t.update,
            "UPDATE sessions SET data=$1, expiration=$2 WHERE key=$3");
  EXPECT_EQ(t.exists,
            "SELECT 1 FROM sessions WHERE key = $1 AND expiration > $2");
  EXPECT_EQ(t.select,
            "SELECT data FROM sessions WHERE key = $1 AND expiration > $2");
  EXPECT_EQ(t.remove, "DELETE FROM sessions WHERE key = $1");
}

TEST(SqlTemplatesTest, CustomLayoutNamesAreInterpolated) {
  TableLayout layout;
  layout.table = "web_sessions";
  layout.keyColumn = "id";
  layout.dataColumn = "payload";
  layout.expirationColumn = "expires_at";

  auto t = SqlTemplates::build(layout, PlaceholderStyle::QUESTION_MARK);

  EXPECT_EQ(t.insert, "INSERT INTO web_sessions (id, payload, expires_at) "
                      "VALUES (?, ?, ?)");
  EXPECT_EQ(t.update,
            "UPDATE web_sessions SET payload=?, expires_at=? WHERE id=?");
  EXPECT_EQ(t.exists,
            "SELECT 1 FROM web_sessions WHERE id = ? AND expires_at > ?");
  EXPECT_EQ(t.select,
            "SELECT payload FROM web_sessions WHERE id = ? AND expires_at > ?");
  EXPECT_EQ(t.remove, "DELETE FROM web_sessions WHERE id = ?");
}

TEST(TableLayoutTest, DefaultsAreValid) { EXPECT_NO_THROW(TableLayout{}.validate()); }

TEST(TableLayoutTest, RejectsEmptyName) {
  TableLayout layout;
  layout.dataColumn = "";

  try {
    layout.validate();
    FAIL() << "Expected ValidationException";
  } catch (const ValidationException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(e.getField(), "data_column");
  }
}

TEST(TableLayoutTest, RejectsLineBreaks) {
  TableLayout layout;
  layout.table = "sessions\nDROP TABLE x";
  EXPECT_THROW(layout.validate(), ValidationException);
}

TEST(TableLayoutTest, RejectsOverlongName) {
  TableLayout layout;
  layout.expirationColumn = std::string(256, 'e');
  EXPECT_THROW(layout.validate(), ValidationException);

  layout.expirationColumn = std::string(255, 'e');
  EXPECT_NO_THROW(layout.validate());
}

} // namespace sessiondb
