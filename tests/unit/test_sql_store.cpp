#include "sessiondb_exceptions.hpp"
#include "sql_store.hpp"
#include "sqlite_database.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <limits>

namespace sessiondb {

namespace {

const char *SCHEMA = "CREATE TABLE sessions ("
                     "key TEXT PRIMARY KEY, data BLOB, "
                     "expiration INTEGER NOT NULL)";

const char *SCHEMA_WITHOUT_UNIQUE_KEY =
    "CREATE TABLE sessions (key TEXT, data BLOB, expiration INTEGER NOT NULL)";

// Records every statement and lets a test act between the exists-check and
// the write that follows it
class InstrumentedDatabase : public DatabaseHandle {
public:
  explicit InstrumentedDatabase(std::shared_ptr<SqliteDatabase> inner)
      : inner_(std::move(inner)) {}

  void execute(const std::string &sql,
               const std::vector<SqlParam> &params) override {
    statements.push_back(sql);
    inner_->execute(sql, params);
  }

  std::optional<std::string> selectValue(const std::string &sql,
                                         const std::vector<SqlParam> &params,
                                         SqlParam::Type resultType) override {
    statements.push_back(sql);
    auto result = inner_->selectValue(sql, params, resultType);
    if (afterExistsCheck && sql.rfind("SELECT 1 ", 0) == 0) {
      auto hook = std::move(afterExistsCheck);
      afterExistsCheck = nullptr;
      hook(params[0].bytes);
    }
    return result;
  }

  PlaceholderStyle placeholderStyle() const override {
    return inner_->placeholderStyle();
  }
  std::string driverName() const override { return "instrumented"; }

  std::vector<std::string> statements;
  std::function<void(const std::string &key)> afterExistsCheck;

private:
  std::shared_ptr<SqliteDatabase> inner_;
};

} // namespace

class SqlStoreTest : public ::testing::Test {
protected:
  void SetUp() override { createDatabase(SCHEMA); }

  void createDatabase(const std::string &schema) {
    sqlite_ = std::make_shared<SqliteDatabase>(":memory:");
    sqlite_->executeScript(schema);
    database_ = std::make_shared<InstrumentedDatabase>(sqlite_);
  }

  std::unique_ptr<SqlStore>
  makeStore(SerializerOption serializer = std::string("JSON"),
            UpsertStrategy strategy = UpsertStrategy::UPDATE_ON_CONFLICT) {
    SqlStoreOptions options;
    options.upsertStrategy = strategy;
    return std::make_unique<SqlStore>(database_, std::move(serializer), options,
                                      [this] { return now_; });
  }

  // Simulates another process writing the same key
  void insertCompetingRow(const std::string &key) {
    sqlite_->execute(
        "INSERT INTO sessions (key, data, expiration) VALUES (?, ?, ?)",
        {SqlParam::text(key), SqlParam::text(R"({"writer":"other"})"),
         SqlParam::int64(now_ + 100)});
  }

  std::int64_t rowCount(const std::string &key) {
    auto count = sqlite_->selectValue(
        "SELECT COUNT(*) FROM sessions WHERE key = ?", {SqlParam::text(key)},
        SqlParam::Type::INTEGER);
    return count ? std::stoll(*count) : 0;
  }

  std::optional<std::string> storedColumn(const std::string &column,
                                          const std::string &key) {
    return sqlite_->selectValue("SELECT " + column +
                                    " FROM sessions WHERE key = ?",
                                {SqlParam::text(key)}, SqlParam::Type::BLOB);
  }

  std::int64_t now_ = 1700000000;
  std::shared_ptr<SqliteDatabase> sqlite_;
  std::shared_ptr<InstrumentedDatabase> database_;
};

TEST_F(SqlStoreTest, SetThenGetReturnsValue) {
  auto store = makeStore();
  nlohmann::json value = {{"user_id", 42}};

  store->set("abc", value, 3600);

  auto loaded = store->get("abc");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, value);
  EXPECT_EQ(storedColumn("expiration", "abc"), std::to_string(now_ + 3600));
  EXPECT_EQ(storedColumn("data", "abc"), R"({"user_id":42})");
}

TEST_F(SqlStoreTest, MissingKeyIsAbsent) {
  auto store = makeStore();
  EXPECT_FALSE(store->get("never-set").has_value());
}

TEST_F(SqlStoreTest, ExpirationIsStrict) {
  auto store = makeStore();
  store->set("k", {{"v", 1}}, 10);

  now_ += 9;
  EXPECT_TRUE(store->get("k").has_value());

  now_ += 1;
  EXPECT_FALSE(store->get("k").has_value());
  EXPECT_EQ(rowCount("k"), 1);
}

TEST_F(SqlStoreTest, ZeroTtlIsAlreadyExpired) {
  auto store = makeStore();
  store->set("k", {{"v", 1}}, 0);
  EXPECT_FALSE(store->get("k").has_value());
}

TEST_F(SqlStoreTest, SetReplacesLiveValue) {
  auto store = makeStore();
  store->set("k", {{"v", 1}}, 60);

  now_ += 30;
  store->set("k", {{"v", 2}}, 60);

  EXPECT_EQ(rowCount("k"), 1);
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"v", 2}}));
  EXPECT_EQ(storedColumn("expiration", "k"), std::to_string(now_ + 60));
}

TEST_F(SqlStoreTest, SetRevivesExpiredRow) {
  auto store = makeStore();
  store->set("k", {{"v", 1}}, 10);

  now_ += 20;
  ASSERT_FALSE(store->get("k").has_value());
  store->set("k", {{"v", 2}}, 10);

  EXPECT_EQ(rowCount("k"), 1);
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"v", 2}}));
}

TEST_F(SqlStoreTest, CheckThenWriteCannotReviveExpiredUniqueRow) {
  auto store = makeStore(std::string("JSON"), UpsertStrategy::CHECK_THEN_WRITE);
  store->set("k", {{"v", 1}}, 10);

  now_ += 20;
  try {
    store->set("k", {{"v", 2}}, 10);
    FAIL() << "Expected DatabaseException";
  } catch (const DatabaseException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::CONSTRAINT_VIOLATION);
  }
}

TEST_F(SqlStoreTest, RemoveDeletesLiveAndExpiredRows) {
  auto store = makeStore();
  store->set("live", {{"v", 1}}, 60);
  store->set("stale", {{"v", 2}}, 1);
  now_ += 5;

  store->remove("live");
  store->remove("stale");

  EXPECT_FALSE(store->get("live").has_value());
  EXPECT_EQ(rowCount("live"), 0);
  EXPECT_EQ(rowCount("stale"), 0);
}

TEST_F(SqlStoreTest, RemovingMissingKeySucceeds) {
  auto store = makeStore();
  EXPECT_NO_THROW(store->remove("ghost"));
}

TEST_F(SqlStoreTest, InvalidArgumentsAreRejectedBeforeAnyStatement) {
  auto store = makeStore();

  EXPECT_THROW(store->set("", {{"v", 1}}, 10), ValidationException);
  EXPECT_THROW(store->set("k", {{"v", 1}}, -1), ValidationException);
  EXPECT_THROW(store->get(""), ValidationException);
  EXPECT_THROW(store->remove(""), ValidationException);

  EXPECT_TRUE(database_->statements.empty());
}

TEST_F(SqlStoreTest, CorruptBlobIsDecodeErrorNotAbsence) {
  auto store = makeStore(std::string("CBOR"));
  sqlite_->execute(
      "INSERT INTO sessions (key, data, expiration) VALUES (?, ?, ?)",
      {SqlParam::text("bad"), SqlParam::blob(std::string("\xff\xff", 2)),
       SqlParam::int64(now_ + 60)});

  try {
    store->get("bad");
    FAIL() << "Expected SerializationException";
  } catch (const SerializationException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::DESERIALIZATION_ERROR);
    EXPECT_EQ(e.getCodec(), "CBOR");
  }

  EXPECT_EQ(rowCount("bad"), 1);
  EXPECT_FALSE(store->get("missing").has_value());
}

TEST_F(SqlStoreTest, SerializationFailureLeavesNoRow) {
  auto store = makeStore();
  nlohmann::json value = {{"name", std::string("bad \xC3\x28 byte")}};

  EXPECT_THROW(store->set("k", value, 60), SerializationException);
  EXPECT_TRUE(database_->statements.empty());
  EXPECT_EQ(rowCount("k"), 0);
}

TEST_F(SqlStoreTest, CodecsShareContractButNotBytes) {
  nlohmann::json value = {{"user_id", 42}, {"roles", {"admin"}}};

  auto jsonStore = makeStore(std::string("JSON"));
  jsonStore->set("k", value, 60);
  auto jsonBytes = storedColumn("data", "k");
  EXPECT_EQ(*jsonStore->get("k"), value);

  auto cborStore = makeStore(std::string("CBOR"));
  cborStore->set("k", value, 60);
  auto cborBytes = storedColumn("data", "k");
  EXPECT_EQ(*cborStore->get("k"), value);

  ASSERT_TRUE(jsonBytes && cborBytes);
  EXPECT_NE(*jsonBytes, *cborBytes);
  EXPECT_EQ(*cborBytes, CborSerializer().serialize(value));
}

TEST_F(SqlStoreTest, EveryCodecIsStoredAsBlob) {
  nlohmann::json value = {{"path", "C:\\temp\\\"quoted\""}};
  makeStore(std::string("JSON"))->set("text", value, 60);
  makeStore(std::string("MessagePack"))->set("binary", value, 60);

  EXPECT_EQ(storedColumn("typeof(data)", "text"), "blob");
  EXPECT_EQ(storedColumn("typeof(data)", "binary"), "blob");
  EXPECT_EQ(storedColumn("data", "text"), value.dump());
  EXPECT_EQ(*makeStore(std::string("JSON"))->get("text"), value);
}

TEST_F(SqlStoreTest, TtlThatOverflowsExpirationIsRejected) {
  auto store = makeStore();

  try {
    store->set("k", {{"v", 1}}, std::numeric_limits<std::int64_t>::max());
    FAIL() << "Expected ValidationException";
  } catch (const ValidationException &e) {
    EXPECT_EQ(e.getField(), "ttl");
  }
  EXPECT_TRUE(database_->statements.empty());

  store->set("k", {{"v", 1}}, std::numeric_limits<std::int64_t>::max() - now_);
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"v", 1}}));
}

TEST_F(SqlStoreTest, ConcurrentInsertFailsUnderCheckThenWrite) {
  auto store = makeStore(std::string("JSON"), UpsertStrategy::CHECK_THEN_WRITE);
  database_->afterExistsCheck = [this](const std::string &key) {
    insertCompetingRow(key);
  };

  try {
    store->set("k", {{"writer", "me"}}, 60);
    FAIL() << "Expected DatabaseException";
  } catch (const DatabaseException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::CONSTRAINT_VIOLATION);
  }
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"writer", "other"}}));
}

TEST_F(SqlStoreTest, ConcurrentInsertDuplicatesWithoutUniqueKey) {
  createDatabase(SCHEMA_WITHOUT_UNIQUE_KEY);
  auto store = makeStore(std::string("JSON"), UpsertStrategy::CHECK_THEN_WRITE);
  database_->afterExistsCheck = [this](const std::string &key) {
    insertCompetingRow(key);
  };

  store->set("k", {{"writer", "me"}}, 60);
  EXPECT_EQ(rowCount("k"), 2);
}

TEST_F(SqlStoreTest, ConcurrentInsertFallsBackToUpdate) {
  auto store = makeStore(std::string("JSON"), UpsertStrategy::UPDATE_ON_CONFLICT);
  database_->afterExistsCheck = [this](const std::string &key) {
    insertCompetingRow(key);
  };

  store->set("k", {{"writer", "me"}}, 60);

  EXPECT_EQ(rowCount("k"), 1);
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"writer", "me"}}));
  EXPECT_EQ(storedColumn("expiration", "k"), std::to_string(now_ + 60));
}

TEST_F(SqlStoreTest, NativeUpsertIsOneStatement) {
  auto store = makeStore(std::string("JSON"), UpsertStrategy::NATIVE_UPSERT);
  insertCompetingRow("k");

  store->set("k", {{"writer", "me"}}, 60);

  ASSERT_EQ(database_->statements.size(), 1u);
  EXPECT_EQ(database_->statements[0], store->templates().upsert);
  EXPECT_EQ(rowCount("k"), 1);
  EXPECT_EQ(*store->get("k"), (nlohmann::json{{"writer", "me"}}));
}

TEST_F(SqlStoreTest, StatementsArePreparedOncePerTemplate) {
  auto store = makeStore();
  for (int round = 0; round < 3; ++round) {
    store->set("k", {{"round", round}}, 60);
    store->get("k");
    store->remove("k");
  }
  // exists, insert, select, remove; update never ran since each round
  // starts from an empty table
  EXPECT_EQ(sqlite_->preparedStatementCount(), 4u);

  store->set("k", {{"v", 1}}, 60);
  store->set("k", {{"v", 2}}, 60);
  EXPECT_EQ(sqlite_->preparedStatementCount(), 5u);
}

TEST_F(SqlStoreTest, TemplatesUseDriverPlaceholders) {
  auto store = makeStore();
  EXPECT_EQ(store->templates().remove, "DELETE FROM sessions WHERE key = ?");
  EXPECT_EQ(store->layout().table, "sessions");
  EXPECT_EQ(store->serializer()->name(), "JSON");
  EXPECT_EQ(store->upsertStrategy(), UpsertStrategy::UPDATE_ON_CONFLICT);
}

TEST_F(SqlStoreTest, ConstructionValidatesInputs) {
  std::shared_ptr<DatabaseHandle> none;
  EXPECT_THROW(SqlStore{none}, ValidationException);

  SqlStoreOptions badLayout;
  badLayout.layout.keyColumn = "";
  EXPECT_THROW((SqlStore{database_, std::string("JSON"), badLayout}),
               ValidationException);

  EXPECT_THROW((SqlStore{database_, std::string("XML")}), ConfigException);
  EXPECT_THROW((SqlStore{database_, std::string("JSON"), SqlStoreOptions{},
                         Clock{}}),
               ValidationException);
}

TEST_F(SqlStoreTest, BuildsHandleFromConnectionConfig) {
  DatabaseConnectionConfig config;
  config.driver = "sqlite";
  config.path = ":memory:";

  SqlStore store(config);
  EXPECT_EQ(store.database()->driverName(), "sqlite");

  // No table in the fresh database: driver errors reach the caller
  try {
    store.get("k");
    FAIL() << "Expected DatabaseException";
  } catch (const DatabaseException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::DATABASE_ERROR);
  }
}

TEST(UpsertStrategyTest, NamesRoundTrip) {
  for (auto strategy :
       {UpsertStrategy::CHECK_THEN_WRITE, UpsertStrategy::UPDATE_ON_CONFLICT,
        UpsertStrategy::NATIVE_UPSERT}) {
    EXPECT_EQ(parseUpsertStrategy(upsertStrategyToString(strategy)), strategy);
  }
  EXPECT_EQ(parseUpsertStrategy("NATIVE_UPSERT"), UpsertStrategy::NATIVE_UPSERT);
  EXPECT_THROW(parseUpsertStrategy("optimistic"), ConfigException);
}

} // namespace sessiondb
