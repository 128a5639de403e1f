// =============================================================================
// Configuration and Run Settings Tests
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "stevedore/config.hpp"
#include "stevedore/db/connection.hpp"
#include "stevedore/error.hpp"
#include "stevedore/migrate/settings.hpp"

using namespace stevedore;
using namespace stevedore::migrate;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::ERROR);
        Config::getInstance().reset();
        path = std::filesystem::temp_directory_path() /
               ("stevedore_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        Config::getInstance().reset();
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    Config& config() { return Config::getInstance(); }

    std::filesystem::path path;
};

// =============================================================================
// Config
// =============================================================================

TEST_F(ConfigTest, FileOverridesDefaults) {
    write("# comment\n"
          "; also a comment\n"
          "pool.workers = 3\n"
          "pool.timeout_ms=2500\n"
          "log.level = warn\n"
          "db.host = db.internal\n"
          "not a key value line\n");

    ASSERT_TRUE(config().load(path.string()));
    EXPECT_EQ(config().get<int>("pool.workers"), 3);
    EXPECT_EQ(config().get<std::int64_t>("pool.timeout_ms"), 2500);
    EXPECT_EQ(config().get<std::string>("log.level"), "warn");
    EXPECT_EQ(config().get<std::string>("db.host"), "db.internal");
    EXPECT_FALSE(config().get<std::string>("copy.batch_size").empty());
}

TEST_F(ConfigTest, MissingFileFailsLoad) {
    EXPECT_FALSE(config().load((path / "nope").string()));
}

TEST_F(ConfigTest, InvalidValuesFailValidation) {
    write("pool.workers = 0\n");
    EXPECT_FALSE(config().load(path.string()));

    config().reset();
    write("db.port = 70000\n");
    EXPECT_FALSE(config().load(path.string()));
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    write("log.level = chatty\n");
    ASSERT_TRUE(config().load(path.string()));
    EXPECT_EQ(config().get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, TypedGetters) {
    config().set("a.int", "42");
    config().set("a.bool", "Yes");
    config().set("a.double", "0.25");
    config().set("a.bad", "forty");

    EXPECT_EQ(config().get<int>("a.int"), 42);
    EXPECT_TRUE(config().get<bool>("a.bool"));
    EXPECT_DOUBLE_EQ(config().get<double>("a.double"), 0.25);
    EXPECT_EQ(config().get<int>("a.bad", 7), 7);
    EXPECT_EQ(config().get<int>("a.missing", 9), 9);
}

TEST_F(ConfigTest, ListsAreTrimmed) {
    config().set("list", " a, b ,, c ");
    config().set("cols", "id BIGINT; total NUMERIC(12,2) ;");

    EXPECT_EQ(config().get_list("list"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(config().get_list("cols", ';'), (std::vector<std::string>{"id BIGINT", "total NUMERIC(12,2)"}));
    EXPECT_TRUE(config().get_list("absent").empty());
}

TEST_F(ConfigTest, NonAsciiBytesAreKept) {
    config().set("latin1", " \xE9t\xE9 ,\xA0x");
    config().set("flag", "\xC9");

    EXPECT_EQ(config().get_list("latin1"), (std::vector<std::string>{"\xE9t\xE9", "\xA0x"}));
    EXPECT_FALSE(config().get<bool>("flag"));
}

TEST_F(ConfigTest, ConnectionFromConfig) {
    config().set("db.host", "pg.example");
    config().set("db.port", "6543");
    config().set("db.name", "warehouse");
    config().set("db.user", "loader");
    config().set("db.password", "");

    auto cc = db::ConnectionConfig::from_config(config());
    EXPECT_EQ(cc.host, "pg.example");
    EXPECT_EQ(cc.port, "6543");
    EXPECT_EQ(cc.dbname, "warehouse");
    EXPECT_EQ(cc.user, "loader");

    std::string conninfo = cc.to_conninfo();
    EXPECT_NE(conninfo.find("dbname=warehouse"), std::string::npos);
    EXPECT_NE(conninfo.find("host=pg.example"), std::string::npos);
    EXPECT_NE(conninfo.find("connect_timeout=10"), std::string::npos);
}

TEST_F(ConfigTest, GivenDatabaseFlagsOverrideConfig) {
    config().set("db.host", "config-host.invalid");
    config().set("db.port", "6543");
    config().set("db.name", "warehouse");

    // -h repeats the built-in default; it must still win over the file.
    const char* args[] = {"-h", "localhost", "--dbname", "scratch", "--parts", "0:1"};
    char** argv = const_cast<char**>(args);
    int argc = 6;

    db::ConnectionFlags flags;
    int i = 0;
    ASSERT_TRUE(flags.parse_arg(argc, argv, i));
    EXPECT_EQ(i, 1);
    ++i;
    ASSERT_TRUE(flags.parse_arg(argc, argv, i));
    ++i;
    EXPECT_FALSE(flags.parse_arg(argc, argv, i));
    EXPECT_EQ(i, 4);

    auto cc = flags.apply(db::ConnectionConfig::from_config(config()));
    EXPECT_EQ(cc.host, "localhost");
    EXPECT_EQ(cc.dbname, "scratch");
    EXPECT_EQ(cc.port, "6543");
}

TEST_F(ConfigTest, DatabaseFlagWithoutValueIsNotConsumed) {
    const char* args[] = {"-U"};
    db::ConnectionFlags flags;
    int i = 0;
    EXPECT_FALSE(flags.parse_arg(1, const_cast<char**>(args), i));
    EXPECT_EQ(i, 0);
    EXPECT_FALSE(flags.user.has_value());
}

// =============================================================================
// RunSettings
// =============================================================================

TEST_F(ConfigTest, RunSettingsDefaults) {
    auto s = RunSettings::from_config(config());
    EXPECT_EQ(s.workers, 8);
    EXPECT_EQ(s.policy.retries, 3);
    EXPECT_EQ(s.policy.timeout, 60000ms);
    EXPECT_EQ(s.policy.timeout_step, 60000ms);
    EXPECT_EQ(s.policy.max_escalations, 0);
    EXPECT_EQ(s.batch_size, 100000);
    EXPECT_EQ(s.progress_interval, 10000ms);
}

TEST_F(ConfigTest, RunSettingsFromKeys) {
    config().set("pool.workers", "16");
    config().set("pool.retries", "0");
    config().set("pool.timeout_ms", "0");
    config().set("pool.timeout_step_ms", "5000");
    config().set("pool.max_escalations", "4");
    config().set("copy.batch_size", "250");
    config().set("pool.progress_interval_ms", "500");

    auto s = RunSettings::from_config(config());
    EXPECT_EQ(s.workers, 16);
    EXPECT_EQ(s.policy.retries, 0);
    EXPECT_EQ(s.policy.timeout, 0ms);
    EXPECT_EQ(s.policy.timeout_step, 5000ms);
    EXPECT_EQ(s.policy.max_escalations, 4);
    EXPECT_EQ(s.batch_size, 250);
    EXPECT_EQ(s.progress_interval, 500ms);
}

TEST_F(ConfigTest, RunSettingsRejectsOutOfRange) {
    config().set("pool.workers", "0");
    EXPECT_THROW(RunSettings::from_config(config()), ConfigError);

    config().reset();
    config().set("copy.batch_size", "-1");
    EXPECT_THROW(RunSettings::from_config(config()), ConfigError);

    config().reset();
    config().set("pool.timeout_step_ms", "0");
    EXPECT_THROW(RunSettings::from_config(config()), ConfigError);
}

// =============================================================================
// Schema
// =============================================================================

TEST_F(ConfigTest, SchemaFromKeys) {
    config().set("schema.parent", "orders");
    config().set("schema.source_prefix", "orders_old_");
    config().set("schema.partition_key", "id");
    config().set("schema.columns", "id BIGINT; placed_at TIMESTAMPTZ; total NUMERIC(12,2)");
    config().set("schema.primary_key", "id");
    config().set("schema.not_null", "placed_at, total");
    config().set("schema.indexes", "placed");
    config().set("schema.index.placed", "USING btree (placed_at)");

    auto schema = schema_from_config(config());
    EXPECT_EQ(schema.parent, "orders");
    EXPECT_EQ(schema.copy_key, "id");
    ASSERT_EQ(schema.columns.size(), 3u);
    EXPECT_EQ(schema.columns[2], "total NUMERIC(12,2)");
    EXPECT_EQ(schema.not_null, (std::vector<std::string>{"placed_at", "total"}));
    ASSERT_EQ(schema.indexes.size(), 1u);
    EXPECT_EQ(schema.indexes[0].suffix, "placed");
    EXPECT_EQ(schema.indexes[0].definition, "USING btree (placed_at)");
}

TEST_F(ConfigTest, SchemaErrorsAreConfigErrors) {
    config().set("schema.partition_key", "id");
    config().set("schema.columns", "id BIGINT");
    EXPECT_THROW(schema_from_config(config()), ConfigError);  // no parent

    config().set("schema.parent", "orders");
    config().set("schema.indexes", "placed");
    EXPECT_THROW(schema_from_config(config()), ConfigError);  // no definition for placed

    config().set("schema.indexes", "");
    config().set("schema.copy_key", "bad key");
    EXPECT_THROW(schema_from_config(config()), ConfigError);
}
