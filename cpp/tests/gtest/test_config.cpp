// =============================================================================
// Configuration, Logging and Connection Settings Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "factlog/config.hpp"
#include "factlog/db/connection.hpp"
#include "factlog/error.hpp"
#include "factlog/logging.hpp"
#include "factlog/reconstruct/pipeline.hpp"

using namespace factlog;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        path_ = fs::temp_directory_path() /
                ("factlog_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".env");
    }

    void TearDown() override {
        Config::getInstance().clear();
        std::error_code ec;
        fs::remove(path_, ec);
        ::unsetenv("FACTLOG_DB_NAME");
    }

    void write_file(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path path_;
};

// =============================================================================
// Config
// =============================================================================

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("n", "42");
    config.set("x", "2.5");
    config.set("flag", "Yes");
    config.set("bad", "forty");

    EXPECT_EQ(config.get<int>("n"), 42);
    EXPECT_DOUBLE_EQ(config.get<double>("x"), 2.5);
    EXPECT_TRUE(config.get<bool>("flag"));
    EXPECT_EQ(config.get<int>("bad", 7), 7);
    EXPECT_EQ(config.get<std::string>("missing", "dflt"), "dflt");
    EXPECT_TRUE(config.has("n"));
    EXPECT_FALSE(config.has("missing"));
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    write_file("# factlog settings\n"
               "; legacy comment\n"
               "db.host = db.internal\n"
               "db.port=6543\n"
               "reconstruct.retraction_policy = remove\n"
               "\n"
               "not a setting\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path_.string()));
    EXPECT_EQ(config.get<std::string>("db.host"), "db.internal");
    EXPECT_EQ(config.get<int>("db.port"), 6543);
    EXPECT_EQ(config.get<std::string>("reconstruct.retraction_policy"), "remove");
    EXPECT_EQ(config.get<int>("db.pool_size"), 4);
}

TEST_F(ConfigTest, EnvironmentFillsUnsetKeys) {
    ::setenv("FACTLOG_DB_NAME", "from_env", 1);
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.get<std::string>("db.name"), "from_env");
}

TEST_F(ConfigTest, InvalidPortFailsValidation) {
    write_file("db.port = 70000\n");
    EXPECT_FALSE(Config::getInstance().load(path_.string()));
}

TEST_F(ConfigTest, UnknownPolicyFailsValidation) {
    write_file("reconstruct.retraction_policy = forget\n");
    EXPECT_FALSE(Config::getInstance().load(path_.string()));
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    write_file("log.level = chatty\n");
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(path_.string()));
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

// =============================================================================
// ReconstructOptions
// =============================================================================

TEST_F(ConfigTest, ReconstructOptionsFromConfig) {
    Config& config = Config::getInstance();
    config.set("reconstruct.retraction_policy", "remove");
    config.set("perf.max_threads", "3");

    ReconstructOptions options = ReconstructOptions::from_config(config);
    EXPECT_EQ(options.retraction_policy, RetractionPolicy::Remove);
    EXPECT_EQ(options.max_threads, 3u);
}

TEST_F(ConfigTest, ReconstructOptionsDefaults) {
    ReconstructOptions options = ReconstructOptions::from_config(Config::getInstance());
    EXPECT_EQ(options.retraction_policy, RetractionPolicy::Freeze);
    EXPECT_EQ(options.max_threads, 0u);
}

TEST_F(ConfigTest, ReconstructOptionsRejectsUnknownPolicy) {
    Config::getInstance().set("reconstruct.retraction_policy", "forget");
    try {
        ReconstructOptions::from_config(Config::getInstance());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }
}

TEST(RetractionPolicyTest, NamesRoundTrip) {
    EXPECT_STREQ(retraction_policy_name(RetractionPolicy::Freeze), "freeze");
    EXPECT_EQ(parse_retraction_policy("remove"), RetractionPolicy::Remove);
    EXPECT_FALSE(parse_retraction_policy("Remove").has_value());
}

// =============================================================================
// ConnectionConfig
// =============================================================================

TEST_F(ConfigTest, ConnectionConfigFromConfig) {
    Config& config = Config::getInstance();
    config.set("db.name", "events");
    config.set("db.host", "pg.example");
    config.set("db.port", "5433");

    db::ConnectionConfig cc = db::ConnectionConfig::from_config(config);
    EXPECT_EQ(cc.dbname, "events");
    EXPECT_EQ(cc.host, "pg.example");
    EXPECT_EQ(cc.port, "5433");
    EXPECT_EQ(cc.user, "postgres");
}

TEST(ConnectionConfigTest, ConninfoQuotesValues) {
    db::ConnectionConfig cc;
    cc.dbname = "factlog";
    cc.host = "localhost";
    cc.port = "5432";
    cc.user = "app";
    cc.password = "it's secret";

    EXPECT_EQ(cc.to_conninfo(),
              "dbname=factlog host=localhost port=5432 user=app "
              "password='it\\'s secret' connect_timeout=5");
}

TEST(ConnectionConfigTest, ParseArgs) {
    const char* args[] = {"factlog", "-d", "db1", "--host", "h", "-x"};
    char** argv = const_cast<char**>(args);
    int argc = 6;

    db::ConnectionConfig cc;
    int i = 1;
    EXPECT_TRUE(cc.parse_arg(argc, argv, i));
    EXPECT_EQ(i, 2);
    ++i;
    EXPECT_TRUE(cc.parse_arg(argc, argv, i));
    ++i;
    EXPECT_FALSE(cc.parse_arg(argc, argv, i));
    EXPECT_EQ(cc.dbname, "db1");
    EXPECT_EQ(cc.host, "h");
}

// =============================================================================
// Logging
// =============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::getInstance().level();
        set_log_output(out_);
    }
    void TearDown() override {
        set_log_output(std::cerr);
        set_log_level(saved_level_);
    }

    std::ostringstream out_;
    LogLevel saved_level_ = LogLevel::INFO;
};

TEST_F(LoggingTest, LevelFilters) {
    set_log_level(LogLevel::WARN);
    LOG_INFO("hidden");
    LOG_WARN("shown ", 42);
    std::string text = out_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("shown 42"), std::string::npos);
}

TEST_F(LoggingTest, LineNamesSourceFile) {
    set_log_level(LogLevel::DEBUG);
    LOG_DEBUG("x");
    EXPECT_NE(out_.str().find("test_config.cpp:"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

// =============================================================================
// Errors
// =============================================================================

TEST(ErrorTest, MessageCarriesCodeContextSuggestion) {
    StoreUnavailableError e("down", "PgFactStore", "start the server");
    std::string what = e.what();
    EXPECT_NE(what.find("STORE_UNAVAILABLE"), std::string::npos);
    EXPECT_NE(what.find("Context: PgFactStore"), std::string::npos);
    EXPECT_NE(what.find("Suggestion: start the server"), std::string::npos);
    EXPECT_EQ(e.context(), "PgFactStore");
}

namespace {

void lose_connection() {
    FACTLOG_THROW(StoreUnavailableError, "gone");
}

void reject_policy() {
    FACTLOG_THROW_HINT(ConfigError, "bad policy", "use freeze");
}

} // namespace

TEST(ErrorTest, ThrowMacrosRecordCallingFunction) {
    try {
        lose_connection();
        FAIL() << "expected StoreUnavailableError";
    } catch (const StoreUnavailableError& e) {
        EXPECT_EQ(e.context(), "lose_connection");
        EXPECT_TRUE(e.suggestion().empty());
    }

    try {
        reject_policy();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.context(), "reject_policy");
        EXPECT_EQ(e.suggestion(), "use freeze");
    }
}

TEST(ErrorTest, CheckMacros) {
    EXPECT_THROW(FACTLOG_CHECK_ARGUMENT(false, "bad"), InvalidArgumentError);
    EXPECT_NO_THROW(FACTLOG_CHECK_ARGUMENT(true, "fine"));
}
