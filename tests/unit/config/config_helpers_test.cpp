#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <mvsearch/config/config_helpers.h>

using namespace mvsearch::config;
namespace fs = std::filesystem;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("mvsearch_config_helpers_" + std::to_string(::getpid()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = testDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path testDir_;
};

// ===== String Helpers =====

TEST_F(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  padded \t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigHelpersTest, EnvTruthy) {
    EXPECT_TRUE(env_truthy("1"));
    EXPECT_TRUE(env_truthy("yes"));
    EXPECT_FALSE(env_truthy("0"));
    EXPECT_FALSE(env_truthy("FALSE"));
    EXPECT_FALSE(env_truthy(""));
    EXPECT_FALSE(env_truthy(nullptr));
}

// ===== Typed Parsing =====

TEST_F(ConfigHelpersTest, ParseBool) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool("Off"), false);
    EXPECT_EQ(parse_bool("\"yes\""), true);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST_F(ConfigHelpersTest, ParseNumbers) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_EQ(parse_int("-3"), -3);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_FALSE(parse_int("").has_value());

    ASSERT_TRUE(parse_double("0.25").has_value());
    EXPECT_DOUBLE_EQ(*parse_double("0.25"), 0.25);
    EXPECT_FALSE(parse_double("abc").has_value());
    EXPECT_FALSE(parse_double("1.5kg").has_value());

    EXPECT_EQ(parse_ms("1500"), std::chrono::milliseconds(1500));
    EXPECT_FALSE(parse_ms("-1").has_value());
}

TEST_F(ConfigHelpersTest, ParseStringList) {
    auto list = parse_string_list("[\"semantic\", \"aliases\"]");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "semantic");
    EXPECT_EQ(list[1], "aliases");

    list = parse_string_list("a, b,,c");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[2], "c");

    EXPECT_TRUE(parse_string_list("[]").empty());
}

// ===== TOML Flattening =====

TEST_F(ConfigHelpersTest, FlattensSectionsAndStripsComments) {
    auto path = writeFile("config.toml", R"(
top = "level"

[search]
merge_strategy = "hybrid"   # trailing comment
vector_types = ["semantic", "aliases"]

[breaker.vector_store]
failure_threshold = 7
name = "has # hash"
)");

    auto flat = parse_simple_toml_flat(path);
    EXPECT_EQ(flat["top"], "level");
    EXPECT_EQ(flat["search.merge_strategy"], "hybrid");
    EXPECT_EQ(flat["search.vector_types"], "[\"semantic\", \"aliases\"]");
    EXPECT_EQ(flat["breaker.vector_store.failure_threshold"], "7");
    EXPECT_EQ(flat["breaker.vector_store.name"], "has # hash");

    EXPECT_EQ(parse_config_value(path, "search", "merge_strategy"), "hybrid");
    EXPECT_EQ(parse_config_value(path, "search", "missing"), "");
}

TEST_F(ConfigHelpersTest, MissingFileFlattensToEmpty) {
    EXPECT_TRUE(parse_simple_toml_flat(testDir_ / "nope.toml").empty());
}

// ===== Path Resolution =====

TEST_F(ConfigHelpersTest, ConfigPathPrecedence) {
    EXPECT_EQ(get_config_path("/explicit/path.toml"), fs::path("/explicit/path.toml"));

    ::setenv("MVSEARCH_CONFIG", "/env/config.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/env/config.toml"));
    ::unsetenv("MVSEARCH_CONFIG");

    ::setenv("XDG_CONFIG_HOME", testDir_.c_str(), 1);
    EXPECT_EQ(get_config_path(), testDir_ / "mvsearch" / "config.toml");
    ::unsetenv("XDG_CONFIG_HOME");
}
