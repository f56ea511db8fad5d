#include <gtest/gtest.h>
#include <gist/config.hpp>
#include <gist/util/file_io.hpp>

using namespace gist;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = fs::temp_directory_path() / "gist_config_test";
        fs::remove_all(home_);
        fs::create_directories(home_);
        env_.home = home_.string();
    }

    void TearDown() override {
        fs::remove_all(home_);
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        ASSERT_TRUE(write_file(path, content));
    }

    fs::path home_;
    ConfigEnvironment env_;
};

// ============================================================================
// INI parsing
// ============================================================================

TEST_F(ConfigTest, ParsesSectionsAndKeys) {
    auto ini = IniFile::parse(
        "# comment\n"
        "[gist]\n"
        "token = abc123\n"
        "editor=vim -f\n"
        "; another comment\n"
        "[other]\n"
        "token: zzz\n");

    EXPECT_TRUE(ini.has_section("gist"));
    EXPECT_EQ(ini.get("gist", "token"), std::optional<std::string>("abc123"));
    EXPECT_EQ(ini.get("gist", "editor"), std::optional<std::string>("vim -f"));
    EXPECT_EQ(ini.get("other", "token"), std::optional<std::string>("zzz"));
    EXPECT_FALSE(ini.get("gist", "missing").has_value());
    EXPECT_FALSE(ini.get("nope", "token").has_value());
}

TEST_F(ConfigTest, IgnoresKeysOutsideSections) {
    auto ini = IniFile::parse("token = orphan\n[gist]\n");
    EXPECT_FALSE(ini.get("gist", "token").has_value());
}

TEST_F(ConfigTest, HandlesCrlfAndWhitespace) {
    auto ini = IniFile::parse("  [ gist ]  \r\n  token   =   t0k  \r\n");
    EXPECT_EQ(ini.get("gist", "token"), std::optional<std::string>("t0k"));
}

TEST_F(ConfigTest, ConfigFromIni) {
    auto config = config_from_ini(IniFile::parse(
        "[gist]\ntoken = t\neditor = nano\napi_url = https://ghe.example.com/api/v3/\n"));
    EXPECT_EQ(config.token, "t");
    EXPECT_EQ(config.editor, std::optional<std::string>("nano"));
    EXPECT_EQ(config.api_url, "https://ghe.example.com/api/v3");
}

TEST_F(ConfigTest, DefaultApiUrl) {
    auto config = config_from_ini(IniFile::parse("[gist]\ntoken = t\n"));
    EXPECT_EQ(config.api_url, "https://api.github.com");
    EXPECT_FALSE(config.editor.has_value());
}

// ============================================================================
// Discovery
// ============================================================================

TEST_F(ConfigTest, SearchOrderDefaults) {
    auto paths = config_search_paths(env_);
    ASSERT_EQ(paths.size(), 3);
    EXPECT_EQ(paths[0], home_ / ".gist");
    EXPECT_EQ(paths[1], home_ / ".config" / "gist");
    EXPECT_EQ(paths[2], home_ / ".local" / "share" / "gist");
}

TEST_F(ConfigTest, SearchOrderHonorsXdg) {
    env_.xdg_config_home = (home_ / "cfg").string();
    env_.xdg_data_home = (home_ / "data").string();
    auto paths = config_search_paths(env_);
    ASSERT_EQ(paths.size(), 3);
    EXPECT_EQ(paths[1], home_ / "cfg" / "gist");
    EXPECT_EQ(paths[2], home_ / "data" / "gist");
}

TEST_F(ConfigTest, HomeDotfileWins) {
    write(home_ / ".gist", "[gist]\ntoken = from-home\n");
    write(home_ / ".config" / "gist", "[gist]\ntoken = from-config\n");

    auto config = load_config(env_);
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config.value().token, "from-home");
    EXPECT_EQ(config.value().source, std::optional<fs::path>(home_ / ".gist"));
}

TEST_F(ConfigTest, FallsBackToDataDirectory) {
    write(home_ / ".local" / "share" / "gist", "[gist]\ntoken = from-data\n");

    auto config = load_config(env_);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().token, "from-data");
}

TEST_F(ConfigTest, MissingFileIsNotFatalUntilTokenNeeded) {
    auto config = load_config(env_);
    ASSERT_TRUE(config.ok());
    EXPECT_FALSE(config.value().source.has_value());

    auto ready = require_token(config.value());
    ASSERT_FALSE(ready.ok());
    EXPECT_EQ(ready.error_code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigTest, MissingTokenIsConfigError) {
    write(home_ / ".gist", "[gist]\neditor = vim\n");

    auto config = load_config(env_);
    ASSERT_TRUE(config.ok());
    auto ready = require_token(config.value());
    ASSERT_FALSE(ready.ok());
    EXPECT_EQ(ready.error_code(), ErrorCode::CONFIG_ERROR);
    EXPECT_NE(ready.error().message().find("token"), std::string::npos);
}

TEST_F(ConfigTest, TokenPresentIsReady) {
    write(home_ / ".gist", "[gist]\ntoken = abc\n");
    auto config = load_config(env_);
    ASSERT_TRUE(config.ok());
    EXPECT_TRUE(require_token(config.value()).ok());
}

TEST_F(ConfigTest, NoHomeMeansNoCandidates) {
    ConfigEnvironment empty;
    EXPECT_TRUE(config_search_paths(empty).empty());
}
