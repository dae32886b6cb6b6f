#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>
#include "config.hpp"
#include "platform.hpp"

namespace fs = std::filesystem;
using nanakshahi::Language;

class ConfigFile : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() / (std::string("nanakshahi_") + info->name() + ".toml");
    }
    void TearDown() override {
        std::error_code ec; fs::remove(path_, ec);
    }
    void write(const std::string& text){
        std::ofstream out(path_, std::ios::out | std::ios::trunc);
        out << text;
    }
    fs::path path_;
};

TEST_F(ConfigFile, ReadsSectionedPairs) {
    write("# comment line\n"
          "top = 1\n"
          "[display]\n"
          "language = \"pa\"   # trailing comment\n"
          "  motto='chardi # kala'\n"
          "no_equals_sign\n"
          "= orphan value\n");
    auto s = config::read_settings(path_);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s["top"], "1");
    EXPECT_EQ(s["display.language"], "pa");
    EXPECT_EQ(s["display.motto"], "chardi # kala");
}

TEST_F(ConfigFile, MissingFileGivesDefaults) {
    EXPECT_TRUE(config::read_settings(path_).empty());
    EXPECT_EQ(config::load_options(path_).language, Language::English);
}

TEST(ParseLanguage, Aliases) {
    EXPECT_TRUE(config::parse_language("Gurmukhi") == Language::Punjabi);
    EXPECT_TRUE(config::parse_language(" pa ") == Language::Punjabi);
    EXPECT_TRUE(config::parse_language("ENGLISH") == Language::English);
    EXPECT_TRUE(config::parse_language("latin") == Language::English);
    EXPECT_FALSE(config::parse_language("klingon").has_value());
    EXPECT_FALSE(config::parse_language("").has_value());
}

TEST_F(ConfigFile, SectionKeyWinsOverTopLevel) {
    write("language = en\n[display]\nlanguage = punjabi\n");
    EXPECT_EQ(config::load_options(path_).language, Language::Punjabi);
    write("language = gurmukhi\n");
    EXPECT_EQ(config::load_options(path_).language, Language::Punjabi);
}

TEST_F(ConfigFile, UnknownLanguageFallsBackToEnglish) {
    write("[display]\nlanguage = \"klingon\"\n");
    EXPECT_EQ(config::load_options(path_).language, Language::English);
}

TEST_F(ConfigFile, LanguageFlowsIntoConversion) {
    write("[display]\nlanguage = pa\n");
    config::Options opts = config::load_options(path_);
    nanakshahi::NanakshahiDate d = config::to_nanakshahi(opts, 2025, 3, 14);
    EXPECT_EQ(d.year, 557);
    EXPECT_EQ(d.month, 1);
    EXPECT_EQ(d.month_name, "ਚੇਤ");
    nanakshahi::NanakshahiDate now = config::today(opts);
    EXPECT_EQ(now.month_name, nanakshahi::month_name_pa(now.month));

    config::Options english;
    EXPECT_EQ(config::to_nanakshahi(english, 2025, 3, 13).month_name, "Phaggan");
}

#if !defined(_WIN32)
class ConfigPath : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"NANAKSHAHI_CONFIG", "XDG_CONFIG_HOME", "HOME"}) {
            const char* v = std::getenv(name);
            saved_.push_back({name, v ? std::optional<std::string>(v) : std::nullopt});
            ::unsetenv(name);
        }
    }
    void TearDown() override {
        for (auto &s : saved_) {
            if (s.second) ::setenv(s.first, s.second->c_str(), 1); else ::unsetenv(s.first);
        }
    }
    std::vector<std::pair<const char*, std::optional<std::string>>> saved_;
};

TEST_F(ConfigPath, ExplicitOverrideWins) {
    ::setenv("NANAKSHAHI_CONFIG", "/tmp/custom.toml", 1);
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(platform::resolve_config_path().string(), "/tmp/custom.toml");
}

TEST_F(ConfigPath, XdgBeforeHome) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    ::setenv("HOME", "/tmp/home", 1);
    EXPECT_EQ(platform::resolve_config_path().string(), "/tmp/xdg/nanakshahi/config.toml");
    ::unsetenv("XDG_CONFIG_HOME");
    EXPECT_EQ(platform::resolve_config_path().string(), "/tmp/home/.config/nanakshahi/config.toml");
}

TEST_F(ConfigPath, EmptyVariablesAreIgnored) {
    ::setenv("NANAKSHAHI_CONFIG", "", 1);
    EXPECT_EQ(platform::resolve_config_path().string(), "nanakshahi.toml");
}

TEST_F(ConfigPath, DefaultOptionsReadResolvedFile) {
    fs::path p = fs::temp_directory_path() / "nanakshahi_default_options.toml";
    { std::ofstream out(p); out << "language = pa\n"; }
    ::setenv("NANAKSHAHI_CONFIG", p.c_str(), 1);
    EXPECT_EQ(config::load_default_options().language, Language::Punjabi);
    std::error_code ec; fs::remove(p, ec);
}
#endif
