// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации сканирования (GoogleTest)
// ==============================================================================
//
// MOD-0005: config
// ADR-0004: yaml-cpp для конфигурационных файлов
// ADR-0008: GoogleTest
//
// TST-CONFIG-001..TST-CONFIG-004
//
// ==============================================================================

#include "flexscan/config.hpp"

#include "flexscan/cli.hpp"
#include "flexscan/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#else
#include <process.h>
#endif

namespace flexscan::config::test {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("flexscan_config_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      _getpid()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path create_config_file(const std::string& content) {
        fs::path path = temp_dir_ / "flexscan.yml";
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path temp_dir_;
};

// ==============================================================================
// TST-CONFIG-001: Значения по умолчанию
// ==============================================================================

TEST(ConfigDefaultsTest, Defaults) {
    ScanConfig cfg;
    EXPECT_EQ(cfg.az_path, "az");
    EXPECT_EQ(platform::path_to_utf8(cfg.full_output), "flex_migration_all.json");
    EXPECT_EQ(platform::path_to_utf8(cfg.summary_output), "flex_migration_summary.json");
    EXPECT_FALSE(cfg.skip_install);
    EXPECT_TRUE(cfg.scope_per_call);
    EXPECT_EQ(cfg.timeout_seconds, 300u);
    EXPECT_EQ(cfg.timeout(), std::chrono::milliseconds(300000));
    EXPECT_TRUE(cfg.extensions.empty());
}

// ==============================================================================
// TST-CONFIG-002: Разбор YAML
// ==============================================================================

TEST(ConfigParseTest, EmptyDocument_Defaults) {
    auto result = parse_config("");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.config.az_path, "az");
}

TEST(ConfigParseTest, AllKeys) {
    auto result = parse_config(
        "az_path: /opt/az/bin/az\n"
        "full_output: out/all.json\n"
        "summary_output: out/summary.json\n"
        "skip_install: true\n"
        "timeout_seconds: 120\n"
        "scope_per_call: false\n"
        "extensions:\n"
        "  - functionapp\n"
        "  - resource-graph\n");

    ASSERT_TRUE(result) << result.error;
    const auto& cfg = result.config;
    EXPECT_EQ(cfg.az_path, "/opt/az/bin/az");
    EXPECT_EQ(platform::path_to_utf8(cfg.full_output), "out/all.json");
    EXPECT_EQ(platform::path_to_utf8(cfg.summary_output), "out/summary.json");
    EXPECT_TRUE(cfg.skip_install);
    EXPECT_EQ(cfg.timeout_seconds, 120u);
    EXPECT_FALSE(cfg.scope_per_call);
    EXPECT_EQ(cfg.extensions, (std::vector<std::string>{"functionapp", "resource-graph"}));
}

TEST(ConfigParseTest, PartialKeys_KeepBase) {
    ScanConfig base;
    base.az_path = "custom-az";
    auto result = parse_config("skip_install: yes\n", base);

    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.az_path, "custom-az");
    EXPECT_TRUE(result.config.skip_install);
}

TEST(ConfigParseTest, UnknownKey_Error) {
    auto result = parse_config("az: az\n");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("unknown configuration key 'az'"), std::string::npos);
}

TEST(ConfigParseTest, NotMapping_Error) {
    auto result = parse_config("- a\n- b\n");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("mapping"), std::string::npos);
}

TEST(ConfigParseTest, InvalidYaml_Error) {
    auto result = parse_config("az_path: [unclosed\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.rfind("YAML parse error", 0), 0u);
}

TEST(ConfigParseTest, BadTypes_Error) {
    EXPECT_FALSE(parse_config("timeout_seconds: soon\n"));
    EXPECT_FALSE(parse_config("skip_install: maybe\n"));
    EXPECT_FALSE(parse_config("extensions: functionapp\n"));
}

TEST(ConfigParseTest, TimeoutOutOfRange_Error) {
    EXPECT_FALSE(parse_config("timeout_seconds: 0\n"));
    EXPECT_FALSE(parse_config("timeout_seconds: -5\n"));
    EXPECT_FALSE(parse_config("timeout_seconds: 86401\n"));
    EXPECT_TRUE(parse_config("timeout_seconds: 86400\n"));
}

TEST(ConfigParseTest, EmptyAzPath_Error) {
    auto result = parse_config("az_path: ''\n");
    EXPECT_FALSE(result);
}

// ==============================================================================
// TST-CONFIG-003: Загрузка файла
// ==============================================================================

TEST_F(ConfigTest, LoadConfig_File) {
    auto path = create_config_file("timeout_seconds: 45\n");
    auto result = load_config(path);

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.config.timeout_seconds, 45u);
}

TEST_F(ConfigTest, LoadConfig_MissingFile_Error) {
    auto result = load_config(temp_dir_ / "absent.yml");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.rfind("cannot open configuration file", 0), 0u);
}

TEST_F(ConfigTest, LoadConfig_ErrorPrefixedWithPath) {
    auto path = create_config_file("bogus: 1\n");
    auto result = load_config(path);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.rfind(platform::path_to_utf8(path), 0), 0u);
}

// ==============================================================================
// TST-CONFIG-004: Приоритет: defaults < файл < CLI
// ==============================================================================

TEST_F(ConfigTest, Resolve_CliOverridesFile) {
    auto path = create_config_file(
        "az_path: file-az\n"
        "timeout_seconds: 45\n"
        "full_output: file-all.json\n"
        "extensions: [functionapp]\n");

    cli::ScanCommand cmd;
    cmd.config = path;
    cmd.timeout_seconds = 10;
    cmd.extensions = {"resource-graph"};
    cmd.no_scope_per_call = true;

    auto result = resolve(cmd);

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.config.az_path, "file-az");
    EXPECT_EQ(result.config.timeout_seconds, 10u);
    EXPECT_EQ(platform::path_to_utf8(result.config.full_output), "file-all.json");
    EXPECT_EQ(platform::path_to_utf8(result.config.summary_output), "flex_migration_summary.json");
    EXPECT_FALSE(result.config.scope_per_call);
    EXPECT_EQ(result.config.extensions,
              (std::vector<std::string>{"functionapp", "resource-graph"}));
}

TEST_F(ConfigTest, Resolve_NoConfigFile_DefaultsPlusCli) {
    cli::ScanCommand cmd;
    cmd.az_path = "my-az";
    cmd.skip_install = true;

    auto result = resolve(cmd);

    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.az_path, "my-az");
    EXPECT_TRUE(result.config.skip_install);
    EXPECT_EQ(result.config.timeout_seconds, 300u);
}

TEST_F(ConfigTest, Resolve_BadFile_Error) {
    cli::ScanCommand cmd;
    cmd.config = temp_dir_ / "absent.yml";

    auto result = resolve(cmd);

    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.empty());
}

}  // namespace flexscan::config::test
