// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config_parser.hpp"

namespace fs = std::filesystem;

namespace cloudphoto {
namespace config {
namespace test {

namespace {

const char* kFullConfig = R"(
storage:
  bucket: my-photos
  endpoint_url: https://storage.example.net
  region: eu-west-1
  access_key: AKIDEXAMPLE
  secret_key: secret
  max_retries: 2
site:
  website_domain: website.example.net
  staging_dir: /var/tmp/site
  title: Family photos
  keep_staging: false
logging:
  console:
    level: debug
    colors: false
  file:
    enabled: true
    directory: /var/log/cloudphoto
    format: json
)";

}  // namespace

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("cloudphoto_config_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  static CloudphotoConfig validConfig() {
    CloudphotoConfig config;
    config.storage.bucket = "my-photos";
    config.storage.access_key = "AKIDEXAMPLE";
    config.storage.secret_key = "secret";
    return config;
  }

  fs::path test_dir_;
  ConfigParser parser_;
};

TEST_F(ConfigParserTest, ParsesAllSections) {
  CloudphotoConfig config;
  ASSERT_TRUE(parser_.load_from_string(kFullConfig, config)) << parser_.get_last_error();

  EXPECT_EQ(config.storage.bucket, "my-photos");
  EXPECT_EQ(config.storage.endpoint_url, "https://storage.example.net");
  EXPECT_EQ(config.storage.region, "eu-west-1");
  EXPECT_EQ(config.storage.access_key, "AKIDEXAMPLE");
  EXPECT_EQ(config.storage.secret_key, "secret");
  EXPECT_EQ(config.storage.max_sdk_retries, 2);

  EXPECT_EQ(config.site.website_domain, "website.example.net");
  EXPECT_EQ(config.site.staging_dir, "/var/tmp/site");
  EXPECT_EQ(config.site.title, "Family photos");
  EXPECT_FALSE(config.site.keep_staging);

  EXPECT_EQ(config.logging.console_level, logging::severity_level::debug);
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_config.directory, "/var/log/cloudphoto");
  EXPECT_TRUE(config.logging.file_config.format_json);
}

TEST_F(ConfigParserTest, MissingKeysKeepDefaults) {
  CloudphotoConfig config;
  ASSERT_TRUE(parser_.load_from_string("storage:\n  bucket: b\n", config));

  EXPECT_EQ(config.storage.bucket, "b");
  EXPECT_EQ(config.storage.endpoint_url, "https://storage.yandexcloud.net");
  EXPECT_EQ(config.storage.region, "ru-central1");
  EXPECT_EQ(config.storage.max_sdk_retries, 0);
  EXPECT_EQ(config.site.website_domain, "website.yandexcloud.net");
  EXPECT_EQ(config.site.title, "Photo archive");
  EXPECT_EQ(config.logging.console_level, logging::severity_level::warn);
  EXPECT_FALSE(config.logging.file_enabled);
}

TEST_F(ConfigParserTest, InvalidYamlFails) {
  CloudphotoConfig config;
  EXPECT_FALSE(parser_.load_from_string("storage: [unclosed", config));
  EXPECT_NE(parser_.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(ConfigParserTest, InvalidLogLevelFails) {
  CloudphotoConfig config;
  EXPECT_FALSE(parser_.load_from_string("logging:\n  console:\n    level: loud\n", config));
  EXPECT_NE(parser_.get_last_error().find("loud"), std::string::npos);
}

TEST_F(ConfigParserTest, InvalidFileFormatFails) {
  CloudphotoConfig config;
  EXPECT_FALSE(parser_.load_from_string("logging:\n  file:\n    format: xml\n", config));
}

TEST_F(ConfigParserTest, MissingFileFails) {
  CloudphotoConfig config;
  EXPECT_FALSE(parser_.load_from_file((test_dir_ / "absent.yaml").string(), config));
  EXPECT_NE(parser_.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, SaveThenLoadKeepsValues) {
  CloudphotoConfig config = validConfig();
  config.site.title = "Trips";
  config.logging.console_level = logging::severity_level::error;
  config.logging.file_config.format_json = true;

  std::string path = (test_dir_ / "nested" / "cloudphotorc.yaml").string();
  ASSERT_TRUE(parser_.save_to_file(path, config)) << parser_.get_last_error();

  CloudphotoConfig loaded;
  ASSERT_TRUE(parser_.load_from_file(path, loaded)) << parser_.get_last_error();
  EXPECT_EQ(loaded.storage.bucket, "my-photos");
  EXPECT_EQ(loaded.storage.secret_key, "secret");
  EXPECT_EQ(loaded.site.title, "Trips");
  EXPECT_EQ(loaded.logging.console_level, logging::severity_level::error);
  EXPECT_TRUE(loaded.logging.file_config.format_json);
}

TEST_F(ConfigParserTest, SavedFileIsOwnerOnly) {
  std::string path = (test_dir_ / "cloudphotorc.yaml").string();
  ASSERT_TRUE(parser_.save_to_file(path, validConfig()));

  auto perms = fs::status(path).permissions();
  EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(ConfigParserTest, ValidateRequiresBucketAndCredentials) {
  std::string error;
  EXPECT_TRUE(ConfigParser::validate(validConfig(), error));

  auto no_bucket = validConfig();
  no_bucket.storage.bucket.clear();
  EXPECT_FALSE(ConfigParser::validate(no_bucket, error));
  EXPECT_NE(error.find("bucket"), std::string::npos);

  auto no_access = validConfig();
  no_access.storage.access_key.clear();
  EXPECT_FALSE(ConfigParser::validate(no_access, error));
  EXPECT_NE(error.find("access_key"), std::string::npos);

  auto no_secret = validConfig();
  no_secret.storage.secret_key.clear();
  EXPECT_FALSE(ConfigParser::validate(no_secret, error));
  EXPECT_NE(error.find("secret_key"), std::string::npos);
}

TEST(ConfigPathTest, ExpandHome) {
  const char* home = std::getenv("HOME");
  if (!home) {
    GTEST_SKIP() << "HOME not set";
  }
  EXPECT_EQ(expand_home("~/photos"), std::string(home) + "/photos");
  EXPECT_EQ(expand_home("/abs/path"), "/abs/path");
  EXPECT_EQ(expand_home("~other/x"), "~other/x");
}

TEST(ConfigPathTest, EnvironmentOverridesDefaultPath) {
  setenv("CLOUDPHOTO_CONFIG", "/etc/cloudphoto.yaml", 1);
  EXPECT_EQ(default_config_path(), "/etc/cloudphoto.yaml");
  unsetenv("CLOUDPHOTO_CONFIG");
  EXPECT_NE(default_config_path().find(".config/cloudphoto/cloudphotorc.yaml"), std::string::npos);
}

TEST(CredentialFallbackTest, FillsOnlyEmptyCredentials) {
  setenv("AWS_ACCESS_KEY_ID", "env-access", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "env-secret", 1);

  store::StoreConfig empty;
  apply_credential_env_fallbacks(empty);
  EXPECT_EQ(empty.access_key, "env-access");
  EXPECT_EQ(empty.secret_key, "env-secret");

  store::StoreConfig explicit_keys;
  explicit_keys.access_key = "file-access";
  explicit_keys.secret_key = "file-secret";
  apply_credential_env_fallbacks(explicit_keys);
  EXPECT_EQ(explicit_keys.access_key, "file-access");
  EXPECT_EQ(explicit_keys.secret_key, "file-secret");

  unsetenv("AWS_ACCESS_KEY_ID");
  unsetenv("AWS_SECRET_ACCESS_KEY");
}

}  // namespace test
}  // namespace config
}  // namespace cloudphoto
