#include <gtest/gtest.h>
#include <deviceid/json.hpp>

#include "test_helpers.hpp"

#include <string>

namespace deviceid {
namespace {

using testing_support::TempDirectory;
using testing_support::write_file;

// ==================== JSON Parsing Tests ====================

TEST(ConfigJsonTest, ParsesAllKeys) {
    auto j = nlohmann::json::parse(
        R"({"storage_dir": "/var/lib/app", "id_file_name": "machine", "log_level": "info"})");

    auto config = json::parse_config(j);

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().storage_dir, "/var/lib/app");
    EXPECT_EQ(config.value().id_file_name, "machine");
    EXPECT_EQ(config.value().log_level, "info");
}

TEST(ConfigJsonTest, MissingAndNullKeysKeepDefaults) {
    auto j = nlohmann::json::parse(R"({"storage_dir": null, "unrelated": 5})");

    auto config = json::parse_config(j);

    ASSERT_TRUE(config.is_ok());
    EXPECT_TRUE(config.value().storage_dir.empty());
    EXPECT_TRUE(config.value().id_file_name.empty());
    EXPECT_TRUE(config.value().log_level.empty());
}

TEST(ConfigJsonTest, NonStringValueIsConfigError) {
    auto j = nlohmann::json::parse(R"({"id_file_name": 42})");

    auto config = json::parse_config(j);

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error_code(), ErrorCode::ConfigError);
    EXPECT_NE(config.error_message().find("id_file_name"), std::string::npos);
}

TEST(ConfigJsonTest, NonObjectIsConfigError) {
    auto config = json::parse_config(nlohmann::json::array({"storage_dir"}));

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error_code(), ErrorCode::ConfigError);
}

TEST(ConfigJsonTest, SerializationOmitsEmptyFields) {
    Config config;
    config.id_file_name = "machine";

    auto j = json::config_to_json(config);

    EXPECT_FALSE(j.contains("storage_dir"));
    EXPECT_EQ(j["id_file_name"], "machine");
}

TEST(ConfigJsonTest, SerializedConfigParsesBack) {
    Config config;
    config.storage_dir = "/opt/state";
    config.id_file_name = "id";

    auto parsed = json::parse_config(json::config_to_json(config));

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().storage_dir, "/opt/state");
    EXPECT_EQ(parsed.value().id_file_name, "id");
}

// ==================== File Loading Tests ====================

TEST(LoadConfigTest, LoadsFile) {
    TempDirectory temp_dir;
    auto path = temp_dir.path() / "deviceid.json";
    write_file(path, R"({"storage_dir": "/tmp/custom", "id_file_name": "my-id"})");

    auto config = load_config(path.string());

    ASSERT_TRUE(config.is_ok()) << config.error_message();
    EXPECT_EQ(config.value().storage_dir, "/tmp/custom");
    EXPECT_EQ(config.value().id_file_name, "my-id");
}

TEST(LoadConfigTest, MissingFileIsConfigError) {
    TempDirectory temp_dir;

    auto config = load_config((temp_dir.path() / "absent.json").string());

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error_code(), ErrorCode::ConfigError);
}

TEST(LoadConfigTest, MalformedJsonIsConfigError) {
    TempDirectory temp_dir;
    auto path = temp_dir.path() / "deviceid.json";
    write_file(path, R"({"storage_dir": )");

    auto config = load_config(path.string());

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error_code(), ErrorCode::ConfigError);
    EXPECT_NE(config.error_message().find(path.string()), std::string::npos);
}

TEST(LoadConfigTest, WrongTypeIsConfigError) {
    TempDirectory temp_dir;
    auto path = temp_dir.path() / "deviceid.json";
    write_file(path, R"({"storage_dir": ["a", "b"]})");

    auto config = load_config(path.string());

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error_code(), ErrorCode::ConfigError);
}

}  // namespace
}  // namespace deviceid
