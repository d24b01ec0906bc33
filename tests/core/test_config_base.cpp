// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "tsdiag/core/config_base.hpp"
#include "tsdiag/statistics/test_config.hpp"

using namespace tsdiag;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "tsdiag_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

// Concrete implementation of ConfigBase
class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;

    nlohmann::json partial;
    partial["name"] = "partial";

    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, MissingFileReported) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "does_not_exist.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
    EXPECT_EQ(result.error()->component(), "ConfigBase");
}

TEST_F(ConfigBaseTest, UnwritablePathReported) {
    TestConfig config;
    auto result = config.save_to_file((test_dir / "missing_dir" / "config.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    write_file(file_path, "{ this is not valid JSON }");

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(config.name, "default");
}

TEST_F(ConfigBaseTest, WrongValueTypeHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "wrong_type.json";
    write_file(file_path, R"({"value": "forty-two"})");

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

// Diagnostic test configurations go through the same file path
TEST_F(ConfigBaseTest, TestConfigurationFileRoundTrip) {
    statistics::ADFTestConfig config;
    config.specification = statistics::TestSpecification::TREND;
    config.lags = 3;

    std::filesystem::path file_path = test_dir / "adf.json";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    statistics::ADFTestConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(file_path.string()).is_ok());
    EXPECT_EQ(loaded.specification, statistics::TestSpecification::TREND);
    EXPECT_EQ(loaded.lags, 3);
}

TEST_F(ConfigBaseTest, UnknownSpecificationReportedAsError) {
    std::filesystem::path file_path = test_dir / "bad_spec.json";
    write_file(file_path, R"({"specification": "quadratic", "lags": 2})");

    statistics::ADFTestConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(config.specification, statistics::TestSpecification::DRIFT);
}
