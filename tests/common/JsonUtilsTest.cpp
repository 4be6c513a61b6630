#include "common/JsonUtils.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <limits>
#include <regex>
#include <string>

namespace GAIA {
namespace Test {

class JsonUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("gaia_json_utils_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

TEST_F(JsonUtilsTest, ParseValidJson) {
    auto parsed = JsonUtils::parseJson(R"({"id": "TC001", "count": 3})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["id"], "TC001");
    EXPECT_EQ((*parsed)["count"], 3);
}

TEST_F(JsonUtilsTest, ParseInvalidJsonReportsError) {
    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("{not json", &error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(JsonUtils::parseJson("", &error).has_value());
    EXPECT_EQ(error, "Empty JSON string");
}

TEST_F(JsonUtilsTest, TypedGettersFallBackOnMissingOrWrongType) {
    json object{{"name", "login"}, {"count", 7}, {"flag", true}, {"ratio", 0.5}, {"wrong", json::array()}};

    EXPECT_EQ(JsonUtils::getString(object, "name"), "login");
    EXPECT_EQ(JsonUtils::getString(object, "count", "fallback"), "fallback");
    EXPECT_EQ(JsonUtils::getString(object, "missing", "fallback"), "fallback");

    EXPECT_EQ(JsonUtils::getInt(object, "count"), 7);
    EXPECT_EQ(JsonUtils::getInt(object, "name", -1), -1);

    EXPECT_TRUE(JsonUtils::getBool(object, "flag"));
    EXPECT_TRUE(JsonUtils::getBool(object, "wrong", true));

    EXPECT_DOUBLE_EQ(JsonUtils::getDouble(object, "ratio"), 0.5);
    EXPECT_DOUBLE_EQ(JsonUtils::getDouble(object, "count"), 7.0);

    EXPECT_EQ(JsonUtils::getString(json::array(), "name", "x"), "x");
}

TEST_F(JsonUtilsTest, LargeIntegersSaturateInsteadOfWrapping) {
    json object = json::parse(R"({"big": 4294967298, "huge": 18446744073709551615, "low": -4294967298})");

    EXPECT_EQ(JsonUtils::getInt(object, "big"), std::numeric_limits<int>::max());
    EXPECT_EQ(JsonUtils::getInt(object, "huge"), std::numeric_limits<int>::max());
    EXPECT_EQ(JsonUtils::getInt(object, "low"), std::numeric_limits<int>::min());

    EXPECT_EQ(JsonUtils::getInt64(object, "big"), 4294967298LL);
    EXPECT_EQ(JsonUtils::getInt64(object, "huge"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(JsonUtils::getInt64(object, "low"), -4294967298LL);
    EXPECT_EQ(JsonUtils::getInt64(object, "missing", 9), 9);
}

TEST_F(JsonUtilsTest, HasKeyIgnoresNull) {
    json object{{"present", 1}, {"empty", nullptr}};
    EXPECT_TRUE(JsonUtils::hasKey(object, "present"));
    EXPECT_FALSE(JsonUtils::hasKey(object, "empty"));
    EXPECT_FALSE(JsonUtils::hasKey(object, "missing"));
}

TEST_F(JsonUtilsTest, WriteFileCreatesParentDirectories) {
    std::string path = (tempDir_ / "nested" / "out.json").string();
    json value{{"entries", json::array({1, 2, 3})}};

    std::string error;
    ASSERT_TRUE(JsonUtils::writeFile(path, value, &error)) << error;

    auto loaded = JsonUtils::loadFile(path, &error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(*loaded, value);
}

TEST_F(JsonUtilsTest, WriteFileOutputIsIndented) {
    std::string path = (tempDir_ / "pretty.json").string();
    ASSERT_TRUE(JsonUtils::writeFile(path, json{{"a", 1}}));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("\n  \"a\": 1"), std::string::npos) << content;
}

TEST_F(JsonUtilsTest, LoadMissingFileFails) {
    std::string error;
    EXPECT_FALSE(JsonUtils::loadFile((tempDir_ / "absent.json").string(), &error).has_value());
    EXPECT_NE(error.find("Cannot open file"), std::string::npos);
}

TEST_F(JsonUtilsTest, UtcTimestampIsIso8601WithMilliseconds) {
    std::string timestamp = JsonUtils::utcTimestamp();
    std::regex pattern(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z$)");
    EXPECT_TRUE(std::regex_match(timestamp, pattern)) << timestamp;
}

}  // namespace Test
}  // namespace GAIA
