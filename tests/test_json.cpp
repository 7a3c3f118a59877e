#include <gtest/gtest.h>

#include <stdexcept>

#include "engage/json.hpp"

using engage::Json;

TEST(JsonTest, ParsesNestedDocument)
{
    Json doc = Json::parse(R"({"jobs": [{"action": "like", "retries": 3, "ok": true, "note": null}], "ratio": 0.65})");

    ASSERT_TRUE(doc.is_object());
    const Json& jobs = doc["jobs"];
    ASSERT_TRUE(jobs.is_array());
    ASSERT_EQ(jobs.as_array().size(), 1u);
    EXPECT_EQ(jobs[0].get_string("action"), "like");
    EXPECT_EQ(jobs[0].get_int("retries"), 3);
    EXPECT_TRUE(jobs[0].get_bool("ok"));
    EXPECT_TRUE(jobs[0]["note"].is_null());
    EXPECT_DOUBLE_EQ(doc.get_number("ratio"), 0.65);
}

TEST(JsonTest, GettersFallBackForMissingOrNullKeys)
{
    Json doc = Json::parse(R"({"name": null})");

    EXPECT_EQ(doc.get_string("name", "engage"), "engage");
    EXPECT_EQ(doc.get_int("port", 1883), 1883);
    EXPECT_FALSE(doc.get_bool("grayscale", false));
    EXPECT_FALSE(doc.contains("port"));
}

TEST(JsonTest, GettersRejectWrongTypes)
{
    Json doc = Json::parse(R"({"port": "1883", "flag": 1, "name": 5})");

    EXPECT_THROW(doc.get_int("port"), std::runtime_error);
    EXPECT_THROW(doc.get_bool("flag"), std::runtime_error);
    EXPECT_THROW(doc.get_string("name"), std::runtime_error);
}

TEST(JsonTest, DumpsCompactWithSortedKeysAndIntegralNumbers)
{
    Json value = Json::object();
    value["y"] = 1440;
    value["x"] = 230;
    value["confidence"] = 0.5;
    value["error"] = nullptr;
    value["items"] = Json::array();
    value["items"].push_back("a");
    value["items"].push_back(true);

    EXPECT_EQ(value.dump(), R"({"confidence":0.5,"error":null,"items":["a",true],"x":230,"y":1440})");
}

TEST(JsonTest, EscapesControlCharactersAndQuotes)
{
    Json value("line\n\"quoted\"\x01");
    EXPECT_EQ(value.dump(), "\"line\\n\\\"quoted\\\"\\u0001\"");
}

TEST(JsonTest, DecodesUnicodeEscapes)
{
    Json value = Json::parse(R"("caf\u00e9 \ud83d\ude00")");
    EXPECT_EQ(value.as_string(), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonTest, PrettyDumpRoundTrips)
{
    Json original = Json::parse(R"({"a": [1, 2, {"b": "c"}], "d": {}})");
    Json reparsed = Json::parse(original.dump(2));
    EXPECT_EQ(reparsed.dump(), original.dump());
}

TEST(JsonTest, RejectsMalformedInput)
{
    EXPECT_THROW(Json::parse("{\"a\": }"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1, 2"), std::runtime_error);
    EXPECT_THROW(Json::parse("{} trailing"), std::runtime_error);
    EXPECT_THROW(Json::parse("\"\\u12\""), std::runtime_error);
    EXPECT_THROW(Json::parse_file("/nonexistent/engage.json"), std::runtime_error);
}
