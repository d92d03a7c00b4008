/**
 * @file second_entry_codec_test.cpp
 * @brief Unit tests for the second-entry snapshot encoding
 */

#include <catch2/catch_test_macros.hpp>

#include <dde/storage/second_entry_codec.hpp>

using namespace dde::storage;

TEST_CASE("encode_second_entry writes an array ordered by item", "[codec]") {
    second_entry_snapshot snapshot{{102, "80"}, {101, "120"}};

    CHECK(encode_second_entry(snapshot) ==
          R"([{"itemId":101,"value":"120"},{"itemId":102,"value":"80"}])");
    CHECK(encode_second_entry({}) == "[]");
}

TEST_CASE("encode_second_entry escapes special characters", "[codec]") {
    second_entry_snapshot snapshot{{7, "say \"hi\"\\\n"}};

    auto text = encode_second_entry(snapshot);
    CHECK(text == R"([{"itemId":7,"value":"say \"hi\"\\\n"}])");

    auto decoded = decode_second_entry(text);
    REQUIRE(decoded.has_value());
    CHECK(decoded->at(7) == "say \"hi\"\\\n");
}

TEST_CASE("decode_second_entry accepts loosely typed input", "[codec]") {
    SECTION("string item ids and numeric values") {
        auto decoded = decode_second_entry(
            R"([ {"itemId":"101","value":120}, {"value":"Yes","itemId":102} ])");
        REQUIRE(decoded.has_value());
        CHECK(decoded->size() == 2);
        CHECK(decoded->at(101) == "120");
        CHECK(decoded->at(102) == "Yes");
    }

    SECTION("null and boolean values") {
        auto decoded = decode_second_entry(
            R"([{"itemId":1,"value":null},{"itemId":2,"value":true}])");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(1).empty());
        CHECK(decoded->at(2) == "true");
    }

    SECTION("missing value decodes as empty") {
        auto decoded = decode_second_entry(R"([{"itemId":5}])");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(5).empty());
    }

    SECTION("unknown members are skipped") {
        auto decoded = decode_second_entry(
            R"([{"itemId":3,"itemName":"SYSBP","value":"118","ordinal":1}])");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(3) == "118");
    }

    SECTION("unicode escapes") {
        auto decoded = decode_second_entry("[{\"itemId\":4,\"value\":\"caf\\u00e9\"}]");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(4) == "caf\xC3\xA9");
    }

    SECTION("escaped surrogate pairs") {
        auto decoded = decode_second_entry(
            "[{\"itemId\":1,\"value\":\"\\uD83D\\uDE00\"},"
            "{\"itemId\":2,\"value\":\"a\\ud834\\udd1eb\"}]");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(1) == "\xF0\x9F\x98\x80");
        CHECK(decoded->at(2) == "a\xF0\x9D\x84\x9E" "b");
    }

    SECTION("raw UTF-8 passes through") {
        auto decoded = decode_second_entry("[{\"itemId\":4,\"value\":\"caf\xC3\xA9\"}]");
        REQUIRE(decoded.has_value());
        CHECK(decoded->at(4) == "caf\xC3\xA9");
    }

    SECTION("empty array") {
        auto decoded = decode_second_entry("  [ ]  ");
        REQUIRE(decoded.has_value());
        CHECK(decoded->empty());
    }
}

TEST_CASE("decode_second_entry rejects malformed text", "[codec]") {
    CHECK_FALSE(decode_second_entry("").has_value());
    CHECK_FALSE(decode_second_entry("not json").has_value());
    CHECK_FALSE(decode_second_entry(R"({"itemId":1,"value":"x"})").has_value());
    CHECK_FALSE(decode_second_entry(R"([{"itemId":1,"value":"x"})").has_value());
    CHECK_FALSE(decode_second_entry(R"([{"value":"x"}])").has_value());
    CHECK_FALSE(decode_second_entry(R"([{"itemId":"abc","value":"x"}])").has_value());
    CHECK_FALSE(decode_second_entry(R"([{"itemId":1,"value":{"nested":1}}])").has_value());
    CHECK_FALSE(decode_second_entry(R"([{"itemId":1,"value":"x"}] trailing)").has_value());
}

TEST_CASE("decode_second_entry rejects unpaired surrogates", "[codec]") {
    CHECK_FALSE(decode_second_entry("[{\"itemId\":1,\"value\":\"\\uD83D\"}]").has_value());
    CHECK_FALSE(decode_second_entry("[{\"itemId\":1,\"value\":\"\\uD83Dx\"}]").has_value());
    CHECK_FALSE(decode_second_entry("[{\"itemId\":1,\"value\":\"\\uD83D\\u0041\"}]").has_value());
    CHECK_FALSE(decode_second_entry("[{\"itemId\":1,\"value\":\"\\uDE00\"}]").has_value());
}
