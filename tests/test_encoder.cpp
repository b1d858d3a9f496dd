/**
 * @file test_encoder.cpp
 * @brief Unit tests for Encoder and encode().
 */

#include <nelf/encoder.hpp>

#include <catch2/catch.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

using namespace nelf;

static std::string as_string(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

TEST_CASE("decimal_digits", "[encoder]") {
    REQUIRE(decimal_digits(0) == 1);
    REQUIRE(decimal_digits(9) == 1);
    REQUIRE(decimal_digits(10) == 2);
    REQUIRE(decimal_digits(99) == 2);
    REQUIRE(decimal_digits(100) == 3);
    REQUIRE(decimal_digits(12345) == 5);
}

TEST_CASE("encode reference list", "[encoder]") {
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode({"hello", "", "a,b"}, output, error) == Error::Ok);
    REQUIRE(error.ok());
    REQUIRE(as_string(output) == "5:hello,0:,3:a,b,");
}

TEST_CASE("encode empty list", "[encoder]") {
    std::vector<std::string> empty;
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode(empty, output, error) == Error::Ok);
    REQUIRE(output.empty());
}

TEST_CASE("encode multi-digit lengths", "[encoder]") {
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode({"0123456789"}, output, error) == Error::Ok);
    REQUIRE(as_string(output) == "10:0123456789,");

    output.clear();
    std::string big(1234, 'q');
    REQUIRE(encode(std::vector<std::string>{big}, output, error) == Error::Ok);
    REQUIRE(as_string(output) == "1234:" + big + ",");
}

TEST_CASE("encode accepts string-like element types", "[encoder]") {
    std::vector<std::uint8_t> output;
    ParseError error;

    SECTION("std::string") {
        std::vector<std::string> list{"ab", "c"};
        REQUIRE(encode(list, output, error) == Error::Ok);
        REQUIRE(as_string(output) == "2:ab,1:c,");
    }

    SECTION("const char*") {
        std::array<const char*, 2> list{"x", "yz"};
        REQUIRE(encode(list, output, error) == Error::Ok);
        REQUIRE(as_string(output) == "1:x,2:yz,");
    }

    SECTION("byte vectors with embedded NUL") {
        std::vector<std::vector<std::uint8_t>> list{{0x00, 0x3A, 0x2C}, {}};
        REQUIRE(encode(list, output, error) == Error::Ok);
        REQUIRE(as_string(output) == std::string("3:\x00:,,0:,", 9));
    }

    SECTION("byte arrays") {
        std::vector<std::array<std::uint8_t, 2>> list{{{'h', 'i'}}};
        REQUIRE(encode(list, output, error) == Error::Ok);
        REQUIRE(as_string(output) == "2:hi,");
    }
}

TEST_CASE("encode with alternate framing bytes", "[encoder]") {
    Config config;
    config.separator = '|';
    config.terminator = '\n';
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode({"a:b", ""}, output, error, config) == Error::Ok);
    REQUIRE(as_string(output) == "3|a:b\n0|\n");
}

TEST_CASE("encode rejects oversized elements", "[encoder]") {
    Config config;
    config.max_element_length = 3;
    std::vector<std::uint8_t> output;
    ParseError error;

    SECTION("output restored on failure") {
        REQUIRE(encode({"ab", "abcd", "c"}, output, error, config) == Error::ElementTooLarge);
        REQUIRE(error.code == Error::ElementTooLarge);
        // "2:ab," precedes the rejected element
        REQUIRE(error.offset == 5);
        REQUIRE(output.empty());
    }

    SECTION("existing output content is kept") {
        output = {'x', 'y', 'z'};
        REQUIRE(encode({"ab", "abcd"}, output, error, config) == Error::ElementTooLarge);
        REQUIRE(error.offset == 8);
        REQUIRE(as_string(output) == "xyz");
    }

    SECTION("exactly the maximum is accepted") {
        REQUIRE(encode({"abc"}, output, error, config) == Error::Ok);
        REQUIRE(as_string(output) == "3:abc,");
    }
}

TEST_CASE("encode rejects invalid configuration", "[encoder]") {
    Config config;
    config.separator = '4';
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode({"a"}, output, error, config) == Error::InvalidConfig);
    REQUIRE(output.empty());
}

TEST_CASE("Encoder incremental append", "[encoder]") {
    std::vector<std::uint8_t> output;
    Encoder encoder(output);

    REQUIRE(encoder.count() == 0);
    REQUIRE(encoder.append(std::string_view("one")) == Error::Ok);
    REQUIRE(encoder.append(std::string("")) == Error::Ok);

    const std::uint8_t raw[] = {'7', ','};
    REQUIRE(encoder.append(raw, sizeof(raw)) == Error::Ok);

    REQUIRE(encoder.count() == 3);
    REQUIRE(encoder.size() == output.size());
    REQUIRE(as_string(output) == "3:one,0:,2:7,,");
    REQUIRE(encoder.error().ok());
}

TEST_CASE("Encoder stays usable after a rejected element", "[encoder]") {
    Config config;
    config.max_element_length = 2;
    std::vector<std::uint8_t> output;
    Encoder encoder(output, config);

    REQUIRE(encoder.append("toolong") == Error::ElementTooLarge);
    REQUIRE(encoder.error().code == Error::ElementTooLarge);
    REQUIRE(output.empty());

    REQUIRE(encoder.append("ok") == Error::Ok);
    REQUIRE(as_string(output) == "2:ok,");
    REQUIRE(encoder.count() == 1);
}

TEST_CASE("Encoder append_all is all or nothing", "[encoder]") {
    Config config;
    config.max_element_length = 2;
    std::vector<std::uint8_t> output;
    Encoder encoder(output, config);

    REQUIRE(encoder.append("a") == Error::Ok);

    std::vector<std::string> batch{"b", "c", "ddd"};
    REQUIRE(encoder.append_all(batch.begin(), batch.end()) == Error::ElementTooLarge);
    REQUIRE(encoder.count() == 1);
    REQUIRE(as_string(output) == "1:a,");
}

TEST_CASE("encoded_size matches encode output", "[encoder]") {
    std::vector<std::string> list{"", "a", std::string(9, 'b'), std::string(10, 'c'),
                                  std::string(1000, 'd')};
    std::vector<std::uint8_t> output;
    ParseError error;

    REQUIRE(encode(list, output, error) == Error::Ok);
    REQUIRE(encoded_size(list) == output.size());
    REQUIRE(element_size(0) == 3);
    REQUIRE(element_size(10) == 14);
}
