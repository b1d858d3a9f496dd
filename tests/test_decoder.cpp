/**
 * @file test_decoder.cpp
 * @brief Unit tests for Reader and decode().
 */

#include <catch2/catch.hpp>
#include <nelf/decoder.hpp>

#include <string>
#include <string_view>

using namespace nelf;

TEST_CASE("decode reference list", "[decoder]") {
    std::string_view buffer = "5:hello,0:,3:a,b,";
    DecodedList elements;
    ParseError error;

    REQUIRE(decode(buffer, elements, error) == Error::Ok);
    REQUIRE(error.ok());
    REQUIRE(elements == DecodedList{"hello", "", "a,b"});

    // Every element borrows from the source buffer
    REQUIRE((elements[0].data() == buffer.data() + 2));
    REQUIRE((elements[2].data() == buffer.data() + 13));
}

TEST_CASE("decode empty buffer", "[decoder]") {
    DecodedList elements;
    ParseError error;

    REQUIRE(decode("", elements, error) == Error::Ok);
    REQUIRE(elements.empty());

    REQUIRE(decode(nullptr, 0, elements, error) == Error::Ok);
    REQUIRE(elements.empty());
}

TEST_CASE("decode errors", "[decoder]") {
    DecodedList elements;
    ParseError error;

    SECTION("malformed length") {
        REQUIRE(decode("x:abc,", elements, error) == Error::MalformedLength);
        REQUIRE(error.code == Error::MalformedLength);
        REQUIRE(error.offset == 0);
        REQUIRE(elements.empty());
    }

    SECTION("framing error keeps the decoded prefix") {
        REQUIRE(decode("5:hello,3:ab", elements, error) == Error::TruncatedContent);
        REQUIRE(error.offset == 10);
        REQUIRE(elements == DecodedList{"hello"});
    }

    SECTION("encoding error keeps the decoded prefix") {
        std::string_view buffer("2:ok,1:\xC3,", 9);
        REQUIRE(decode(buffer, elements, error) == Error::InvalidEncoding);
        REQUIRE(error.offset == 7);
        REQUIRE(elements == DecodedList{"ok"});
    }

    SECTION("first error in document order wins") {
        // Invalid text in element 1 comes before the framing error in element 2
        std::string_view buffer("1:\xFF,x", 5);
        REQUIRE(decode(buffer, elements, error) == Error::InvalidEncoding);
        REQUIRE(error.offset == 2);
    }

    SECTION("invalid configuration") {
        Config config;
        config.terminator = '0';
        REQUIRE(decode("1:a,", elements, error, config) == Error::InvalidConfig);
        REQUIRE(error.offset == 0);
    }
}

TEST_CASE("decode raw bytes", "[decoder]") {
    Config config;
    config.text_validity = TextValidity::None;

    std::string_view buffer("3:\x00\xFF\xFE,", 6);
    DecodedList elements;
    ParseError error;

    REQUIRE(decode(buffer, elements, error, config) == Error::Ok);
    REQUIRE(elements.size() == 1);
    REQUIRE(elements[0] == std::string_view("\x00\xFF\xFE", 3));
}

TEST_CASE("decode appends to existing list", "[decoder]") {
    DecodedList elements{"before"};
    ParseError error;

    REQUIRE(decode("1:a,", elements, error) == Error::Ok);
    REQUIRE(elements == DecodedList{"before", "a"});
}

TEST_CASE("Reader yields elements lazily", "[decoder][reader]") {
    std::string_view buffer = "5:hello,0:,3:a,b,";
    Reader reader(buffer);
    std::string_view element;

    REQUIRE_FALSE(reader.at_end());
    REQUIRE(reader.next(element) == Error::Ok);
    REQUIRE(element == "hello");
    REQUIRE(reader.count() == 1);
    REQUIRE(reader.position() == 8);

    REQUIRE(reader.next(element) == Error::Ok);
    REQUIRE(element.empty());

    REQUIRE(reader.next(element) == Error::Ok);
    REQUIRE(element == "a,b");

    REQUIRE(reader.at_end());
    REQUIRE(reader.error().ok());
    REQUIRE(reader.count() == 3);

    SECTION("reading past the end") {
        REQUIRE(reader.next(element) == Error::InvalidArg);
        REQUIRE(reader.error().ok());
    }
}

TEST_CASE("Reader views outlive the reader", "[decoder][reader]") {
    std::string buffer = "3:abc,";
    std::string_view element;

    {
        Reader reader(buffer);
        REQUIRE(reader.next(element) == Error::Ok);
    }

    REQUIRE(element == "abc");
    REQUIRE((element.data() == buffer.data() + 2));
}

TEST_CASE("Reader error is sticky", "[decoder][reader]") {
    std::string_view buffer("1:a,1:\x80,1:b,", 12);
    Reader reader(buffer);
    std::string_view element;

    REQUIRE(reader.next(element) == Error::Ok);
    REQUIRE(reader.next(element) == Error::InvalidEncoding);
    REQUIRE(reader.at_end());
    REQUIRE(reader.error().offset == 6);

    // The following well-formed element is never reached
    REQUIRE(reader.next(element) == Error::InvalidEncoding);
    REQUIRE(reader.count() == 1);
}

TEST_CASE("Reader honours the element-count guard", "[decoder][reader]") {
    Config config;
    config.max_elements = 1;
    Reader reader("1:a,1:b,", config);
    std::string_view element;

    REQUIRE(reader.next(element) == Error::Ok);
    REQUIRE(reader.next(element) == Error::TooManyElements);
    REQUIRE(reader.error().offset == 4);
}
