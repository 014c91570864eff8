/**
 * @file test_decoders.cpp
 * @brief Unit tests for the decoders and the decoder table.
 */

#include <catch2/catch_test_macros.hpp>
#include <unravel/decoders.hpp>

#include <string>

using namespace unravel;

TEST_CASE("Base64 decoding", "[decoders]") {
    SECTION("valid input") {
        auto r = decode_base64("SGVsbG8gV29ybGQ=");
        REQUIRE(r.ok());
        REQUIRE(r.text == "Hello World");
        REQUIRE(r.message.empty());
    }

    SECTION("whitespace is ignored") {
        auto r = decode_base64("SGVs\nbG8g V29y\tbGQ=");
        REQUIRE(r.ok());
        REQUIRE(r.text == "Hello World");
    }

    SECTION("double padding") {
        auto r = decode_base64("SGk=");
        REQUIRE(r.ok());
        REQUIRE(r.text == "Hi");
        REQUIRE(decode_base64("SA==").text == "H");
    }

    SECTION("wrong length fails") {
        auto r = decode_base64("SGVsbG8");
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error == Error::InvalidData);
        REQUIRE_FALSE(r.message.empty());
    }

    SECTION("invalid characters fail") {
        REQUIRE_FALSE(decode_base64("SGVs!G8=").ok());
        REQUIRE_FALSE(decode_base64("Hello World!").ok());
    }

    SECTION("misplaced padding fails") {
        REQUIRE_FALSE(decode_base64("SG=sbG8=").ok());
        REQUIRE_FALSE(decode_base64("S===").ok());
    }

    SECTION("non-UTF-8 bytes come back as hex") {
        auto r = decode_base64("//4=");
        REQUIRE(r.ok());
        REQUIRE(r.text == "fffe");
    }
}

TEST_CASE("Hex decoding", "[decoders]") {
    SECTION("lowercase and uppercase") {
        REQUIRE(decode_hex("48656c6c6f").text == "Hello");
        REQUIRE(decode_hex("48656C6C6F").text == "Hello");
    }

    SECTION("separators are ignored") {
        auto r = decode_hex("48 65 6c\n6c\t6f\r\n");
        REQUIRE(r.ok());
        REQUIRE(r.text == "Hello");
    }

    SECTION("odd length fails") {
        auto r = decode_hex("48656c6c6");
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error == Error::InvalidData);
    }

    SECTION("non-hex characters fail") {
        REQUIRE_FALSE(decode_hex("48656g6c6f").ok());
        REQUIRE_FALSE(decode_hex("0x48").ok());
    }

    SECTION("non-UTF-8 bytes come back as base64") {
        auto r = decode_hex("fffe");
        REQUIRE(r.ok());
        REQUIRE(r.text == "//4=");
    }

    SECTION("empty input decodes to empty") {
        auto r = decode_hex("");
        REQUIRE(r.ok());
        REQUIRE(r.text.empty());
    }
}

TEST_CASE("ROT13 decoding", "[decoders]") {
    REQUIRE(decode_rot13("Uryyb Jbeyq").text == "Hello World");
    REQUIRE(decode_rot13("synt{grfg}").text == "flag{test}");

    SECTION("non-letters pass through") {
        REQUIRE(decode_rot13("123 !?{}").text == "123 !?{}");
    }

    SECTION("involution") {
        const std::string text = "The Quick Brown Fox, 42.";
        REQUIRE(decode_rot13(decode_rot13(text).text).text == text);
    }

    SECTION("never fails") {
        REQUIRE(decode_rot13("").ok());
        REQUIRE(decode_rot13("\x01\x02").ok());
    }
}

TEST_CASE("URL decoding", "[decoders]") {
    SECTION("escapes") {
        auto r = decode_url("flag%7Bhello%20world%7D");
        REQUIRE(r.ok());
        REQUIRE(r.text == "flag{hello world}");
    }

    SECTION("mixed case escapes") {
        REQUIRE(decode_url("a%2fb%2Fc").text == "a/b/c");
    }

    SECTION("plus is kept") {
        REQUIRE(decode_url("a+b%21").text == "a+b!");
    }

    SECTION("no percent fails") {
        auto r = decode_url("hello world");
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error == Error::InvalidData);
    }

    SECTION("no change fails") {
        REQUIRE_FALSE(decode_url("100%").ok());
        REQUIRE_FALSE(decode_url("%zz").ok());
    }

    SECTION("malformed escapes are kept verbatim") {
        auto r = decode_url("%41%zz%4");
        REQUIRE(r.ok());
        REQUIRE(r.text == "A%zz%4");
    }
}

TEST_CASE("Encoders", "[decoders]") {
    REQUIRE(encode_base64("") == "");
    REQUIRE(encode_base64("H") == "SA==");
    REQUIRE(encode_base64("Hi") == "SGk=");
    REQUIRE(encode_base64("Hello World") == "SGVsbG8gV29ybGQ=");
    REQUIRE(encode_hex("Hello") == "48656c6c6f");
    REQUIRE(encode_hex(std::string("\x00\xff", 2)) == "00ff");
    REQUIRE(encode_base64(encode_hex("Hello")) == "NDg2NTZjNmM2Zg==");
}

TEST_CASE("UTF-8 validation", "[decoders]") {
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("plain ascii"));
    REQUIRE(is_valid_utf8("caf\xc3\xa9"));
    REQUIRE(is_valid_utf8("\xe2\x82\xac"));
    REQUIRE(is_valid_utf8("\xf0\x9f\x98\x80"));

    REQUIRE_FALSE(is_valid_utf8("\xff\xfe"));
    REQUIRE_FALSE(is_valid_utf8("\xc3"));
    REQUIRE_FALSE(is_valid_utf8("\xc0\xaf"));
    REQUIRE_FALSE(is_valid_utf8("\xed\xa0\x80"));
    REQUIRE_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));
}

static DecodeResult always_fails(std::string_view) {
    return DecodeResult::failure("injected");
}

TEST_CASE("Decoder table", "[decoders]") {
    SECTION("default table covers every encoding") {
        DecoderSet set = default_decoders();
        for (Encoding e : PRIORITY_ORDER) {
            bool registered = set.get(e) != nullptr;
            REQUIRE(registered);
        }
        bool sentinel_registered = set.get(Encoding::None) != nullptr;
        REQUIRE_FALSE(sentinel_registered);
        REQUIRE(set.apply(Encoding::Hex, "4869").text == "Hi");
    }

    SECTION("missing entry is a failure") {
        DecoderSet empty;
        auto r = empty.apply(Encoding::Base64, "SGk=");
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error == Error::InvalidData);
        REQUIRE_FALSE(empty.apply(Encoding::None, "x").ok());
    }

    SECTION("entries can be replaced") {
        DecoderSet set = default_decoders();
        set.set(Encoding::Base64, &always_fails);
        auto r = set.apply(Encoding::Base64, "SGk=");
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.message == "injected");
    }
}

TEST_CASE("Try all decoders", "[decoders]") {
    SECTION("only successful, changing decoders in priority order") {
        auto results = try_all_decoders("SGk=");
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].first == Encoding::Base64);
        REQUIRE(results[0].second == "Hi");
        REQUIRE(results[1].first == Encoding::Rot13);
        REQUIRE(results[1].second == "FTx=");
    }

    SECTION("nothing applies") {
        REQUIRE(try_all_decoders("!@#$").empty());
    }

    SECTION("custom table") {
        DecoderSet set = default_decoders();
        set.set(Encoding::Rot13, &always_fails);
        auto results = try_all_decoders("SGk=", set);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].first == Encoding::Base64);
    }
}
