/**
 * @file test_classifier.cpp
 * @brief Unit tests for encoding identification and decoder selection.
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <unravel/classifier.hpp>
#include <unravel/decoders.hpp>

#include <string>
#include <vector>

using namespace unravel;
using Catch::Approx;

static EncodingScores scores_for(const std::string& text) {
    return identify_likely_encoding(analyze(text));
}

TEST_CASE("Base64 scoring", "[classifier]") {
    SECTION("padded") {
        auto s = scores_for("SGVsbG8gV29ybGQ=");
        REQUIRE(s[Encoding::Base64] == Approx(0.95));
    }

    SECTION("unpadded") {
        auto s = scores_for("SGVsbG8gV29ybGQh");
        REQUIRE(s[Encoding::Base64] == Approx(0.85));
    }

    SECTION("hex-only text is not scored as base64") {
        auto s = scores_for("48656c6c6f");
        REQUIRE(s[Encoding::Base64] == 0.0);
    }
}

TEST_CASE("Hex scoring", "[classifier]") {
    SECTION("even length") {
        auto s = scores_for("48656c6c6f");
        REQUIRE(s[Encoding::Hex] == Approx(0.95));
    }

    SECTION("odd length never decodes") {
        auto s = scores_for("48656c6c6");
        REQUIRE(s[Encoding::Hex] == 0.0);
        REQUIRE_FALSE(select_decoder(s).has_value());
    }
}

TEST_CASE("ROT13 scoring", "[classifier]") {
    auto s = scores_for("guvf vf n grfg");
    REQUIRE(s[Encoding::Rot13] == Approx(0.70));
    REQUIRE(s[Encoding::Base64] == 0.0);
    REQUIRE(s[Encoding::Hex] == 0.0);
    REQUIRE(s[Encoding::Url] == 0.0);
}

TEST_CASE("URL scoring", "[classifier]") {
    REQUIRE(scores_for("flag%7Bhello%20world%7D")[Encoding::Url] == Approx(0.90));
    REQUIRE(scores_for("100%")[Encoding::Url] == Approx(0.90));
    REQUIRE(scores_for("no percent here")[Encoding::Url] == 0.0);
}

TEST_CASE("Scores are independent", "[classifier]") {
    auto s = scores_for("Hello%20World");
    REQUIRE(s[Encoding::Rot13] == Approx(0.70));
    REQUIRE(s[Encoding::Url] == Approx(0.90));

    auto choice = select_decoder(s);
    REQUIRE(choice.has_value());
    REQUIRE(choice->encoding == Encoding::Url);
    REQUIRE(choice->confidence == Approx(0.90));
}

TEST_CASE("Scores stay within [0, 1]", "[classifier]") {
    std::vector<std::string> samples = {"", "a", "%", "====", "SGk=", "48656c6c6f",
                                        "Hello World", "!@#$^&*()", "flag{x}"};

    std::string binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<char>(i));
    }
    samples.push_back(binary);
    samples.push_back(encode_base64(binary));
    samples.push_back(encode_hex(binary));

    for (const auto& text : samples) {
        auto s = scores_for(text);
        for (Encoding e : PRIORITY_ORDER) {
            REQUIRE(s[e] >= 0.0);
            REQUIRE(s[e] <= 1.0);
        }
    }

    auto empty = scores_for("");
    for (Encoding e : PRIORITY_ORDER) {
        REQUIRE(empty[e] == 0.0);
    }
}

TEST_CASE("EncodingScores clamps", "[classifier]") {
    EncodingScores s;
    s.set(Encoding::Hex, 1.5);
    s.set(Encoding::Rot13, -0.2);
    s.set(Encoding::None, 0.9);
    REQUIRE(s[Encoding::Hex] == 1.0);
    REQUIRE(s[Encoding::Rot13] == 0.0);
    REQUIRE(s[Encoding::None] == 0.0);
}

TEST_CASE("Decoder selection", "[classifier]") {
    SECTION("highest score wins") {
        EncodingScores s;
        s.set(Encoding::Rot13, 0.7);
        s.set(Encoding::Url, 0.9);
        auto choice = select_decoder(s);
        REQUIRE(choice.has_value());
        REQUIRE(choice->encoding == Encoding::Url);
    }

    SECTION("ties resolve by priority order") {
        EncodingScores s;
        s.set(Encoding::Hex, 0.95);
        s.set(Encoding::Base64, 0.95);
        REQUIRE(select_decoder(s)->encoding == Encoding::Base64);

        EncodingScores t;
        t.set(Encoding::Url, 0.8);
        t.set(Encoding::Rot13, 0.8);
        t.set(Encoding::Hex, 0.8);
        REQUIRE(select_decoder(t)->encoding == Encoding::Hex);
    }

    SECTION("threshold is strict") {
        EncodingScores s;
        s.set(Encoding::Rot13, 0.3);
        REQUIRE_FALSE(select_decoder(s).has_value());

        s.set(Encoding::Rot13, 0.31);
        REQUIRE(select_decoder(s)->encoding == Encoding::Rot13);
    }

    SECTION("nothing scored") {
        REQUIRE_FALSE(select_decoder(EncodingScores{}).has_value());
    }
}

TEST_CASE("Encoding names", "[classifier]") {
    REQUIRE(encoding_name(Encoding::Base64) == "base64");
    REQUIRE(encoding_name(Encoding::None) == "none");
    REQUIRE(encoding_from_name("rot13") == Encoding::Rot13);
    REQUIRE_FALSE(encoding_from_name("none").has_value());
    REQUIRE_FALSE(encoding_from_name("uuencode").has_value());
}
