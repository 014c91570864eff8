/**
 * @file decoders.cpp
 * @brief Base64, hex, ROT13 and percent-decoding.
 */

#include <unravel/decoders.hpp>
#include <unravel/text_analyzer.hpp>

#include <cstdint>

namespace unravel {

namespace {

constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char HEX_DIGITS[] = "0123456789abcdef";

int base64_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool is_valid_utf8(std::string_view bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        if (b0 < 0x80U) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((b0 & 0xE0U) == 0xC0U) {
            len = 2;
            cp = b0 & 0x1FU;
            min_cp = 0x80U;
        } else if ((b0 & 0xF0U) == 0xE0U) {
            len = 3;
            cp = b0 & 0x0FU;
            min_cp = 0x800U;
        } else if ((b0 & 0xF8U) == 0xF0U) {
            len = 4;
            cp = b0 & 0x07U;
            min_cp = 0x10000U;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto b = static_cast<unsigned char>(bytes[i + k]);
            if ((b & 0xC0U) != 0x80U) {
                return false;
            }
            cp = (cp << 6) | (b & 0x3FU);
        }

        if (cp < min_cp || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
            return false;
        }
        i += len;
    }

    return true;
}

std::string encode_base64(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= bytes.size()) {
        std::uint32_t v = (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << 16) |
                          (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8) |
                          static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 2]));
        out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[(v >> 6) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[v & 0x3FU]);
        i += 3;
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        std::uint32_t v = static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << 16;
        out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3FU]);
        out.append("==");
    } else if (rest == 2) {
        std::uint32_t v = (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << 16) |
                          (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8);
        out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3FU]);
        out.push_back(BASE64_ALPHABET[(v >> 6) & 0x3FU]);
        out.push_back('=');
    }

    return out;
}

std::string encode_hex(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0FU]);
    }
    return out;
}

DecodeResult decode_base64(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (is_ascii_whitespace(c)) {
            continue;
        }
        if (!is_base64_char(c)) {
            return DecodeResult::failure("Failed to decode Base64: invalid character in input");
        }
        compact.push_back(c);
    }

    if ((compact.size() % 4U) != 0) {
        return DecodeResult::failure("Failed to decode Base64: incorrect padding");
    }

    std::size_t padding = 0;
    while (padding < compact.size() && compact[compact.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        return DecodeResult::failure("Failed to decode Base64: too much padding");
    }
    const std::size_t data_len = compact.size() - padding;
    for (std::size_t i = 0; i < data_len; ++i) {
        if (compact[i] == '=') {
            return DecodeResult::failure("Failed to decode Base64: padding inside data");
        }
    }

    std::string bytes;
    bytes.reserve((compact.size() / 4U) * 3U);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < data_len; ++i) {
        buffer = (buffer << 6) | static_cast<std::uint32_t>(base64_value(compact[i]));
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<char>((buffer >> bits) & 0xFFU));
        }
    }

    if (!is_valid_utf8(bytes)) {
        return DecodeResult::success(encode_hex(bytes));
    }
    return DecodeResult::success(std::move(bytes));
}

DecodeResult decode_hex(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\t' || c == '\r') {
            continue;
        }
        if (!is_hex_char(c)) {
            return DecodeResult::failure("Text contains non-hexadecimal characters");
        }
        compact.push_back(c);
    }

    if ((compact.size() % 2U) != 0) {
        return DecodeResult::failure("Hexadecimal string has odd length");
    }

    std::string bytes;
    bytes.reserve(compact.size() / 2U);
    for (std::size_t i = 0; i < compact.size(); i += 2) {
        bytes.push_back(static_cast<char>((hex_value(compact[i]) << 4) | hex_value(compact[i + 1])));
    }

    if (!is_valid_utf8(bytes)) {
        return DecodeResult::success(encode_base64(bytes));
    }
    return DecodeResult::success(std::move(bytes));
}

DecodeResult decode_rot13(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>('a' + (c - 'a' + 13) % 26);
        } else if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>('A' + (c - 'A' + 13) % 26);
        }
    }
    return DecodeResult::success(std::move(out));
}

DecodeResult decode_url(std::string_view text) {
    if (text.find('%') == std::string_view::npos) {
        return DecodeResult::failure("Text does not appear to be URL encoded (no % found)");
    }

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }

    if (out == text) {
        return DecodeResult::failure("URL decoding resulted in no change");
    }
    return DecodeResult::success(std::move(out));
}

DecodeResult DecoderSet::apply(Encoding encoding, std::string_view text) const {
    DecodeFn fn = get(encoding);
    if (fn == nullptr) {
        return DecodeResult::failure(std::string("No decoder registered for ") +
                                     std::string(encoding_name(encoding)));
    }
    return fn(text);
}

DecoderSet default_decoders() noexcept {
    DecoderSet set;
    set.set(Encoding::Base64, &decode_base64);
    set.set(Encoding::Hex, &decode_hex);
    set.set(Encoding::Rot13, &decode_rot13);
    set.set(Encoding::Url, &decode_url);
    return set;
}

std::vector<std::pair<Encoding, std::string>> try_all_decoders(std::string_view text,
                                                               const DecoderSet& decoders) {
    std::vector<std::pair<Encoding, std::string>> results;
    for (Encoding encoding : PRIORITY_ORDER) {
        DecodeResult result = decoders.apply(encoding, text);
        if (result.ok() && result.text != text) {
            results.emplace_back(encoding, std::move(result.text));
        }
    }
    return results;
}

} // namespace unravel
