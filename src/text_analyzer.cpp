/**
 * @file text_analyzer.cpp
 * @brief Text feature extraction.
 */

#include <unravel/text_analyzer.hpp>

#include <array>
#include <cmath>
#include <regex>
#include <string>

namespace unravel {

namespace {

bool is_ascii_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string_view trim(std::string_view text) noexcept {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_ascii_whitespace(text[begin])) {
        ++begin;
    }
    while (end > begin && is_ascii_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

template <typename Pred>
bool all_of(std::string_view text, Pred pred) noexcept {
    for (char c : text) {
        if (!pred(c)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool is_hex_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_base64_char(char c) noexcept {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
}

bool is_ascii_whitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_printable_char(char c) noexcept {
    return (c >= 0x20 && c <= 0x7E) || is_ascii_whitespace(c);
}

const char* charset_name(CharsetClass charset) noexcept {
    switch (charset) {
    case CharsetClass::Empty:
        return "empty";
    case CharsetClass::Hex:
        return "hex";
    case CharsetClass::Base64:
        return "base64";
    case CharsetClass::Alphabetic:
        return "alphabetic";
    case CharsetClass::Printable:
        return "printable";
    case CharsetClass::Binary:
        return "binary";
    }
    return "binary";
}

const char* hash_type_name(HashType hash) noexcept {
    switch (hash) {
    case HashType::Md5:
        return "MD5";
    case HashType::Sha1:
        return "SHA1";
    case HashType::Sha256:
        return "SHA256";
    case HashType::None:
        break;
    }
    return "None";
}

CharsetClass identify_charset(std::string_view text) noexcept {
    if (text.empty()) {
        return CharsetClass::Empty;
    }
    if (all_of(text, is_hex_char)) {
        return CharsetClass::Hex;
    }
    if (all_of(text, is_base64_char)) {
        return CharsetClass::Base64;
    }

    std::size_t alpha_count = 0;
    for (char c : text) {
        if (is_ascii_alpha(c)) {
            ++alpha_count;
        }
    }
    if (static_cast<double>(alpha_count) >=
        ALPHABETIC_RATIO * static_cast<double>(text.size())) {
        return CharsetClass::Alphabetic;
    }

    if (all_of(text, is_printable_char)) {
        return CharsetClass::Printable;
    }
    return CharsetClass::Binary;
}

double calculate_entropy(std::string_view text) noexcept {
    if (text.empty()) {
        return 0.0;
    }

    std::array<std::size_t, 256> counts{};
    for (char c : text) {
        ++counts[static_cast<unsigned char>(c)];
    }

    const double total = static_cast<double>(text.size());
    double entropy = 0.0;
    for (std::size_t count : counts) {
        if (count == 0) {
            continue;
        }
        double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }

    return entropy;
}

double calculate_printable_ratio(std::string_view text) noexcept {
    if (text.empty()) {
        return 0.0;
    }
    std::size_t printable = 0;
    for (char c : text) {
        if (is_printable_char(c)) {
            ++printable;
        }
    }
    return static_cast<double>(printable) / static_cast<double>(text.size());
}

bool has_padding(std::string_view text) noexcept {
    std::size_t end = text.size();
    while (end > 0 && is_ascii_whitespace(text[end - 1])) {
        --end;
    }
    return end > 0 && text[end - 1] == '=';
}

bool contains_url(std::string_view text) {
    static const std::regex url_re(R"(https?://[^\s]+)", std::regex::icase);
    return std::regex_search(text.begin(), text.end(), url_re);
}

bool contains_flag(std::string_view text) {
    // picoCTF{..} is matched by the CTF{..} alternative
    static const std::regex flag_re(R"((flag|flg|htb|ctf)\{[^}]+\})", std::regex::icase);
    return std::regex_search(text.begin(), text.end(), flag_re);
}

HashType detect_hash(std::string_view text) noexcept {
    std::string_view trimmed = trim(text);
    if (!all_of(trimmed, is_hex_char)) {
        return HashType::None;
    }
    switch (trimmed.size()) {
    case MD5_LENGTH:
        return HashType::Md5;
    case SHA1_LENGTH:
        return HashType::Sha1;
    case SHA256_LENGTH:
        return HashType::Sha256;
    default:
        return HashType::None;
    }
}

TextAnalysis analyze(std::string_view text) {
    TextAnalysis analysis;
    analysis.text = std::string(text);
    analysis.length = text.size();
    analysis.charset = identify_charset(text);
    analysis.entropy = calculate_entropy(text);
    analysis.printable_ratio = calculate_printable_ratio(text);
    analysis.has_padding = has_padding(text);
    analysis.contains_url = contains_url(text);
    analysis.contains_flag = contains_flag(text);
    analysis.hash_type = detect_hash(text);
    return analysis;
}

} // namespace unravel
