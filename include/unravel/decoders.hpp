/**
 * @file decoders.hpp
 * @brief The four decoding transforms and the table that dispatches them.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Every decoder honours one contract: it either returns the decoded text
 * or a failure carrying Error::InvalidData and a description of why the
 * input is not well-formed for that encoding. A decoder never passes
 * malformed input through silently.
 */

#ifndef UNRAVEL_DECODERS_HPP
#define UNRAVEL_DECODERS_HPP

#include "encoding.hpp"
#include "error.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unravel {

/**
 * @brief Outcome of one decode attempt.
 */
struct DecodeResult {
    Error error = Error::Ok;
    std::string text;    ///< Decoded text (valid only when ok())
    std::string message; ///< Failure description (empty on success)

    [[nodiscard]] bool ok() const noexcept {
        return error == Error::Ok;
    }

    static DecodeResult success(std::string decoded) {
        return DecodeResult{Error::Ok, std::move(decoded), {}};
    }

    static DecodeResult failure(std::string reason) {
        return DecodeResult{Error::InvalidData, {}, std::move(reason)};
    }
};

using DecodeFn = DecodeResult (*)(std::string_view);

/**
 * @brief Decode Base64 (RFC 4648 alphabet).
 *
 * ASCII whitespace is ignored. The remaining length must be a multiple
 * of four with at most two trailing '='. Bytes that are not valid UTF-8
 * are returned as their lowercase hex rendering.
 */
DecodeResult decode_base64(std::string_view text);

/**
 * @brief Decode hexadecimal.
 *
 * Spaces, tabs and line breaks are ignored. Bytes that are not valid
 * UTF-8 are returned as their Base64 rendering.
 */
DecodeResult decode_hex(std::string_view text);

/// Rotate ASCII letters by 13 places. Never fails.
DecodeResult decode_rot13(std::string_view text);

/**
 * @brief Decode percent-encoding.
 *
 * Fails when the text holds no '%' or decoding changes nothing.
 * Malformed escapes are kept verbatim; '+' is not translated.
 */
DecodeResult decode_url(std::string_view text);

/// Standard padded Base64 encoding.
std::string encode_base64(std::string_view bytes);

/// Lowercase hexadecimal encoding.
std::string encode_hex(std::string_view bytes);

/// Strict UTF-8 validation (no overlongs, surrogates or code points past U+10FFFF).
bool is_valid_utf8(std::string_view bytes) noexcept;

/**
 * @brief Encoding-indexed decoder table.
 *
 * Built once at startup; a Controller holds its own copy. Tests may
 * replace entries to inject failures.
 */
class DecoderSet {
public:
    DecoderSet() noexcept = default;

    void set(Encoding encoding, DecodeFn fn) noexcept {
        if (encoding != Encoding::None) {
            table_[encoding_index(encoding)] = fn;
        }
    }

    [[nodiscard]] DecodeFn get(Encoding encoding) const noexcept {
        return encoding == Encoding::None ? nullptr : table_[encoding_index(encoding)];
    }

    /**
     * @brief Run the decoder registered for an encoding.
     *
     * A missing entry is reported as a failure, never a pass-through.
     */
    DecodeResult apply(Encoding encoding, std::string_view text) const;

private:
    std::array<DecodeFn, ENCODING_COUNT> table_{};
};

/// The four standard decoders.
DecoderSet default_decoders() noexcept;

/**
 * @brief Run every decoder in priority order.
 *
 * @return (encoding, decoded text) for each decoder that succeeded and
 *         changed the text, in priority order
 */
std::vector<std::pair<Encoding, std::string>> try_all_decoders(
    std::string_view text, const DecoderSet& decoders = default_decoders());

} // namespace unravel

#endif // UNRAVEL_DECODERS_HPP
