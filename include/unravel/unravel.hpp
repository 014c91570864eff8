/**
 * @file unravel.hpp
 * @brief High-level unravel API.
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
 * Includes every component. Typical use:
 * @code
 * auto result = unravel::iterative_decode("SGVsbG8gV29ybGQ=");
 * // result.final_text == "Hello World", result.encoding_chain == {Encoding::Base64}
 * @endcode
 */

#ifndef UNRAVEL_HPP
#define UNRAVEL_HPP

#include "classifier.hpp"
#include "config.hpp"
#include "controller.hpp"
#include "decoders.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "session.hpp"
#include "text_analyzer.hpp"
#include "validator.hpp"

namespace unravel {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace unravel

#endif // UNRAVEL_HPP
