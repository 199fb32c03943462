#pragma once

/** \file json_array.hpp
 *  \brief Reader for flat JSON number arrays ("[0.1, -2, 3e-4]").
 */

#include <expected>
#include <string_view>
#include <vector>

#include "sqvec/error.hpp"

namespace sqvec::codec {

/** \brief Parse a JSON array whose elements are all JSON numbers.
 *
 * Whitespace is allowed around tokens; "[]" yields an empty vector. Anything else
 * (nested values, strings, null, trailing bytes, malformed or out-of-range numbers)
 * is invalid_argument, with the byte offset in the message.
 */
auto parse_number_array(std::string_view json)
    -> std::expected<std::vector<double>, core::error>;

} // namespace sqvec::codec
