#pragma once

/** \file diagnostics.hpp
 *  \brief Opt-in stderr diagnostics ("[SQVEC][component] message").
 *
 * Enabled when SQVEC_DEBUG is set to a value not starting with '0'. The flag is
 * read once per process; set_debug_enabled() overrides it (tests, embedding hosts).
 */

#include <string_view>

#include "sqvec/error.hpp"

namespace sqvec::core {

/** \brief Whether diagnostics are currently written. */
auto debug_enabled() noexcept -> bool;

/** \brief Override the SQVEC_DEBUG toggle for the rest of the process. */
void set_debug_enabled(bool enabled) noexcept;

/** \brief Write one diagnostic line when enabled. */
void debug_log(std::string_view component, std::string_view message);

/** \brief Write an error's code, component and message when enabled. */
void debug_log_error(std::string_view where, const error& err);

} // namespace sqvec::core
