#include "sqvec/core/diagnostics.hpp"
#include "sqvec/core/platform_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace sqvec::core {

namespace {

std::atomic<bool>& debug_flag() {
    // Cache the env toggle once for determinism
    static std::atomic<bool> flag{env_flag("SQVEC_DEBUG")};
    return flag;
}

std::mutex& stderr_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

auto debug_enabled() noexcept -> bool {
    return debug_flag().load(std::memory_order_acquire);
}

void set_debug_enabled(bool enabled) noexcept {
    debug_flag().store(enabled, std::memory_order_release);
}

void debug_log(std::string_view component, std::string_view message) {
    if (!debug_enabled()) return;
    std::lock_guard<std::mutex> lk(stderr_mutex());
    std::cerr << "[SQVEC][" << component << "] " << message << std::endl;
}

void debug_log_error(std::string_view where, const error& err) {
    if (!debug_enabled()) return;
    std::lock_guard<std::mutex> lk(stderr_mutex());
    std::cerr << "[SQVEC][" << where << "] error " << static_cast<std::uint32_t>(err.code)
              << " (" << err.component << "): " << err.message << std::endl;
}

} // namespace sqvec::core
