#include "sqvec/codec/json_array.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace sqvec::codec {

auto parse_number_array(std::string_view json)
    -> std::expected<std::vector<double>, core::error> {
    using core::error;
    using core::error_code;

    const char* const begin = json.data();
    const char* s = begin;
    const char* const end = begin + json.size();

    auto fail = [&](const char* what) {
        return std::unexpected(error{error_code::invalid_argument,
            std::string("invalid JSON: ") + what + " at offset " + std::to_string(s - begin),
            "codec.json"});
    };
    auto skip_ws = [&](){ while (s < end && (*s==' '||*s=='\n'||*s=='\r'||*s=='\t')) ++s; };
    // Strict JSON number grammar; from_chars alone would also accept "inf", "1." and leading '+'.
    auto scan_number = [&]() -> const char* {
        const char* p = s;
        if (p < end && *p == '-') ++p;
        if (p >= end) return nullptr;
        if (*p == '0') { ++p; }
        else { if (!(*p >= '1' && *p <= '9')) return nullptr; while (p < end && *p >= '0' && *p <= '9') ++p; }
        if (p < end && *p == '.') { ++p; if (p >= end || !(*p >= '0' && *p <= '9')) return nullptr; while (p < end && *p >= '0' && *p <= '9') ++p; }
        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p; if (p < end && (*p == '+' || *p == '-')) ++p;
            if (p >= end || !(*p >= '0' && *p <= '9')) return nullptr;
            while (p < end && *p >= '0' && *p <= '9') ++p;
        }
        return p;
    };

    std::vector<double> out;
    skip_ws();
    if (s >= end || *s != '[') return fail("expected '['");
    ++s; skip_ws();
    if (s < end && *s == ']') {
        ++s;
    } else {
        while (true) {
            const char* num_end = scan_number();
            if (num_end == nullptr) return fail("expected number");
            double v = 0.0;
            auto [ptr, ec] = std::from_chars(s, num_end, v);
            if (ec == std::errc::result_out_of_range || !std::isfinite(v)) return fail("number out of range");
            if (ec != std::errc{} || ptr != num_end) return fail("malformed number");
            out.push_back(v);
            s = num_end;
            skip_ws();
            if (s >= end) return fail("unterminated array");
            if (*s == ',') { ++s; skip_ws(); continue; }
            if (*s == ']') { ++s; break; }
            return fail("expected ',' or ']'");
        }
    }
    skip_ws();
    if (s != end) return fail("trailing characters");
    return out;
}

} // namespace sqvec::codec
