#include "sqvec/config.hpp"

#include <string>
#include <utility>

namespace sqvec {

VectorConfig::VectorConfig(std::size_t dim, ExtensionOptions options)
    : dim_(dim), options_(std::move(options)) {}

auto VectorConfig::create(std::size_t dim, ExtensionOptions options)
    -> std::expected<std::shared_ptr<const VectorConfig>, core::error> {
    using core::error;
    using core::error_code;
    if (dim < 1) {
        return std::unexpected(error{error_code::config_invalid,
            "dimension must be >= 1, got 0", "config"});
    }
    if (dim > MAX_DIMENSION) {
        return std::unexpected(error{error_code::config_invalid,
            "dimension " + std::to_string(dim) + " exceeds maximum " + std::to_string(MAX_DIMENSION),
            "config"});
    }
    if (options.quant_range) {
        if (auto r = options.quant_range->validate(); !r) return std::unexpected(r.error());
    }
    return std::shared_ptr<const VectorConfig>(new VectorConfig(dim, std::move(options)));
}

} // namespace sqvec
