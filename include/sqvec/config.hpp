#pragma once

/** \file config.hpp
 *  \brief Immutable per-session configuration: dimension, quantization range, collaborators.
 *
 * Built once by VectorConfig::create and shared read-only by every registered SQL
 * function and cursor; there is no way to mutate it afterwards.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>

#include "sqvec/collaborators.hpp"
#include "sqvec/error.hpp"
#include "sqvec/quant/scalar_quantizer.hpp"

namespace sqvec {

/** \brief Optional parts of the session configuration. */
struct ExtensionOptions {
    std::optional<quant::QuantizationRange> quant_range; /**< absent disables quantized functions */
    std::shared_ptr<Embedder> embedder;                  /**< absent: vector_embed fails */
    std::shared_ptr<Chunker> chunker;                    /**< absent: vector_chunk fails */
};

class VectorConfig {
public:
    /** \brief Largest dimension whose RawBlob still fits a SQLite blob length (int). */
    static constexpr std::size_t MAX_DIMENSION = 0x1FFFFFFFu;

    /** \brief Validate and freeze a configuration.
     *
     * \return config_invalid if dim < 1, dim > MAX_DIMENSION or the range is invalid.
     */
    static auto create(std::size_t dim, ExtensionOptions options = {})
        -> std::expected<std::shared_ptr<const VectorConfig>, core::error>;

    auto dim() const noexcept -> std::size_t { return dim_; }
    auto quant_range() const noexcept -> const std::optional<quant::QuantizationRange>& {
        return options_.quant_range;
    }
    auto embedder() const noexcept -> const std::shared_ptr<Embedder>& { return options_.embedder; }
    auto chunker() const noexcept -> const std::shared_ptr<Chunker>& { return options_.chunker; }

private:
    VectorConfig(std::size_t dim, ExtensionOptions options);

    const std::size_t dim_;
    const ExtensionOptions options_;
};

} // namespace sqvec
