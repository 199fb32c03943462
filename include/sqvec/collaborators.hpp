#pragma once

/** \file collaborators.hpp
 *  \brief Capability interfaces for the external embedder and chunker.
 *
 * Both are opaque, possibly slow calls made synchronously from the SQL thread.
 * Implementations report failures through the returned std::expected; the callers
 * wrap them as embedder_failed / chunker_failed.
 */

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sqvec/error.hpp"

namespace sqvec {

/** \brief Produces a vector embedding from text. */
class Embedder {
public:
    virtual ~Embedder() = default;
    virtual auto embed(std::string_view text) -> std::expected<std::vector<float>, core::error> = 0;
};

/** \brief Splits text into an ordered list of chunks. */
class Chunker {
public:
    virtual ~Chunker() = default;
    virtual auto chunk(std::string_view text) -> std::expected<std::vector<std::string>, core::error> = 0;
};

using EmbedFn = std::function<std::expected<std::vector<float>, core::error>(std::string_view)>;
using ChunkFn = std::function<std::expected<std::vector<std::string>, core::error>(std::string_view)>;

/** \brief Adapt a callable into an Embedder. Exceptions thrown by fn become embedder_failed. */
auto make_embedder(EmbedFn fn) -> std::shared_ptr<Embedder>;

/** \brief Adapt a callable into a Chunker. Exceptions thrown by fn become chunker_failed. */
auto make_chunker(ChunkFn fn) -> std::shared_ptr<Chunker>;

} // namespace sqvec
