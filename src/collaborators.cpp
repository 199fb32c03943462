#include "sqvec/collaborators.hpp"

#include <exception>
#include <utility>

namespace sqvec {

namespace {

class FunctionEmbedder final : public Embedder {
public:
    explicit FunctionEmbedder(EmbedFn fn) : fn_(std::move(fn)) {}

    auto embed(std::string_view text) -> std::expected<std::vector<float>, core::error> override {
        try {
            return fn_(text);
        } catch (const std::exception& e) {
            return std::unexpected(core::error{core::error_code::embedder_failed, e.what(), "embedder"});
        } catch (...) {
            return std::unexpected(core::error{core::error_code::embedder_failed,
                "unknown exception from embedder", "embedder"});
        }
    }

private:
    EmbedFn fn_;
};

class FunctionChunker final : public Chunker {
public:
    explicit FunctionChunker(ChunkFn fn) : fn_(std::move(fn)) {}

    auto chunk(std::string_view text) -> std::expected<std::vector<std::string>, core::error> override {
        try {
            return fn_(text);
        } catch (const std::exception& e) {
            return std::unexpected(core::error{core::error_code::chunker_failed, e.what(), "chunker"});
        } catch (...) {
            return std::unexpected(core::error{core::error_code::chunker_failed,
                "unknown exception from chunker", "chunker"});
        }
    }

private:
    ChunkFn fn_;
};

} // namespace

auto make_embedder(EmbedFn fn) -> std::shared_ptr<Embedder> {
    if (!fn) return nullptr;
    return std::make_shared<FunctionEmbedder>(std::move(fn));
}

auto make_chunker(ChunkFn fn) -> std::shared_ptr<Chunker> {
    if (!fn) return nullptr;
    return std::make_shared<FunctionChunker>(std::move(fn));
}

} // namespace sqvec
