#include "sqvec/c/sqvec.h"

#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#include <sqlite3.h>

#include "sqvec/error_mapping.hpp"
#include "sqvec/sqlite/extension.hpp"

namespace {

// Message of the last failed call on this thread
thread_local std::string g_last_error;

void set_error(std::string_view s) noexcept {
  g_last_error.assign(s.data(), s.size());
}

void clear_error() noexcept {
  g_last_error.clear();
}

using sqvec::core::error;
using sqvec::core::error_code;

class CallbackEmbedder final : public sqvec::Embedder {
public:
  CallbackEmbedder(sqvec_embed_fn fn, void* user_data, std::size_t dim)
      : fn_(fn), user_data_(user_data), dim_(dim) {}

  auto embed(std::string_view text) -> std::expected<std::vector<float>, error> override {
    std::vector<float> out(dim_);
    std::size_t len = 0;
    const int rc = fn_(user_data_, text.data(), text.size(), out.data(), out.size(), &len);
    if (rc != 0) {
      return std::unexpected(error{error_code::embedder_failed,
          "embedder callback returned " + std::to_string(rc), "c.embedder"});
    }
    // A longer embedding was truncated to the buffer; keep its true length so the
    // caller reports the mismatch.
    out.resize(len);
    return out;
  }

private:
  sqvec_embed_fn fn_;
  void* user_data_;
  std::size_t dim_;
};

class CallbackChunker final : public sqvec::Chunker {
public:
  CallbackChunker(sqvec_chunk_fn fn, void* user_data) : fn_(fn), user_data_(user_data) {}

  auto chunk(std::string_view text) -> std::expected<std::vector<std::string>, error> override {
    std::vector<std::string> chunks;
    const int rc = fn_(user_data_, text.data(), text.size(), &CallbackChunker::sink, &chunks);
    if (rc != 0) {
      return std::unexpected(error{error_code::chunker_failed,
          "chunker callback returned " + std::to_string(rc), "c.chunker"});
    }
    return chunks;
  }

private:
  static int sink(void* sink_ctx, const char* chunk, size_t chunk_len) {
    try {
      static_cast<std::vector<std::string>*>(sink_ctx)->emplace_back(chunk, chunk_len);
      return 0;
    } catch (const std::bad_alloc&) {
      return SQLITE_NOMEM;
    }
  }

  sqvec_chunk_fn fn_;
  void* user_data_;
};

} // namespace

extern "C" {

SQVEC_C_API const char* sqvec_get_last_error(void) {
  return g_last_error.c_str();
}

SQVEC_C_API const char* sqvec_version(void) {
  return "0.1.0";
}

SQVEC_C_API void sqvec_options_init(sqvec_options_t* opts) {
  if (!opts) return;
  std::memset(opts, 0, sizeof(*opts));
}

SQVEC_C_API sqvec_status_t sqvec_register(struct sqlite3* db, const sqvec_options_t* opts) {
  if (!db || !opts) {
    set_error("sqvec_register: null connection or options");
    return SQVEC_E_INVALID_ARGUMENT;
  }
  clear_error();
  if (opts->dim < 1) {
    set_error("sqvec_register: dimension must be >= 1, got " + std::to_string(opts->dim));
    return SQVEC_E_CONFIG_INVALID;
  }
  try {
    const auto dim = static_cast<std::size_t>(opts->dim);
    sqvec::ExtensionOptions options;
    if (opts->has_quant_range) {
      options.quant_range = sqvec::quant::QuantizationRange{opts->quant_min, opts->quant_max};
    }
    if (opts->embed) {
      options.embedder = std::make_shared<CallbackEmbedder>(opts->embed, opts->embed_user_data, dim);
    }
    if (opts->chunk) {
      options.chunker = std::make_shared<CallbackChunker>(opts->chunk, opts->chunk_user_data);
    }
    auto r = sqvec::sqlite::register_functions(db, dim, std::move(options));
    if (!r) {
      set_error("sqvec_register: " + r.error().message);
      return sqvec::core::to_c_status(r.error().code);
    }
    return SQVEC_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return SQVEC_E_INTERNAL;
  } catch (...) {
    set_error("unknown error in sqvec_register");
    return SQVEC_E_INTERNAL;
  }
}

} // extern "C"
