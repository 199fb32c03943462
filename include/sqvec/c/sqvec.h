#ifndef SQVEC_C_H
#define SQVEC_C_H

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(SQVEC_C_API_EXPORTS)
    #define SQVEC_C_API __declspec(dllexport)
  #else
    #define SQVEC_C_API __declspec(dllimport)
  #endif
#else
  #define SQVEC_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Versioning and stability
// - SQVEC_C_ABI_VERSION increments on incompatible changes.
// - All structs are POD; callers manage memory.
#define SQVEC_C_ABI_VERSION 1

struct sqlite3;

// Error codes (same numeric values as sqvec::core::error_code)
typedef enum {
  SQVEC_OK = 0,
  SQVEC_E_CONFIG_INVALID = 2001,
  SQVEC_E_FORMAT_INVALID = 3001,
  SQVEC_E_DIMENSION_MISMATCH = 4001,
  SQVEC_E_PRECONDITION_FAILED = 4002,
  SQVEC_E_CHUNKER_FAILED = 7001,
  SQVEC_E_EMBEDDER_FAILED = 7002,
  SQVEC_E_INTERNAL = 9001,
  SQVEC_E_INVALID_ARGUMENT = 9002
} sqvec_status_t;

// Embedder callback.
// - Writes up to out_cap floats (out_cap == configured dimension) and sets *out_len to
//   the embedding's true length; a length other than out_cap is a dimension mismatch.
// - Returns 0 on success, any other value on failure.
typedef int (*sqvec_embed_fn)(void* user_data, const char* text, size_t text_len,
                              float* out, size_t out_cap, size_t* out_len);

// Receives one chunk; the bytes are copied before it returns. Non-zero aborts chunking.
typedef int (*sqvec_chunk_sink_fn)(void* sink_ctx, const char* chunk, size_t chunk_len);

// Chunker callback: emit every chunk of text, in order, through sink.
// Returns 0 on success, any other value on failure.
typedef int (*sqvec_chunk_fn)(void* user_data, const char* text, size_t text_len,
                              sqvec_chunk_sink_fn sink, void* sink_ctx);

typedef struct {
  int64_t dim;                 // required, >= 1
  int has_quant_range;         // non-zero enables vector_quantize / vector_distance_q
  float quant_min;
  float quant_max;
  sqvec_embed_fn embed;        // optional
  void* embed_user_data;
  sqvec_chunk_fn chunk;        // optional
  void* chunk_user_data;
} sqvec_options_t;

// API ownership & lifetime rules
// - user_data pointers are borrowed and must outlive the connection (or until the
//   functions are re-registered).
// - Callbacks run synchronously on the thread executing the SQL statement.

// Zero-initialize opts (no range, no collaborators, dim 0).
SQVEC_C_API void sqvec_options_init(sqvec_options_t* opts);

// Register vector_encode, vector_distance, vector_quantize, vector_distance_q,
// vector_embed and vector_chunk on db.
SQVEC_C_API sqvec_status_t sqvec_register(struct sqlite3* db, const sqvec_options_t* opts);

// Thread-local message of the last failed call on this thread ("" if none)
SQVEC_C_API const char* sqvec_get_last_error(void);

SQVEC_C_API const char* sqvec_version(void);

#ifdef __cplusplus
}
#endif

#endif // SQVEC_C_H
