#include "sqvec/codec/blob_codec.hpp"

#include <bit>
#include <string>

namespace sqvec::codec {

static inline void store_le32(std::uint8_t* p, std::uint32_t v) noexcept {
  p[0] = static_cast<std::uint8_t>(v);
  p[1] = static_cast<std::uint8_t>(v >> 8);
  p[2] = static_cast<std::uint8_t>(v >> 16);
  p[3] = static_cast<std::uint8_t>(v >> 24);
}

static inline auto load_le32(const std::uint8_t* p) noexcept -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0])
       | (static_cast<std::uint32_t>(p[1]) << 8)
       | (static_cast<std::uint32_t>(p[2]) << 16)
       | (static_cast<std::uint32_t>(p[3]) << 24);
}

auto encode_raw(std::span<const float> vec) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(raw_blob_size(vec.size()));
  std::uint8_t* p = out.data();
  for (const float f : vec) {
    store_le32(p, std::bit_cast<std::uint32_t>(f));
    p += RAW_ELEMENT_SIZE;
  }
  return out;
}

void decode_raw_into(std::span<const std::uint8_t> bytes, std::span<float> out) noexcept {
  const std::uint8_t* p = bytes.data();
  for (auto& f : out) {
    f = std::bit_cast<float>(load_le32(p));
    p += RAW_ELEMENT_SIZE;
  }
}

auto decode_raw(std::span<const std::uint8_t> bytes)
    -> std::expected<std::vector<float>, core::error> {
  using core::error;
  using core::error_code;
  if (bytes.size() % RAW_ELEMENT_SIZE != 0) {
    return std::unexpected(error{error_code::format_invalid,
        "blob length " + std::to_string(bytes.size()) + " is not a multiple of 4",
        "codec.blob"});
  }
  std::vector<float> out(bytes.size() / RAW_ELEMENT_SIZE);
  decode_raw_into(bytes, out);
  return out;
}

auto is_quantized_format(std::span<const std::uint8_t> bytes) noexcept -> bool {
  return bytes.size() >= QUANTIZED_HEADER_SIZE
      && bytes[0] == QUANTIZED_FORMAT_ID
      && bytes[1] == QUANTIZED_FORMAT_VERSION;
}

} // namespace sqvec::codec
