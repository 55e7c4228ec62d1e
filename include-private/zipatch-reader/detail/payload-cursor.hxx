#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace zipatch_reader::detail {
/**
 * @class PayloadCursor
 * @brief Bounds-checked forward reader over one block payload.
 *
 * Every read that would run past the end of the payload throws
 * ZipatchError(UnexpectedEndOfFile) naming the field being read.
 */
class PayloadCursor {
public:
  /**
   * @param data First payload byte.
   * @param size Payload length.
   * @param block Block name used in error messages ("ETRY", ...).
   */
  PayloadCursor(const char *data, std::size_t size, std::string_view block)
      : data_(data), size_(size), block_(block) {}

  std::size_t remaining() const noexcept { return size_ - offset_; }
  std::size_t offset() const noexcept { return offset_; }

  /// Throw unless at least `count` bytes remain.
  void require(std::size_t count, std::string_view field) const;

  /// Read a big-endian u32.
  std::uint32_t read_u32(std::string_view field);

  /// Return a pointer to the next `count` bytes and advance past them.
  const char *take(std::size_t count, std::string_view field);

  /**
   * @brief Read a `path_len[4] | path[path_len]` field.
   *
   * The length is checked against max_path_size before any storage is
   * allocated for the path.
   */
  std::string read_path();

private:
  const char *data_;
  std::size_t size_;
  std::size_t offset_ = 0;
  std::string_view block_;
};
} // namespace zipatch_reader::detail
