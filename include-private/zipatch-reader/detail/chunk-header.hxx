#pragma once

namespace zipatch_reader::detail {
/**
 * @struct ChunkHeader
 * @brief On-disk layout of the fixed part of an ETRY chunk (60 bytes).
 *
 * Every multi-byte integer is big-endian. The header is immediately followed
 * by `size` bytes of chunk data.
 *
 * Note: The struct is packed to guarantee the exact 60-byte layout.
 */
struct __attribute__((packed)) ChunkHeader {
  unsigned char mode[4];        /**< @brief 'A', 'D' or 'M' in the top byte. */
  unsigned char prev_hash[20];  /**< @brief SHA-1 of the file before. */
  unsigned char next_hash[20];  /**< @brief SHA-1 of the file after. */
  unsigned char compression[4]; /**< @brief 'N' or 'Z' in the top byte. */
  unsigned char size[4];        /**< @brief Length of the chunk data. */
  unsigned char prev_size[4];   /**< @brief File size before this chunk. */
  unsigned char next_size[4];   /**< @brief Size of the decoded chunk data. */
};

static_assert(sizeof(ChunkHeader) == 60, "ChunkHeader must be 60 bytes");
} // namespace zipatch_reader::detail
