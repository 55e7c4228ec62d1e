#pragma once

#include <cstddef>
#include <vector>

namespace zipatch_reader {
/// Bytes of zlib framing around the DEFLATE stream: 2-byte header, 4-byte
/// Adler-32 trailer.
inline constexpr std::size_t zlib_header_size = 2;
inline constexpr std::size_t zlib_trailer_size = 4;

/**
 * @brief Inflate the raw DEFLATE stream wrapped by zlib framing.
 *
 * Only data[2, size - 4) is decoded; the zlib header and Adler-32 trailer
 * are skipped without being checked. At most `expected_size` bytes are
 * produced; fewer are returned if the stream ends early.
 *
 * @param data Zlib-framed chunk data.
 * @param size Length of data.
 * @param expected_size Decoded size declared by the chunk.
 * @throws ZipatchError DecompressionFailed when the framing is too short or
 * the DEFLATE stream is corrupt.
 */
std::vector<char> inflate_zlib_chunk(const char *data, std::size_t size,
                                     std::size_t expected_size);
} // namespace zipatch_reader
