#pragma once

#include <zipatch-reader/logging.hxx>
#include <zipatch-reader/options.hxx>
#include <zipatch-reader/sha1.hxx>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace zipatch_reader {
/** @enum ChunkMode Operation requested by a chunk. */
enum class ChunkMode { Add, Delete, Modify, Unknown };

/** @enum CompressionMode Encoding of a chunk's data. */
enum class CompressionMode { None, Zlib, Unknown };

ChunkMode chunk_mode_from_wire(std::uint32_t value) noexcept;
CompressionMode compression_mode_from_wire(std::uint32_t value) noexcept;

/// Wire value of a mode ('A', 'D', 'M' in the top byte); 0 for Unknown.
std::uint32_t to_wire(ChunkMode mode) noexcept;
/// Wire value of a compression ('N', 'Z' in the top byte); 0 for Unknown.
std::uint32_t to_wire(CompressionMode compression) noexcept;

std::string_view to_string(ChunkMode mode) noexcept;
std::string_view to_string(CompressionMode compression) noexcept;

/// Fixed part of every chunk: mode, two digests, compression, three sizes.
inline constexpr std::size_t chunk_header_size = 60;

/**
 * @struct Chunk
 * @brief One piece of an entry's content: a mode, the before/after hashes,
 * and `declared_size` bytes of possibly compressed data.
 */
struct Chunk {
  ChunkMode mode = ChunkMode::Unknown;
  Sha1Digest prev_hash{};
  Sha1Digest next_hash{};
  CompressionMode compression = CompressionMode::Unknown;
  std::uint32_t declared_size = 0;
  std::uint32_t prev_size = 0;
  /// Decoded length of this chunk's data.
  std::uint32_t next_size = 0;
  std::vector<char> data;
};

/**
 * @struct Entry
 * @brief Decoded ETRY block: a target path and its chunks in apply order.
 */
struct Entry {
  std::string path;
  std::vector<Chunk> chunks;

  /// Whole-entry mode, taken from the first chunk (Unknown if none).
  ChunkMode mode() const noexcept;
};

/**
 * @brief Decode an ETRY payload.
 *
 * Layout: `path_len[4] | path | chunk_count[4] | chunk*`, each chunk being a
 * 60-byte header followed by its data.
 *
 * @throws ZipatchError PathSizeTooLarge, UnexpectedEndOfFile. Nothing decoded
 * so far survives a failure.
 */
Entry parse_entry(const char *data, std::size_t size);

/**
 * @brief Produce the bytes a chunk contributes to its file.
 *
 * None returns the data verbatim. Zlib inflates the inner DEFLATE stream;
 * if that fails the failure is logged and the raw data is returned instead.
 *
 * @throws ZipatchError UnknownCompressionMode.
 */
std::vector<char> decode_chunk_data(const Chunk &chunk, Logger &log);

/**
 * @brief Apply an entry under options.output_root.
 *
 * Delete entries remove the target file. Every other mode recreates the file
 * from the concatenated chunk data, then checks the SHA-1 of everything
 * written against the last chunk's next_hash. A hash failure is detected
 * only after writing; the file is left as written.
 *
 * @throws ZipatchError UnknownCompressionMode, HashVerificationFailed,
 * IoError.
 */
void apply_entry(const Entry &entry, const Options &options, Logger &log);
} // namespace zipatch_reader
