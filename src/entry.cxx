#include <zipatch-reader/detail/chunk-header.hxx>
#include <zipatch-reader/detail/payload-cursor.hxx>
#include <zipatch-reader/directory-ops.hxx>
#include <zipatch-reader/entry.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/inflate.hxx>

#include <boost/endian/conversion.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>

#include <algorithm>
#include <ios>
#include <iterator>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace zipatch_reader {
static_assert(sizeof(detail::ChunkHeader) == chunk_header_size,
              "on-disk chunk header and chunk_header_size disagree");

namespace {
constexpr std::uint32_t wire_add = 0x41000000;
constexpr std::uint32_t wire_delete = 0x44000000;
constexpr std::uint32_t wire_modify = 0x4D000000;
constexpr std::uint32_t wire_none = 0x4E000000;
constexpr std::uint32_t wire_zlib = 0x5A000000;

std::uint32_t load_u32(const unsigned char (&field)[4]) {
  return boost::endian::load_big_u32(field);
}

void copy_digest(const unsigned char (&field)[20], Sha1Digest &out) {
  std::copy(std::begin(field), std::end(field), out.begin());
}

/// "chunk i/n", one-based, for log lines and error messages.
std::string chunk_label(std::size_t index, std::size_t count) {
  return "chunk " + std::to_string(index + 1) + "/" + std::to_string(count);
}

/**
 * @brief Remove the target of a Delete entry; a missing file is fine.
 */
void delete_target(const fs::path &path, Logger &log) {
  ZIPATCH_READER_LOG(log, info)
      << "Delete operation detected for file: " << path.string();
  std::error_code ec;
  if (fs::remove(path, ec)) {
    ZIPATCH_READER_LOG(log, info)
        << "File successfully deleted: " << path.string();
    return;
  }
  if (ec)
    throw ZipatchError(Errc::IoError, "failed to delete file " + path.string(),
                       ec);
  ZIPATCH_READER_LOG(log, warning) << "File not found: " << path.string();
}

/**
 * @brief Create the directory chain holding @p path.
 *
 * @throws ZipatchError IoError unless the parent ends up being a directory.
 */
void ensure_parent_directories(const fs::path &path) {
  const auto parent = path.parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec && !fs::is_directory(parent))
    throw ZipatchError(Errc::IoError,
                       "failed to create parent directories for " +
                           path.string(),
                       ec);
}

/**
 * @brief Check the current file against the first chunk's prev_hash.
 *
 * An all-zero prev_hash means no previous content is expected. Files larger
 * than the configured limit are not hashed.
 *
 * @return true when the existing state is the expected one.
 */
bool previous_content_matches(const Chunk &first, const fs::path &path,
                              const Options &options, Logger &log) {
  const bool expect_new = is_zero_digest(first.prev_hash);

  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory)
    throw ZipatchError(Errc::IoError, "failed to stat " + path.string(), ec);
  if (!fs::exists(status)) {
    if (expect_new)
      return true;
    ZIPATCH_READER_LOG(log, warning) << "File not found: " << path.string();
    return false;
  }
  if (expect_new) {
    ZIPATCH_READER_LOG(log, warning)
        << "File exists but expected new file (zero hash): " << path.string();
    return false;
  }

  const auto size = fs::file_size(path, ec);
  if (ec)
    throw ZipatchError(Errc::IoError, "failed to size " + path.string(), ec);
  if (size > options.prev_hash_size_limit) {
    ZIPATCH_READER_LOG(log, warning)
        << "File too large to verify hash: " << path.string() << " (" << size
        << " bytes)";
    return false;
  }

  const auto actual = sha1_file(path);
  if (actual != first.prev_hash) {
    ZIPATCH_READER_LOG(log, warning)
        << "Previous hash mismatch for file: " << path.string()
        << ", expected " << to_hex(first.prev_hash) << ", got "
        << to_hex(actual);
    return false;
  }
  return true;
}
} // unnamed namespace

/**
 * @brief Map a big-endian mode field ('A', 'D' or 'M' in the high byte).
 *
 * @return ChunkMode The mode, or ChunkMode::Unknown for any other value.
 */
ChunkMode chunk_mode_from_wire(std::uint32_t value) noexcept {
  switch (value) {
  case wire_add:
    return ChunkMode::Add;
  case wire_delete:
    return ChunkMode::Delete;
  case wire_modify:
    return ChunkMode::Modify;
  default:
    return ChunkMode::Unknown;
  }
}

/**
 * @brief Map a big-endian compression field ('N' or 'Z' in the high byte).
 */
CompressionMode compression_mode_from_wire(std::uint32_t value) noexcept {
  switch (value) {
  case wire_none:
    return CompressionMode::None;
  case wire_zlib:
    return CompressionMode::Zlib;
  default:
    return CompressionMode::Unknown;
  }
}

/**
 * @brief Wire value of a chunk mode; 0 for Unknown.
 */
std::uint32_t to_wire(ChunkMode mode) noexcept {
  switch (mode) {
  case ChunkMode::Add:
    return wire_add;
  case ChunkMode::Delete:
    return wire_delete;
  case ChunkMode::Modify:
    return wire_modify;
  case ChunkMode::Unknown:
    break;
  }
  return 0;
}

std::uint32_t to_wire(CompressionMode compression) noexcept {
  switch (compression) {
  case CompressionMode::None:
    return wire_none;
  case CompressionMode::Zlib:
    return wire_zlib;
  case CompressionMode::Unknown:
    break;
  }
  return 0;
}

std::string_view to_string(ChunkMode mode) noexcept {
  switch (mode) {
  case ChunkMode::Add:
    return "add";
  case ChunkMode::Delete:
    return "delete";
  case ChunkMode::Modify:
    return "modify";
  case ChunkMode::Unknown:
    break;
  }
  return "unknown";
}

std::string_view to_string(CompressionMode compression) noexcept {
  switch (compression) {
  case CompressionMode::None:
    return "none";
  case CompressionMode::Zlib:
    return "zlib";
  case CompressionMode::Unknown:
    break;
  }
  return "unknown";
}

ChunkMode Entry::mode() const noexcept {
  return chunks.empty() ? ChunkMode::Unknown : chunks.front().mode;
}

/**
 * @brief Decode an ETRY payload into an Entry.
 *
 * The payload is a length-prefixed path, a big-endian chunk count, then for
 * each chunk a packed ChunkHeader followed by `size` data bytes. Chunk data
 * is copied out, so the returned Entry does not refer to @p data.
 *
 * @param data Start of the payload.
 * @param size Payload length.
 * @return Entry The decoded entry with its chunks in stream order.
 * @throws ZipatchError PathSizeTooLarge for a path over 1024 bytes,
 * UnexpectedEndOfFile when the path, the chunk headers or any chunk's data
 * run past the payload.
 */
Entry parse_entry(const char *data, std::size_t size) {
  detail::PayloadCursor cursor(data, size, "ETRY");

  Entry entry;
  entry.path = cursor.read_path();
  const auto count = cursor.read_u32("chunk count");
  // Reject counts that cannot fit before reserving storage for them.
  cursor.require(static_cast<std::size_t>(count) * chunk_header_size,
                 std::to_string(count) + " chunk headers");
  entry.chunks.reserve(count);

  for (std::size_t i = 0; i < count; ++i) {
    const auto label = chunk_label(i, count);
    auto header = reinterpret_cast<const detail::ChunkHeader *>(
        cursor.take(chunk_header_size, label + " header"));

    Chunk chunk;
    chunk.mode = chunk_mode_from_wire(load_u32(header->mode));
    copy_digest(header->prev_hash, chunk.prev_hash);
    copy_digest(header->next_hash, chunk.next_hash);
    chunk.compression =
        compression_mode_from_wire(load_u32(header->compression));
    chunk.declared_size = load_u32(header->size);
    chunk.prev_size = load_u32(header->prev_size);
    chunk.next_size = load_u32(header->next_size);

    const char *bytes = cursor.take(chunk.declared_size, label + " data");
    chunk.data.assign(bytes, bytes + chunk.declared_size);
    entry.chunks.push_back(std::move(chunk));
  }
  return entry;
}

/**
 * @brief Produce the bytes a chunk contributes to its file.
 *
 * Stored chunks are returned as is. Zlib chunks are inflated to at most
 * next_size bytes; when inflation fails the compressed bytes are returned
 * instead and the failure is logged.
 *
 * @param chunk Chunk to decode.
 * @param log Logger for warnings and the fallback notice.
 * @return std::vector<char> Bytes to write.
 * @throws ZipatchError UnknownCompressionMode for an unrecognized
 * compression field.
 */
std::vector<char> decode_chunk_data(const Chunk &chunk, Logger &log) {
  switch (chunk.compression) {
  case CompressionMode::None:
    return chunk.data;

  case CompressionMode::Zlib: {
    if (!chunk.data.empty() &&
        static_cast<unsigned char>(chunk.data.front()) != 0x78)
      ZIPATCH_READER_LOG(log, warning)
          << "Unexpected ZLIB header byte: 0x" << std::hex << std::uppercase
          << static_cast<int>(static_cast<unsigned char>(chunk.data.front()))
          << " (expected 0x78)";
    try {
      auto inflated = inflate_zlib_chunk(chunk.data.data(), chunk.data.size(),
                                         chunk.next_size);
      if (inflated.size() != chunk.next_size)
        ZIPATCH_READER_LOG(log, warning)
            << "Decompressed size (" << inflated.size()
            << ") doesn't match expected size (" << chunk.next_size << ")";
      ZIPATCH_READER_LOG(log, debug)
          << "Inflated " << inflated.size() << " bytes from "
          << chunk.data.size() << " compressed bytes";
      return inflated;
    } catch (const ZipatchError &e) {
      if (e.code() != Errc::DecompressionFailed)
        throw;
      ZIPATCH_READER_LOG(log, error) << "Failed to decompress ZLIB data: "
                                     << e.what();
      ZIPATCH_READER_LOG(log, warning)
          << "Writing compressed data directly as fallback ("
          << chunk.data.size() << " bytes)";
      return chunk.data;
    }
  }

  case CompressionMode::Unknown:
    break;
  }
  throw ZipatchError(Errc::UnknownCompressionMode,
                     "chunk compression mode is not none or zlib");
}

/**
 * @brief Apply a decoded entry below options.output_root.
 *
 * Delete entries remove the target file. Every other mode recreates the
 * file from the decoded chunks and then compares the SHA-1 of the written
 * bytes with the last chunk's next_hash. Modify entries first compare the
 * existing file with the first chunk's prev_hash, but a mismatch only warns.
 *
 * @param entry Entry to apply.
 * @param options Output root and the prev_hash size limit.
 * @param log Logger for progress and warnings.
 * @throws ZipatchError UnsafePath for a path above the output root,
 * UnknownCompressionMode, HashVerificationFailed (the written file is kept)
 * or IoError.
 */
void apply_entry(const Entry &entry, const Options &options, Logger &log) {
  const auto output_path = resolve_output_path(options.output_root, entry.path);

  if (entry.chunks.empty()) {
    ZIPATCH_READER_LOG(log, warning)
        << "No chunks found for file: " << entry.path;
    return;
  }

  const auto mode = entry.mode();
  if (mode == ChunkMode::Delete) {
    delete_target(output_path, log);
    return;
  }

  ensure_parent_directories(output_path);

  switch (mode) {
  case ChunkMode::Modify:
    ZIPATCH_READER_LOG(log, info)
        << "Modify operation detected for file: " << output_path.string();
    if (previous_content_matches(entry.chunks.front(), output_path, options,
                                 log)) {
      ZIPATCH_READER_LOG(log, info)
          << "Existing file hash verified for modification: "
          << output_path.string();
    } else {
      ZIPATCH_READER_LOG(log, warning)
          << "Cannot verify previous content of " << output_path.string()
          << ", proceeding with modification; result may be incorrect";
    }
    break;
  case ChunkMode::Add:
    ZIPATCH_READER_LOG(log, info)
        << "Add operation detected for file: " << output_path.string();
    if (std::error_code ec; fs::exists(output_path, ec))
      ZIPATCH_READER_LOG(log, warning)
          << "File already exists for ADD operation: " << output_path.string()
          << ", it will be overwritten";
    break;
  default:
    ZIPATCH_READER_LOG(log, warning)
        << "Unknown operation mode for file: " << output_path.string();
    break;
  }

  Sha1 hasher;
  std::uint64_t written = 0;
  {
    io::stream<io::file_sink> out(output_path.string(),
                                  std::ios::binary | std::ios::trunc);
    if (!out->is_open())
      throw ZipatchError(Errc::IoError,
                         "failed to create " + output_path.string());

    const auto count = entry.chunks.size();
    for (std::size_t i = 0; i < count; ++i) {
      const auto &chunk = entry.chunks[i];
      ZIPATCH_READER_LOG(log, debug)
          << "Processing " << chunk_label(i, count) << " (mode: "
          << to_string(chunk.mode) << ") for file: " << output_path.string();

      if (chunk.declared_size == 0) {
        ZIPATCH_READER_LOG(log, debug) << "Skipping chunk with size 0";
        continue;
      }
      if (chunk.compression == CompressionMode::Unknown)
        throw ZipatchError(Errc::UnknownCompressionMode,
                           chunk_label(i, count) + " of " + entry.path +
                               " has an unrecognized compression mode");

      const auto bytes = decode_chunk_data(chunk, log);
      out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
      if (!out)
        throw ZipatchError(Errc::IoError,
                           "failed to write " + output_path.string());
      hasher.update(bytes.data(), bytes.size());
      written += bytes.size();
      ZIPATCH_READER_LOG(log, trace) << "Wrote " << bytes.size() << " bytes";
    }

    out.flush();
    if (!out)
      throw ZipatchError(Errc::IoError,
                         "failed to flush " + output_path.string());
  }

  const auto actual = hasher.finish();
  const auto &expected = entry.chunks.back().next_hash;
  if (actual != expected) {
    if (written != 0 || !is_zero_digest(expected))
      throw ZipatchError(Errc::HashVerificationFailed,
                         "final hash mismatch for " + output_path.string() +
                             ": expected " + to_hex(expected) + ", got " +
                             to_hex(actual) + " over " +
                             std::to_string(written) + " bytes");
    ZIPATCH_READER_LOG(log, debug)
        << "Empty file accepted against zero hash: " << output_path.string();
  }

  ZIPATCH_READER_LOG(log, info)
      << "Final hash verification successful for file: "
      << output_path.string();
}
} // namespace zipatch_reader
