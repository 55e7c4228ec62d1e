#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>

namespace zipatch_reader {
/** @enum BlockType Closed set of block tags defined by the ZiPatch format. */
enum class BlockType { FHDR, APLY, APFS, ETRY, ADIR, DELD, Unknown };

/// Four ASCII bytes identifying a block.
using BlockTag = std::array<char, 4>;

/// Size of the fixed file signature.
inline constexpr std::size_t magic_size = 12;
/// Size of the block header: u32 payload size followed by the tag.
inline constexpr std::size_t block_header_size = 8;
/// Size of the CRC trailer following every payload.
inline constexpr std::size_t block_crc_size = 4;

/// 91 'Z' 'I' 'P' 'A' 'T' 'C' 'H' CR LF SUB LF
inline constexpr std::array<unsigned char, magic_size> zipatch_magic = {
    0x91, 'Z', 'I', 'P', 'A', 'T', 'C', 'H', 0x0D, 0x0A, 0x1A, 0x0A};

/**
 * @struct BlockHeader
 * @brief Decoded 8-byte header preceding each block payload.
 *
 * The raw tag is retained so an Unknown type can still be reported as read.
 */
struct BlockHeader {
  std::uint32_t payload_size = 0; /**< @brief Payload length in bytes. */
  BlockType block_type = BlockType::Unknown; /**< @brief Decoded tag. */
  BlockTag tag{}; /**< @brief Tag bytes as they appeared in the stream. */
};

/**
 * @brief Map a 4-byte tag to its BlockType by exact byte match.
 * @return BlockType::Unknown for any tag outside the known set.
 */
BlockType block_type_from_tag(const BlockTag &tag) noexcept;

/**
 * @brief Tag bytes for a known type. Unknown maps to "????".
 */
BlockTag block_type_to_tag(BlockType type) noexcept;

std::string_view to_string(BlockType type) noexcept;

/**
 * @brief Decode a block header from exactly block_header_size bytes.
 *
 * @param bytes Pointer to 8 bytes: big-endian size then the tag.
 */
BlockHeader decode_block_header(const char *bytes) noexcept;

/**
 * @brief Serialize a header back to its 8-byte wire form.
 *
 * Known types are written with their canonical tag; Unknown headers are
 * written with the retained raw tag.
 */
std::array<char, block_header_size>
encode_block_header(const BlockHeader &header) noexcept;

/**
 * @brief Read the next block header from a stream.
 *
 * @return An empty optional when the stream is exhausted before any header
 * byte, which is the normal end of a patch.
 * @throws ZipatchError UnexpectedEndOfFile when 1 to 7 bytes remain.
 */
std::optional<BlockHeader> read_block_header(std::istream &in);

/**
 * @brief Check a buffer against the ZiPatch signature.
 *
 * @throws ZipatchError UnexpectedEndOfFile if size < magic_size,
 * InvalidMagicNumber if the bytes differ.
 */
void verify_magic(const char *bytes, std::size_t size);

/**
 * @brief Consume and check the 12-byte signature from a stream.
 */
void verify_magic(std::istream &in);
} // namespace zipatch_reader
