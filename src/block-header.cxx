#include <zipatch-reader/block-header.hxx>
#include <zipatch-reader/error.hxx>

#include <boost/algorithm/hex.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string>
#include <utility>

namespace zipatch_reader {
namespace {
constexpr std::array<std::pair<BlockType, std::string_view>, 6> known_tags = {{
    {BlockType::FHDR, "FHDR"},
    {BlockType::APLY, "APLY"},
    {BlockType::APFS, "APFS"},
    {BlockType::ETRY, "ETRY"},
    {BlockType::ADIR, "ADIR"},
    {BlockType::DELD, "DELD"},
}};

/**
 * @brief Upper-case hex rendering of a byte range, for error messages.
 */
std::string hex_upper(const char *bytes, std::size_t size) {
  std::string out;
  boost::algorithm::hex(bytes, bytes + size, std::back_inserter(out));
  return out;
}
} // unnamed namespace

/**
 * @brief Map a 4-byte ASCII tag to its block type by exact byte match.
 *
 * @param tag Tag bytes as read from the stream.
 * @return BlockType The matching type, or BlockType::Unknown.
 */
BlockType block_type_from_tag(const BlockTag &tag) noexcept {
  const std::string_view view(tag.data(), tag.size());
  for (const auto &[type, name] : known_tags)
    if (view == name)
      return type;
  return BlockType::Unknown;
}

/**
 * @brief Inverse of block_type_from_tag.
 *
 * @return BlockTag The tag for a known type; "????" for Unknown.
 */
BlockTag block_type_to_tag(BlockType type) noexcept {
  BlockTag tag = {'?', '?', '?', '?'};
  for (const auto &[known, name] : known_tags)
    if (known == type)
      std::copy(name.begin(), name.end(), tag.begin());
  return tag;
}

std::string_view to_string(BlockType type) noexcept {
  for (const auto &[known, name] : known_tags)
    if (known == type)
      return name;
  return "unknown";
}

/**
 * @brief Decode the 8 header bytes: big-endian payload size, then the tag.
 *
 * @param bytes Pointer to at least block_header_size bytes.
 * @return BlockHeader Decoded header; the type is Unknown for a foreign tag
 * and the raw tag is kept for reporting.
 */
BlockHeader decode_block_header(const char *bytes) noexcept {
  BlockHeader header;
  header.payload_size = boost::endian::load_big_u32(
      reinterpret_cast<const unsigned char *>(bytes));
  std::memcpy(header.tag.data(), bytes + 4, header.tag.size());
  header.block_type = block_type_from_tag(header.tag);
  return header;
}

/**
 * @brief Encode a header back into its 8 wire bytes.
 *
 * Known types are written with their canonical tag; an Unknown header keeps
 * the raw tag it was decoded from.
 *
 * @param header Header to encode.
 * @return std::array<char, block_header_size> Wire bytes.
 */
std::array<char, block_header_size>
encode_block_header(const BlockHeader &header) noexcept {
  std::array<char, block_header_size> bytes{};
  boost::endian::store_big_u32(reinterpret_cast<unsigned char *>(bytes.data()),
                               header.payload_size);
  const auto tag = header.block_type == BlockType::Unknown
                       ? header.tag
                       : block_type_to_tag(header.block_type);
  std::copy(tag.begin(), tag.end(), bytes.begin() + 4);
  return bytes;
}

/**
 * @brief Read one block header from a stream.
 *
 * @param in Stream positioned at a block boundary.
 * @return std::optional<BlockHeader> The header, or std::nullopt when the
 * stream ends cleanly before its first byte.
 * @throws ZipatchError UnexpectedEndOfFile on a partial header, IoError when
 * the stream goes bad.
 */
std::optional<BlockHeader> read_block_header(std::istream &in) {
  std::array<char, block_header_size> bytes{};
  in.read(bytes.data(), bytes.size());
  const auto got = static_cast<std::size_t>(in.gcount());
  if (in.bad())
    throw ZipatchError(Errc::IoError, "stream failure while reading a block "
                                      "header");
  if (got == 0)
    return std::nullopt;
  if (got < bytes.size())
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       "block header truncated after " + std::to_string(got) +
                           " of " + std::to_string(bytes.size()) + " bytes");
  return decode_block_header(bytes.data());
}

/**
 * @brief Check the 12-byte ZiPatch signature.
 *
 * @param bytes Bytes read from the start of the file.
 * @param size Number of bytes available.
 * @throws ZipatchError UnexpectedEndOfFile when fewer than 12 bytes are
 * available, InvalidMagicNumber with both signatures in hex on a mismatch.
 */
void verify_magic(const char *bytes, std::size_t size) {
  if (size < magic_size)
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       "file is too short to contain a header (" +
                           std::to_string(size) + " bytes)");
  if (std::memcmp(bytes, zipatch_magic.data(), magic_size) != 0) {
    const auto expected = reinterpret_cast<const char *>(zipatch_magic.data());
    throw ZipatchError(Errc::InvalidMagicNumber,
                       "header read " + hex_upper(bytes, magic_size) +
                           ", expected " + hex_upper(expected, magic_size));
  }
}

/**
 * @brief Stream overload: reads 12 bytes and checks them.
 */
void verify_magic(std::istream &in) {
  std::array<char, magic_size> bytes{};
  in.read(bytes.data(), bytes.size());
  if (in.bad())
    throw ZipatchError(Errc::IoError, "stream failure while reading the "
                                      "file signature");
  verify_magic(bytes.data(), static_cast<std::size_t>(in.gcount()));
}
} // namespace zipatch_reader
