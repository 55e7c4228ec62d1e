#include <zipatch-reader/detail/payload-cursor.hxx>
#include <zipatch-reader/directory-ops.hxx>
#include <zipatch-reader/error.hxx>

#include <boost/endian/conversion.hpp>

namespace zipatch_reader::detail {
std::uint32_t PayloadCursor::read_u32(std::string_view field) {
  const auto p = reinterpret_cast<const unsigned char *>(take(4, field));
  return boost::endian::load_big_u32(p);
}

void PayloadCursor::require(std::size_t count, std::string_view field) const {
  if (count > remaining())
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       std::string(block_) + " payload ends inside " +
                           std::string(field) + " (needed " +
                           std::to_string(count) + " bytes at offset " +
                           std::to_string(offset_) + ", " +
                           std::to_string(remaining()) + " left)");
}

const char *PayloadCursor::take(std::size_t count, std::string_view field) {
  require(count, field);
  const char *p = data_ + offset_;
  offset_ += count;
  return p;
}

std::string PayloadCursor::read_path() {
  const auto path_size = read_u32("path size");
  if (path_size > max_path_size)
    throw ZipatchError(Errc::PathSizeTooLarge,
                       std::string(block_) + " path size " +
                           std::to_string(path_size) + " exceeds " +
                           std::to_string(max_path_size));
  const char *p = take(path_size, "path");
  return std::string(p, path_size);
}
} // namespace zipatch_reader::detail
