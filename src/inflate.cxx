#include <zipatch-reader/error.hxx>
#include <zipatch-reader/inflate.hxx>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <algorithm>
#include <ios>
#include <new>
#include <string>

namespace io = boost::iostreams;

namespace zipatch_reader {
namespace {
/**
 * @brief Size of each read from the decompressor.
 *
 * The output grows block by block, so an oversized next_size costs nothing
 * beyond the bytes the DEFLATE stream actually produces.
 */
constexpr std::size_t inflate_block_size = 64 * 1024;
} // unnamed namespace

/**
 * @brief Inflate the raw DEFLATE body of a zlib-framed chunk.
 *
 * The 2-byte zlib header and 4-byte Adler-32 trailer are skipped rather than
 * checked. At most @p expected_size bytes are produced; a stream that ends
 * early yields fewer bytes.
 *
 * @param data Chunk data including the zlib framing.
 * @param size Length of @p data.
 * @param expected_size Upper bound on the inflated size (the chunk's
 * next_size).
 * @return std::vector<char> Inflated bytes.
 * @throws ZipatchError DecompressionFailed on short input, corrupt DEFLATE
 * data or allocation failure.
 */
std::vector<char> inflate_zlib_chunk(const char *data, std::size_t size,
                                     std::size_t expected_size) {
  if (size < zlib_header_size + zlib_trailer_size)
    throw ZipatchError(Errc::DecompressionFailed,
                       "zlib data of " + std::to_string(size) +
                           " bytes is too short for its framing");

  io::zlib_params params;
  params.noheader = true;

  io::filtering_istream in;
  in.push(io::zlib_decompressor(params));
  in.push(io::array_source(data + zlib_header_size,
                           size - zlib_header_size - zlib_trailer_size));
  in.exceptions(std::ios::badbit);

  std::vector<char> out;
  try {
    std::vector<char> block(std::min(expected_size, inflate_block_size));
    while (out.size() < expected_size) {
      const auto wanted = std::min(block.size(), expected_size - out.size());
      in.read(block.data(), static_cast<std::streamsize>(wanted));
      const auto got = static_cast<std::size_t>(in.gcount());
      out.insert(out.end(), block.data(), block.data() + got);
      if (got < wanted)
        break;
    }
  } catch (const io::zlib_error &e) {
    throw ZipatchError(Errc::DecompressionFailed,
                       std::string("inflate failed: ") + e.what() +
                           " (zlib error " + std::to_string(e.error()) + ")");
  } catch (const std::ios_base::failure &e) {
    throw ZipatchError(Errc::DecompressionFailed,
                       std::string("inflate failed: ") + e.what());
  } catch (const std::bad_alloc &) {
    throw ZipatchError(Errc::DecompressionFailed,
                       "out of memory after inflating " +
                           std::to_string(out.size()) + " of " +
                           std::to_string(expected_size) + " bytes");
  }
  return out;
}
} // namespace zipatch_reader
