#include <zipatch-reader/detail/base-block-reader-impl.hxx>

#include <boost/endian/conversion.hpp>

#include <algorithm>

namespace zipatch_reader::detail {
namespace {
/**
 * @brief Upper bound on payload storage reserved from a header's size field.
 *
 * Larger payloads grow as their bytes actually arrive, so a corrupt size
 * field in a truncated stream cannot force a huge allocation up front.
 */
constexpr std::size_t payload_reserve_limit = 1 << 20;

/**
 * @brief Copy up to `needed - have` bytes from the source into a buffer.
 *
 * @return Number of bytes copied.
 */
std::size_t fill(char *buffer, std::size_t &have, std::size_t needed,
                 const char *&src_begin, const char *const src_end) {
  auto available = static_cast<std::size_t>(src_end - src_begin);
  auto to_copy = std::min(needed - have, available);
  std::copy(src_begin, src_begin + to_copy, buffer + have);
  src_begin += to_copy;
  have += to_copy;
  return to_copy;
}
} // unnamed namespace

/**
 * @brief Construct a reader positioned before the file signature.
 */
BaseBlockReaderImpl::BaseBlockReaderImpl() {}

/**
 * @brief Main framing loop: signature, then repeating header, payload and
 * CRC.
 *
 * Zero-length payloads complete without needing further input, so a
 * PayloadReady event can be returned from an empty buffer.
 */
BaseBlockReaderImpl::Event
BaseBlockReaderImpl::next(const char *&src_begin, const char *const src_end) {
  for (;;) {
    switch (state) {
    case State::ReadMagic: {
      if (src_begin == src_end)
        return Event::NeedInput;
      bytes_consumed += fill(prefix_buffer.data(), prefix_bytes_read,
                             magic_size, src_begin, src_end);
      if (prefix_bytes_read == magic_size) {
        verify_magic(prefix_buffer.data(), prefix_bytes_read);
        prefix_bytes_read = 0;
        state = State::ReadHeader;
        return Event::MagicVerified;
      }
      break;
    }

    case State::ReadHeader: {
      if (src_begin == src_end)
        return Event::NeedInput;
      bytes_consumed += fill(prefix_buffer.data(), prefix_bytes_read,
                             block_header_size, src_begin, src_end);
      if (prefix_bytes_read == block_header_size) {
        current_header = decode_block_header(prefix_buffer.data());
        prefix_bytes_read = 0;
        payload.clear();
        payload.reserve(std::min<std::size_t>(current_header.payload_size,
                                              payload_reserve_limit));
        state = State::ReadPayload;
        return Event::HeaderReady;
      }
      break;
    }

    case State::ReadPayload: {
      auto remaining = current_header.payload_size - payload.size();
      if (remaining == 0) {
        crc_bytes_read = 0;
        state = State::ReadCrc;
        return Event::PayloadReady;
      }
      if (src_begin == src_end)
        return Event::NeedInput;

      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto const to_copy = std::min<std::size_t>(remaining, src_avail);
      payload.insert(payload.end(), src_begin, src_begin + to_copy);
      src_begin += to_copy;
      bytes_consumed += to_copy;
      break;
    }

    case State::ReadCrc: {
      if (src_begin == src_end)
        return Event::NeedInput;
      bytes_consumed += fill(crc_buffer.data(), crc_bytes_read,
                             block_crc_size, src_begin, src_end);
      if (crc_bytes_read == block_crc_size) {
        crc = boost::endian::load_big_u32(
            reinterpret_cast<const unsigned char *>(crc_buffer.data()));
        crc_bytes_read = 0;
        state = State::ReadHeader;
        return Event::CrcReady;
      }
      break;
    }
    }
  }
}

bool BaseBlockReaderImpl::at_block_boundary() const noexcept {
  return state == State::ReadHeader && prefix_bytes_read == 0;
}
} // namespace zipatch_reader::detail
