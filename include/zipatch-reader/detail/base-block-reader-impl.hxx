#pragma once

#include <zipatch-reader/block-header.hxx>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zipatch_reader::detail {
/**
 * @class BaseBlockReaderImpl
 * @brief Framing state machine for a ZiPatch byte stream.
 *
 * The reader consumes arbitrary-sized input buffers and reports each framing
 * milestone (signature checked, header complete, payload complete, CRC
 * complete) as an Event. It is intentionally independent of any iostreams
 * interface so it can be fed from a Boost.Iostreams device, a std::istream
 * or a test buffer alike, and it never interprets payloads itself.
 */
class BaseBlockReaderImpl {
public:
  /** @enum State Parsing states for the internal state machine. */
  enum class State { ReadMagic, ReadHeader, ReadPayload, ReadCrc };

  /** @enum Event Milestones returned by next(). */
  enum class Event {
    NeedInput,     /**< @brief Input exhausted; feed more bytes. */
    MagicVerified, /**< @brief The 12-byte signature matched. */
    HeaderReady,   /**< @brief current_header holds a decoded header. */
    PayloadReady,  /**< @brief payload holds the complete payload. */
    CrcReady       /**< @brief crc holds the block's trailer value. */
  };

  // Public data members keep the state easy to introspect for the driver
  // and for tests.

  std::array<char, magic_size>
      prefix_buffer{}; /**< @brief Accumulates the signature or a header. */
  std::size_t prefix_bytes_read =
      0; /**< @brief Bytes currently held in prefix_buffer. */
  BlockHeader current_header; /**< @brief Header of the block being read. */
  std::vector<char> payload;  /**< @brief Payload bytes received so far. */
  std::array<char, block_crc_size> crc_buffer{}; /**< @brief CRC bytes. */
  std::size_t crc_bytes_read = 0; /**< @brief Bytes held in crc_buffer. */
  std::uint32_t crc = 0; /**< @brief Big-endian trailer of the last block. */
  std::uint64_t bytes_consumed =
      0; /**< @brief Total input bytes consumed since construction. */
  State state = State::ReadMagic; /**< @brief Current state of the reader. */

  BaseBlockReaderImpl();

  /**
   * @brief Consume input until the next milestone or the end of the buffer.
   *
   * @param src_begin Reference to the start of the input buffer; advanced by
   * the number of bytes consumed.
   * @param src_end One-past-end pointer of the input buffer.
   * @return The milestone reached, or Event::NeedInput when the buffer is
   * exhausted without reaching one.
   * @throws ZipatchError InvalidMagicNumber when the signature differs.
   */
  Event next(const char *&src_begin, const char *const src_end);

  /**
   * @brief True when input may end here without truncating anything.
   */
  bool at_block_boundary() const noexcept;
};
} // namespace zipatch_reader::detail
