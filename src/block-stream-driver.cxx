#include <zipatch-reader/block-stream-driver.hxx>
#include <zipatch-reader/directory-ops.hxx>
#include <zipatch-reader/entry.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/metadata-blocks.hxx>

#include <boost/crc.hpp>
#include <boost/format.hpp>

#include <string>
#include <utility>
#include <vector>

namespace zipatch_reader {
namespace {
using Event = detail::BaseBlockReaderImpl::Event;
using State = detail::BaseBlockReaderImpl::State;

std::string tag_text(const BlockHeader &header) {
  return std::string(header.tag.data(), header.tag.size());
}

/**
 * @brief Errors that fail a single entry rather than the whole file.
 */
bool is_entry_failure(Errc code) {
  return code == Errc::UnknownCompressionMode ||
         code == Errc::HashVerificationFailed;
}
} // unnamed namespace

PatchSummary &PatchSummary::operator+=(const PatchSummary &other) {
  files_processed += other.files_processed;
  files_failed += other.files_failed;
  blocks += other.blocks;
  entries_applied += other.entries_applied;
  entries_failed += other.entries_failed;
  directories_created += other.directories_created;
  directories_deleted += other.directories_deleted;
  bytes_consumed += other.bytes_consumed;
  return *this;
}

BlockStreamDriver::BlockStreamDriver(Options options, BlockObserver *observer)
    : options_(std::move(options)), observer_(observer),
      log_(options_.verbosity) {}

/**
 * @brief Push a buffer through the reader state machine.
 *
 * Every event raised while the buffer is consumed is handled before feed
 * returns, so blocks completed by this buffer have been dispatched.
 *
 * @param data Bytes to consume; the buffer may split any field.
 * @param size Length of @p data.
 * @throws ZipatchError from framing checks and from the block appliers.
 */
void BlockStreamDriver::feed(const char *data, std::size_t size) {
  const char *begin = data;
  const char *const end = data + size;
  for (;;) {
    switch (reader_.next(begin, end)) {
    case Event::NeedInput:
      summary_.bytes_consumed = reader_.bytes_consumed;
      return;
    case Event::MagicVerified:
      ZIPATCH_READER_LOG(log_, info)
          << "Successfully verified ZiPatch file type header.";
      break;
    case Event::HeaderReady:
      on_header();
      break;
    case Event::PayloadReady:
      on_payload();
      break;
    case Event::CrcReady:
      on_crc();
      break;
    }
  }
}

/**
 * @brief Signal end of input.
 *
 * @throws ZipatchError UnexpectedEndOfFile unless the input stopped exactly
 * at a block boundary after the signature.
 */
void BlockStreamDriver::finish() {
  summary_.bytes_consumed = reader_.bytes_consumed;
  const auto &header = reader_.current_header;
  switch (reader_.state) {
  case State::ReadMagic:
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       "file is too short to contain a header (" +
                           std::to_string(reader_.prefix_bytes_read) +
                           " bytes)");
  case State::ReadHeader:
    if (!reader_.at_block_boundary())
      throw ZipatchError(Errc::UnexpectedEndOfFile,
                         "block header truncated after " +
                             std::to_string(reader_.prefix_bytes_read) +
                             " bytes at offset " +
                             std::to_string(reader_.bytes_consumed));
    ZIPATCH_READER_LOG(log_, info)
        << "End of stream reached after " << summary_.blocks << " blocks ("
        << reader_.bytes_consumed << " bytes).";
    return;
  case State::ReadPayload:
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       "payload of block type " +
                           std::string(to_string(header.block_type)) +
                           " truncated: got " +
                           std::to_string(reader_.payload.size()) + " of " +
                           std::to_string(header.payload_size) + " bytes");
  case State::ReadCrc:
    throw ZipatchError(Errc::UnexpectedEndOfFile,
                       "CRC of block type " +
                           std::string(to_string(header.block_type)) +
                           " truncated after " +
                           std::to_string(reader_.crc_bytes_read) + " bytes");
  }
}

/**
 * @brief Feed a whole stream in @p buffer_size pieces, then finish.
 */
void BlockStreamDriver::run(std::istream &in, std::size_t buffer_size) {
  std::vector<char> buffer(buffer_size);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    feed(buffer.data(), static_cast<std::size_t>(in.gcount()));
  }
  if (in.bad())
    throw ZipatchError(Errc::IoError, "stream failure after " +
                                          std::to_string(bytes_consumed()) +
                                          " bytes");
  finish();
}

void BlockStreamDriver::on_header() {
  const auto &header = reader_.current_header;
  const auto offset = reader_.bytes_consumed - block_header_size;
  ZIPATCH_READER_LOG(log_, debug) << "Block header at offset " << offset;

  if (header.block_type == BlockType::Unknown) {
    ZIPATCH_READER_LOG(log_, error)
        << "Unknown block type found: " << tag_text(header)
        << " (Size: " << header.payload_size << ")";
    throw ZipatchError(Errc::UnknownBlockType,
                       "tag '" + tag_text(header) + "' with payload size " +
                           std::to_string(header.payload_size) +
                           " at offset " + std::to_string(offset));
  }

  ZIPATCH_READER_LOG(log_, info)
      << "Found block type: " << to_string(header.block_type)
      << ", Size: " << header.payload_size;
  ++summary_.blocks;
  if (observer_)
    observer_->on_block(header);
}

void BlockStreamDriver::on_payload() {
  // With CRC checking on, dispatch waits until the trailer has been checked.
  if (!options_.verify_crc)
    dispatch();
}

void BlockStreamDriver::on_crc() {
  const auto &header = reader_.current_header;
  ZIPATCH_READER_LOG(log_, debug)
      << "CRC value read: " << boost::format("%08X") % reader_.crc;

  if (options_.verify_crc) {
    boost::crc_32_type crc;
    crc.process_bytes(header.tag.data(), header.tag.size());
    crc.process_bytes(reader_.payload.data(), reader_.payload.size());
    if (crc.checksum() != reader_.crc)
      throw ZipatchError(Errc::CrcMismatch,
                         (boost::format("block %1% at offset %2%: trailer "
                                        "%3$08X, computed %4$08X") %
                          to_string(header.block_type) %
                          (reader_.bytes_consumed - block_crc_size -
                           reader_.payload.size() - block_header_size) %
                          reader_.crc % crc.checksum())
                             .str());
    dispatch();
  }

  reader_.payload = std::vector<char>();
}

/**
 * @brief Decode the completed payload and hand it to the matching applier.
 *
 * Directory blocks and entries touch the filesystem only when
 * options.extract is set; they are always reported to the observer.
 */
void BlockStreamDriver::dispatch() {
  const auto &header = reader_.current_header;
  const char *data = reader_.payload.data();
  const auto size = reader_.payload.size();

  switch (header.block_type) {
  case BlockType::FHDR: {
    const auto record = parse_file_header(data, size);
    ZIPATCH_READER_LOG(log_, info) << "FHDR block data: " << record;
    if (observer_)
      observer_->on_file_header(record);
    break;
  }

  case BlockType::APLY: {
    const auto record = parse_apply(data, size);
    ZIPATCH_READER_LOG(log_, info) << "APLY block data: " << record;
    if (observer_)
      observer_->on_apply(record);
    break;
  }

  case BlockType::ADIR: {
    const auto op = parse_directory_op(data, size);
    ZIPATCH_READER_LOG(log_, info)
        << "ADIR block: Create directory: " << op.path;
    if (observer_)
      observer_->on_directory(header.block_type, op);
    if (options_.extract) {
      create_directory(op, options_.output_root, log_);
      ++summary_.directories_created;
    }
    break;
  }

  case BlockType::DELD: {
    const auto op = parse_directory_op(data, size);
    ZIPATCH_READER_LOG(log_, info)
        << "DELD block: Delete directory: " << op.path;
    if (observer_)
      observer_->on_directory(header.block_type, op);
    if (options_.extract) {
      delete_directory(op, options_.output_root, log_);
      ++summary_.directories_deleted;
    }
    break;
  }

  case BlockType::ETRY:
    process_entry(data, size);
    break;

  case BlockType::APFS:
    ZIPATCH_READER_LOG(log_, info)
        << "Payload data read for APFS block. No specific processing "
           "implemented.";
    break;

  case BlockType::Unknown:
    throw ZipatchError(Errc::UnknownBlockType,
                       "tag '" + tag_text(header) + "' cannot be dispatched");
  }
}

/**
 * @brief Decode and apply an ETRY payload.
 *
 * With continue_on_entry_error, UnknownCompressionMode and
 * HashVerificationFailed are counted and reported instead of rethrown.
 */
void BlockStreamDriver::process_entry(const char *data, std::size_t size) {
  const auto entry = parse_entry(data, size);
  ZIPATCH_READER_LOG(log_, info)
      << "ETRY block: Path: " << entry.path << ", Chunks: "
      << entry.chunks.size();
  if (observer_)
    observer_->on_entry(entry);
  if (!options_.extract)
    return;

  try {
    apply_entry(entry, options_, log_);
    ++summary_.entries_applied;
    ZIPATCH_READER_LOG(log_, info) << "Extracted file: " << entry.path;
  } catch (const ZipatchError &e) {
    if (!options_.continue_on_entry_error || !is_entry_failure(e.code()))
      throw;
    ++summary_.entries_failed;
    ZIPATCH_READER_LOG(log_, error)
        << "Entry " << entry.path << " failed, continuing: " << e.what();
    if (observer_)
      observer_->on_entry_failed(entry, e);
  }
}
} // namespace zipatch_reader
