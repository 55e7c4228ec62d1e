#pragma once

#include <zipatch-reader/block-observer.hxx>
#include <zipatch-reader/detail/base-block-reader-impl.hxx>
#include <zipatch-reader/logging.hxx>
#include <zipatch-reader/options.hxx>

#include <cstddef>
#include <cstdint>
#include <istream>

namespace zipatch_reader {
/**
 * @struct PatchSummary
 * @brief Counters collected while processing one or more patch files.
 */
struct PatchSummary {
  std::uint64_t files_processed = 0;
  std::uint64_t files_failed = 0;
  std::uint64_t blocks = 0;
  std::uint64_t entries_applied = 0;
  std::uint64_t entries_failed = 0;
  std::uint64_t directories_created = 0;
  std::uint64_t directories_deleted = 0;
  std::uint64_t bytes_consumed = 0;

  PatchSummary &operator+=(const PatchSummary &other);
};

/**
 * @class BlockStreamDriver
 * @brief Reads a ZiPatch stream block by block and applies each block.
 *
 * Bytes are pushed in with feed() in buffers of any size; finish() marks the
 * end of input. Each complete payload is decoded and, when Options::extract
 * is set, applied under Options::output_root before the next block is read.
 * Framing errors throw and leave the driver unusable; an entry failure
 * throws too unless Options::continue_on_entry_error is set.
 *
 * @code{.cpp}
 * zipatch_reader::Options options;
 * options.output_root = "out";
 * zipatch_reader::BlockStreamDriver driver(options);
 * std::ifstream in("D2010.09.18.0000.patch", std::ios::binary);
 * driver.run(in);
 * @endcode
 */
class BlockStreamDriver {
public:
  explicit BlockStreamDriver(Options options,
                             BlockObserver *observer = nullptr);

  /**
   * @brief Consume a buffer, processing every block it completes.
   */
  void feed(const char *data, std::size_t size);

  /**
   * @brief Declare the end of input.
   * @throws ZipatchError UnexpectedEndOfFile when input stopped inside the
   * signature, a header, a payload or a CRC.
   */
  void finish();

  /**
   * @brief Feed a whole stream in fixed-size buffers, then finish().
   */
  void run(std::istream &in, std::size_t buffer_size = 64 * 1024);

  std::uint64_t bytes_consumed() const noexcept {
    return reader_.bytes_consumed;
  }
  const PatchSummary &summary() const noexcept { return summary_; }
  const Options &options() const noexcept { return options_; }
  Logger &logger() noexcept { return log_; }

private:
  void on_header();
  void on_payload();
  void on_crc();
  void dispatch();
  void process_entry(const char *data, std::size_t size);

  Options options_;
  BlockObserver *observer_;
  Logger log_;
  detail::BaseBlockReaderImpl reader_;
  PatchSummary summary_;
};
} // namespace zipatch_reader
