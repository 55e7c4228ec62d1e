/**
 * @file zipatch-sink.hxx
 * @brief Defines a sink device that feeds a ZiPatch stream into a
 * BlockStreamDriver using Boost.Iostreams.
 */

#pragma once

#include <zipatch-reader/block-stream-driver.hxx>

#include <boost/iostreams/categories.hpp>

#include <cstddef>
#include <ios>
#include <memory>
#include <utility>

namespace zipatch_reader {
/**
 * @brief Boost.Iostreams-compatible sink that parses and applies a ZiPatch
 * stream as it is written.
 *
 * Every byte written to the sink is pushed into a shared BlockStreamDriver,
 * so blocks are applied as soon as they are complete. Devices are copied by
 * Boost.Iostreams, hence the driver is held through a shared_ptr; keep your
 * own copy to call finish() once the stream is complete and to read the
 * summary.
 *
 * @code{.cpp}
 * #include <boost/iostreams/copy.hpp>
 * #include <boost/iostreams/device/file.hpp>
 * #include <zipatch-reader/zipatch-sink.hxx>
 *
 * namespace io = boost::iostreams;
 *
 * int main() {
 *   auto driver = std::make_shared<zipatch_reader::BlockStreamDriver>(
 *       zipatch_reader::Options{});
 *   io::copy(io::file_source("D2010.09.18.0000.patch", std::ios::binary),
 *            zipatch_reader::ZipatchSink(driver));
 *   driver->finish();
 * }
 * @endcode
 *
 * @note Exceptions raised by the driver (ZipatchError) propagate out of the
 * write call and therefore out of io::copy or the owning stream.
 */
class ZipatchSink {
public:
  /// Character type used by the stream.
  using char_type = char;
  /// Device category for Boost.Iostreams.
  using category = boost::iostreams::sink_tag;

  /**
   * @brief Constructs the sink around a shared driver.
   *
   * @param driver Driver receiving every written byte.
   */
  explicit ZipatchSink(std::shared_ptr<BlockStreamDriver> driver)
      : driver_(std::move(driver)) {}

  /**
   * @brief Push n bytes into the driver.
   *
   * @return Always n: the driver consumes everything it is given.
   */
  std::streamsize write(const char_type *s, std::streamsize n) {
    driver_->feed(s, static_cast<std::size_t>(n));
    return n;
  }

  /// The driver behind this sink.
  BlockStreamDriver &driver() const noexcept { return *driver_; }

private:
  std::shared_ptr<BlockStreamDriver> driver_;
};
} // namespace zipatch_reader
