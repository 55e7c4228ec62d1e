#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace zipatch_reader {
/**
 * @enum Errc
 * @brief Failure kinds reported while reading or applying a ZiPatch stream.
 */
enum class Errc {
  InvalidMagicNumber,     /**< @brief File signature does not match. */
  UnexpectedEndOfFile,    /**< @brief Short read at any framing boundary. */
  UnknownBlockType,       /**< @brief Block tag outside the known set. */
  PathSizeTooLarge,       /**< @brief Path length field exceeds 1024. */
  UnknownCompressionMode, /**< @brief Chunk compression tag not recognized. */
  HashVerificationFailed, /**< @brief Final SHA-1 of an entry mismatched. */
  FileSizeMismatch,       /**< @brief Consumed bytes differ from file size. */
  CrcMismatch,            /**< @brief Block trailer CRC mismatch (opt-in). */
  DecompressionFailed,    /**< @brief DEFLATE data could not be inflated. */
  UnsafePath,             /**< @brief Patch path climbs above the root. */
  IoError                 /**< @brief Filesystem or stream failure. */
};

/**
 * @brief Name of an error code, e.g. "HashVerificationFailed".
 */
std::string_view to_string(Errc code) noexcept;

/**
 * @class ZipatchError
 * @brief Exception thrown for every failure raised by this library.
 *
 * The message is prefixed with the error code name. Filesystem failures keep
 * the originating std::error_code.
 */
class ZipatchError : public std::runtime_error {
public:
  ZipatchError(Errc code, const std::string &message);
  ZipatchError(Errc code, const std::string &message, std::error_code cause);

  Errc code() const noexcept { return code_; }
  const std::error_code &cause() const noexcept { return cause_; }

private:
  Errc code_;
  std::error_code cause_;
};
} // namespace zipatch_reader
