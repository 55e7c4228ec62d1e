#include <zipatch-reader/error.hxx>

namespace zipatch_reader {
namespace {
std::string make_message(Errc code, const std::string &message) {
  std::string result(to_string(code));
  result += ": ";
  result += message;
  return result;
}
} // unnamed namespace

std::string_view to_string(Errc code) noexcept {
  switch (code) {
  case Errc::InvalidMagicNumber:
    return "InvalidMagicNumber";
  case Errc::UnexpectedEndOfFile:
    return "UnexpectedEndOfFile";
  case Errc::UnknownBlockType:
    return "UnknownBlockType";
  case Errc::PathSizeTooLarge:
    return "PathSizeTooLarge";
  case Errc::UnknownCompressionMode:
    return "UnknownCompressionMode";
  case Errc::HashVerificationFailed:
    return "HashVerificationFailed";
  case Errc::FileSizeMismatch:
    return "FileSizeMismatch";
  case Errc::CrcMismatch:
    return "CrcMismatch";
  case Errc::DecompressionFailed:
    return "DecompressionFailed";
  case Errc::UnsafePath:
    return "UnsafePath";
  case Errc::IoError:
    return "IoError";
  }
  return "Unknown";
}

ZipatchError::ZipatchError(Errc code, const std::string &message)
    : std::runtime_error(make_message(code, message)), code_(code) {}

ZipatchError::ZipatchError(Errc code, const std::string &message,
                           std::error_code cause)
    : std::runtime_error(make_message(code, message + " (" + cause.message() +
                                                ")")),
      code_(code), cause_(cause) {}
} // namespace zipatch_reader
