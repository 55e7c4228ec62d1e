#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace zipatch_reader {
/// 20-byte SHA-1 digest as carried by ETRY chunks.
using Sha1Digest = std::array<unsigned char, 20>;

/**
 * @class Sha1
 * @brief Incremental SHA-1 over byte ranges, backed by OpenSSL EVP.
 */
class Sha1 {
public:
  Sha1();

  void update(const char *data, std::size_t size);

  /// Finalize and return the digest. The object must not be reused.
  Sha1Digest finish();

private:
  struct ContextDeleter {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

/// One-shot SHA-1 of a buffer.
Sha1Digest sha1(const char *data, std::size_t size);

/**
 * @brief SHA-1 of a whole file, read in fixed-size blocks.
 * @throws ZipatchError IoError if the file cannot be read.
 */
Sha1Digest sha1_file(const std::filesystem::path &path);

/// True when every digest byte is zero ("no content expected").
bool is_zero_digest(const Sha1Digest &digest) noexcept;

/// Uppercase hex rendering of a digest.
std::string to_hex(const Sha1Digest &digest);
} // namespace zipatch_reader
