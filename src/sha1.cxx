#include <zipatch-reader/error.hxx>
#include <zipatch-reader/sha1.hxx>

#include <boost/algorithm/hex.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace zipatch_reader {
namespace {
std::string openssl_error(const char *context) {
  const unsigned long err = ERR_get_error();
  if (err == 0)
    return std::string(context) + ": unknown OpenSSL error";

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(context) + ": " + buf;
}
} // unnamed namespace

void Sha1::ContextDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

/**
 * @brief Allocate an EVP context initialized for SHA-1.
 *
 * @throws std::runtime_error carrying the OpenSSL error string.
 */
Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_)
    throw std::runtime_error(openssl_error("EVP_MD_CTX_new"));
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
    throw std::runtime_error(openssl_error("EVP_DigestInit_ex"));
}

void Sha1::update(const char *data, std::size_t size) {
  if (size == 0)
    return;
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
    throw std::runtime_error(openssl_error("EVP_DigestUpdate"));
}

Sha1Digest Sha1::finish() {
  Sha1Digest digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1 ||
      length != digest.size())
    throw std::runtime_error(openssl_error("EVP_DigestFinal_ex"));
  return digest;
}

Sha1Digest sha1(const char *data, std::size_t size) {
  Sha1 hasher;
  hasher.update(data, size);
  return hasher.finish();
}

/**
 * @brief SHA-1 of a file's contents, read in 64 KiB blocks.
 *
 * @param path File to hash.
 * @return Sha1Digest Digest of the whole file.
 * @throws ZipatchError IoError when the file cannot be opened or read.
 */
Sha1Digest sha1_file(const std::filesystem::path &path) {
  boost::iostreams::stream<boost::iostreams::file_source> in(
      path.string(), std::ios::binary);
  if (!in->is_open())
    throw ZipatchError(Errc::IoError, "failed to open " + path.string() +
                                          " for hashing");

  Sha1 hasher;
  std::vector<char> buffer(64 * 1024);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    hasher.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
  }
  if (in.bad())
    throw ZipatchError(Errc::IoError, "failed to read " + path.string() +
                                          " for hashing");
  return hasher.finish();
}

bool is_zero_digest(const Sha1Digest &digest) noexcept {
  return std::all_of(digest.begin(), digest.end(),
                     [](unsigned char b) { return b == 0; });
}

std::string to_hex(const Sha1Digest &digest) {
  std::string out;
  boost::algorithm::hex(digest.begin(), digest.end(), std::back_inserter(out));
  return out;
}
} // namespace zipatch_reader
