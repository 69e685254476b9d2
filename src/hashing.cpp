#include <cqa/hashing.h>

#include <cqa/errors.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace cqa {
namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *context) const { EVP_MD_CTX_free(context); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext NewSha256Context() {
  DigestContext context(EVP_MD_CTX_new());
  if (!context) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return context;
}

void Update(EVP_MD_CTX *context, const void *data, std::size_t size) {
  if (EVP_DigestUpdate(context, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Finish(EVP_MD_CTX *context) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_length = 0;
  if (EVP_DigestFinal_ex(context, hash, &hash_length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  std::ostringstream stream;
  for (unsigned int i = 0; i < hash_length; ++i) {
    stream << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
  }
  return stream.str();
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto context = NewSha256Context();
  Update(context.get(), data.data(), data.size());
  return Finish(context.get());
}

std::string Sha256FileHex(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw ResourceError("Failed to open file for hashing: " + path.string());
  }
  auto context = NewSha256Context();
  std::array<char, 64 * 1024> buffer{};
  while (stream) {
    stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = stream.gcount();
    if (count > 0) {
      Update(context.get(), buffer.data(), static_cast<std::size_t>(count));
    }
  }
  if (stream.bad()) {
    throw ResourceError("Failed to read file for hashing: " + path.string());
  }
  return Finish(context.get());
}

FileFingerprint FingerprintFile(const std::filesystem::path &path) {
  std::error_code error;
  const auto size = std::filesystem::file_size(path, error);
  if (error) {
    throw ResourceError("Failed to stat " + path.string() + ": " +
                        error.message());
  }
  return FileFingerprint{path.string(), Sha256FileHex(path), size};
}

} // namespace cqa
