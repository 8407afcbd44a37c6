#include "fileweave/common/hash.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace fileweave::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

Result<std::string> sha256_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(
        make_error(ErrorKind::NotFound, path, "unable to open file for hashing"));
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                               &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure(make_error(ErrorKind::Internal, path,
                                                   "sha256 context initialisation failed"));
  }

  std::array<char, 64 * 1024> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = in.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
      return Result<std::string>::failure(
          make_error(ErrorKind::Internal, path, "sha256 update failed"));
    }
  }
  if (in.bad()) {
    return Result<std::string>::failure(make_error(ErrorKind::Io, path, "read failed while hashing"));
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    return Result<std::string>::failure(
        make_error(ErrorKind::Internal, path, "sha256 finalisation failed"));
  }
  return Result<std::string>::success(to_hex(digest, length));
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    return Result<std::string>::failure(
        make_error(ErrorKind::Internal, "random generator failure"));
  }
  return Result<std::string>::success(to_hex(buffer.data(), buffer.size()));
}

} // namespace fileweave::common
