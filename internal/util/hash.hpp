#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace assetdiff::util {

/*
  SHA-256 helpers (OpenSSL EVP).

  Used for artifact names and file content hashes, which must be stable
  across runs so re-rendering a redelivered job overwrites the same files.
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  // Fields are length-prefixed so ("ab","c") and ("a","bc") differ.
  Sha256& Field(std::string_view value);
  Sha256& Field(uint64_t value);

  void Update(const void* data, std::size_t size);

  std::string HexDigest();

 private:
  struct Ctx;
  std::unique_ptr<Ctx> ctx_;
};

std::string Sha256Hex(std::string_view data);
std::string Sha256File(const std::filesystem::path& path);

} // namespace assetdiff::util
