/**
 * @file artifact_checksum.cpp
 * @brief SHA-256 helpers backed by OpenSSL EVP
 */

#include "Packwright/pipeline/artifact_checksum.hpp"

#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace Packwright::pipeline {

namespace {

struct MdContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

Result<MdContext> beginSha256() {
  MdContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return Result<MdContext>::error("Failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<MdContext>::error("Failed to initialize SHA-256 digest");
  }
  return Result<MdContext>::ok(std::move(ctx));
}

Result<Sha256Digest> finishSha256(EVP_MD_CTX* ctx) {
  Sha256Digest digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1 || length != digest.size()) {
    return Result<Sha256Digest>::error("Failed to finalize SHA-256 digest");
  }
  return Result<Sha256Digest>::ok(digest);
}

} // namespace

Result<Sha256Digest> sha256Data(std::string_view data) {
  auto ctx = beginSha256();
  if (ctx.isError()) {
    return Result<Sha256Digest>::error(ctx.error());
  }
  if (EVP_DigestUpdate(ctx.value().get(), data.data(), data.size()) != 1) {
    return Result<Sha256Digest>::error("Failed to update SHA-256 digest");
  }
  return finishSha256(ctx.value().get());
}

Result<Sha256Digest> sha256File(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<Sha256Digest>::error("Cannot open file for hashing: " + path.string());
  }

  auto ctx = beginSha256();
  if (ctx.isError()) {
    return Result<Sha256Digest>::error(ctx.error());
  }

  std::vector<char> buffer(64 * 1024);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = file.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.value().get(), buffer.data(), static_cast<usize>(count)) != 1) {
      return Result<Sha256Digest>::error("Failed to update SHA-256 digest");
    }
  }
  if (file.bad()) {
    return Result<Sha256Digest>::error("Read error while hashing: " + path.string());
  }

  return finishSha256(ctx.value().get());
}

std::string toHex(const Sha256Digest& digest) {
  static const char* kHexDigits = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (u8 byte : digest) {
    hex += kHexDigits[byte >> 4];
    hex += kHexDigits[byte & 0x0F];
  }
  return hex;
}

Result<std::string> writeChecksumFile(const fs::path& artifactPath, const fs::path& checksumPath) {
  auto digest = sha256File(artifactPath);
  if (digest.isError()) {
    return Result<std::string>::error(digest.error());
  }

  const std::string hex = toHex(digest.value());
  std::ofstream out(checksumPath, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return Result<std::string>::error("Cannot write checksum file: " + checksumPath.string());
  }
  out << hex << "  " << artifactPath.filename().string() << "\n";
  if (!out) {
    return Result<std::string>::error("Failed to write checksum file: " + checksumPath.string());
  }
  return Result<std::string>::ok(hex);
}

} // namespace Packwright::pipeline
