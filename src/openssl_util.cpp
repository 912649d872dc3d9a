#include "openssl/openssl_util.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

#include "my_error_codes.hpp"

namespace hookrelay::opensslutil {

std::string sha256_hex(std::string_view data) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!context) {
    throw std::runtime_error("Failed to create digest context");
  }
  if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Failed to initialize digest");
  }
  if (1 != EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    throw std::runtime_error("Failed to update digest");
  }
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context.get(), hash, &length)) {
    throw std::runtime_error("Failed to finalize digest");
  }
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex += fmt::format("{:02x}", hash[i]);
  }
  return hex;
}

std::string base64_encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(out.data()),
      reinterpret_cast<const unsigned char *>(data.data()),
      static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

monad::MyResult<std::string> base64_decode(std::string_view encoded) {
  using R = monad::MyResult<std::string>;
  if (encoded.empty()) {
    return R::Ok(std::string{});
  }
  if (encoded.size() % 4 != 0) {
    return R::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("base64 length {} is not a multiple of 4", encoded.size())));
  }
  std::string out(3 * (encoded.size() / 4), '\0');
  const int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(out.data()),
      reinterpret_cast<const unsigned char *>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (written < 0) {
    return R::Err(
        monad::make_error(my_errors::JSON::DECODE_ERROR, "invalid base64 data"));
  }
  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  std::size_t padding = 0;
  if (encoded.back() == '=') {
    ++padding;
    if (encoded[encoded.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return R::Ok(std::move(out));
}

bool is_valid_utf8(std::string_view data) {
  std::size_t i = 0;
  const auto n = data.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(data[i]);
    std::size_t len = 0;
    if (c < 0x80) {
      len = 1;
    } else if ((c >> 5) == 0x6) {
      len = 2;
      if (c < 0xC2) {
        return false;
      }
    } else if ((c >> 4) == 0xE) {
      len = 3;
    } else if ((c >> 3) == 0x1E && c <= 0xF4) {
      len = 4;
    } else {
      return false;
    }
    if (i + len > n) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(data[i + k]) >> 6) != 0x2) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

} // namespace hookrelay::opensslutil
