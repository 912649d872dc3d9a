#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <string_view>

#include "util/io_monad.hpp"

namespace hookrelay::opensslutil {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Lower-case hex SHA-256 digest. Throws std::runtime_error on OpenSSL failure.
std::string sha256_hex(std::string_view data);

// Standard (RFC 4648) base64 without line breaks.
std::string base64_encode(std::string_view data);
monad::MyResult<std::string> base64_decode(std::string_view encoded);

bool is_valid_utf8(std::string_view data);

} // namespace hookrelay::opensslutil
