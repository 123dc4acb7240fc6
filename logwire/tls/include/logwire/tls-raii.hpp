#pragma once

#include <openssl/ssl.h>

#include <memory>

namespace logwire {

// Function pointer deleters keep type size = one pointer
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;

}  // namespace logwire
