#pragma once

namespace logwire {

#ifdef LOGWIRE_ENABLE_OPENSSL
constexpr bool openSslEnabled() { return true; }
#else
constexpr bool openSslEnabled() { return false; }
#endif

}  // namespace logwire
