#pragma once

#include <string>
#include <utility>

namespace logwire::test {

// Ephemeral self-signed ECDSA P-256 certificate generated in memory, for tests only.
// Returns {certPem, keyPem}, both empty on failure.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost",
                                                         int validSeconds = 3600);

}  // namespace logwire::test
