#pragma once

#include <string>
#include <utility>

namespace ferry::test {

// Generates an ephemeral self-signed RSA 2048 certificate entirely in memory.
// The certificate is valid for 'commonName' and for 127.0.0.1 (subject alternative names).
// Returns {certPem, keyPem}, both empty on failure. Intended ONLY for tests.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost",
                                                         int validSeconds = 3600);

}  // namespace ferry::test
