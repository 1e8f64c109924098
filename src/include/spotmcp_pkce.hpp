#pragma once

#include <string>
#include <vector>

namespace spotmcp {

// PKCE verifier and its S256 challenge. The verifier never leaves the process.
struct PkcePair {
    std::string verifier;
    std::string challenge;
};

namespace PkceUtils {
    // 32 random bytes, base64url without padding (43 characters)
    std::string GenerateCodeVerifier();

    // base64url(SHA-256(verifier)) without padding
    std::string GenerateCodeChallenge(const std::string& code_verifier);

    // Fresh verifier plus its challenge
    PkcePair GeneratePkcePair();

    // 16 random bytes, lowercase hex (32 characters)
    std::string GenerateState();

    // Constant-time comparison; empty values never validate
    bool ValidateState(const std::string& received_state, const std::string& expected_state);

    std::string Base64UrlEncode(const unsigned char* data, size_t length);
    std::string HexEncode(const unsigned char* data, size_t length);

    // Throws AuthException(RandomSourceUnavailable) if the CSPRNG fails
    std::vector<unsigned char> RandomBytes(size_t length);
}

} // namespace spotmcp
