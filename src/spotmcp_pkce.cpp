#include "spotmcp_pkce.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_tracing.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace spotmcp {

namespace PkceUtils {

namespace {
const size_t VERIFIER_ENTROPY_BYTES = 32;
const size_t STATE_ENTROPY_BYTES = 16;
}

std::vector<unsigned char> RandomBytes(size_t length) {
    std::vector<unsigned char> buffer(length);
    if (length == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(length)) != 1) {
        auto err = ERR_get_error();
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        SPOTMCP_TRACE_ERROR("PKCE", std::string("RAND_bytes failed: ") + err_buf);
        throw AuthException(AuthErrorType::RandomSourceUnavailable,
                            std::string("Secure random source unavailable: ") + err_buf);
    }
    return buffer;
}

std::string Base64UrlEncode(const unsigned char* data, size_t length) {
    if (length == 0) {
        return std::string();
    }

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::string encoded(4 * ((length + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data, static_cast<int>(length));
    encoded.resize(static_cast<size_t>(written));

    for (auto& c : encoded) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string HexEncode(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0f];
    }
    return hex;
}

std::string GenerateCodeVerifier() {
    auto entropy = RandomBytes(VERIFIER_ENTROPY_BYTES);
    auto verifier = Base64UrlEncode(entropy.data(), entropy.size());
    OPENSSL_cleanse(entropy.data(), entropy.size());

    SPOTMCP_TRACE_DEBUG("PKCE", "Generated code verifier: " + SpotmcpTracer::Redact(verifier));
    return verifier;
}

std::string GenerateCodeChallenge(const std::string& code_verifier) {
    if (code_verifier.empty()) {
        throw std::invalid_argument("Code verifier cannot be empty");
    }

    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digest_length = 0;
    if (EVP_Digest(code_verifier.data(), code_verifier.size(), digest, &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest of code verifier failed");
    }

    auto challenge = Base64UrlEncode(digest, digest_length);
    SPOTMCP_TRACE_DEBUG("PKCE", "Generated code challenge: " + SpotmcpTracer::Redact(challenge));
    return challenge;
}

PkcePair GeneratePkcePair() {
    PkcePair pair;
    pair.verifier = GenerateCodeVerifier();
    pair.challenge = GenerateCodeChallenge(pair.verifier);
    return pair;
}

std::string GenerateState() {
    auto entropy = RandomBytes(STATE_ENTROPY_BYTES);
    auto state = HexEncode(entropy.data(), entropy.size());
    SPOTMCP_TRACE_DEBUG("PKCE", "Generated state: " + state);
    return state;
}

bool ValidateState(const std::string& received_state, const std::string& expected_state) {
    if (received_state.empty() || expected_state.empty()) {
        return false;
    }
    if (received_state.size() != expected_state.size()) {
        return false;
    }
    return CRYPTO_memcmp(received_state.data(), expected_state.data(), expected_state.size()) == 0;
}

} // namespace PkceUtils

} // namespace spotmcp
