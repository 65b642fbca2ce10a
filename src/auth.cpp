#include "auth.hpp"
#include <openssl/crypto.h>

namespace {
constexpr std::string_view kBearerPrefix = "Bearer ";
}

AuthDecision authorize(std::string_view secret, std::string_view header) {
    if (secret.empty()) return AuthDecision::Admit;
    if (header.empty()) return AuthDecision::CredentialMissing;

    std::string_view token = header;
    if (token.substr(0, kBearerPrefix.size()) == kBearerPrefix)
        token.remove_prefix(kBearerPrefix.size());

    if (token.size() != secret.size() ||
        CRYPTO_memcmp(token.data(), secret.data(), secret.size()) != 0)
        return AuthDecision::CredentialInvalid;
    return AuthDecision::Admit;
}

const char* rejectionMessage(AuthDecision decision) {
    switch (decision) {
    case AuthDecision::CredentialMissing: return "authorization token required";
    case AuthDecision::CredentialInvalid: return "invalid authorization token";
    case AuthDecision::Admit: break;
    }
    return "";
}
