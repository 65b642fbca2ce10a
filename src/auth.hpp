#pragma once
#include <string_view>

enum class AuthDecision {
    Admit,
    CredentialMissing,
    CredentialInvalid,
};

// Checks an Authorization header value against the shared secret.
// Accepts "<token>" and "Bearer <token>". An empty secret admits everything.
AuthDecision authorize(std::string_view secret, std::string_view header);

const char* rejectionMessage(AuthDecision decision);
