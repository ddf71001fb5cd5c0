#include "error_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:                  return "NONE";
        case ErrorType::AuthenticationFailed:  return "AUTHENTICATION_FAILED";
        case ErrorType::NetworkUnreachable:    return "NETWORK_UNREACHABLE";
        case ErrorType::Timeout:               return "TIMEOUT";
        case ErrorType::AlgorithmMismatch:     return "ALGORITHM_MISMATCH";
        case ErrorType::BindFailed:            return "BIND_FAILED";
        case ErrorType::EndpointHostNotFound:  return "ENDPOINT_HOST_NOT_FOUND";
        case ErrorType::CredentialUnavailable: return "CREDENTIAL_UNAVAILABLE";
        case ErrorType::Unknown:               return "UNKNOWN";
    }
    return "UNKNOWN";
}

static bool contains_any(const std::string& haystack,
                         std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

ErrorType classify_error_message(const std::string& message) {
    if (message.empty()) return ErrorType::Unknown;

    std::string m = message;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Order matters: "keepalive timeout" must not be read as a network
    // error, and "permission denied (publickey)" is an auth failure.
    if (contains_any(m, {"authentication failed", "permission denied",
                         "incorrect password", "invalid ssh key",
                         "unable to extract public key", "passphrase"})) {
        return ErrorType::AuthenticationFailed;
    }
    if (contains_any(m, {"timed out", "timeout", "etimedout"})) {
        return ErrorType::Timeout;
    }
    if (contains_any(m, {"address already in use", "listen port",
                         "port forwarding failed", "forward listen"})) {
        return ErrorType::BindFailed;
    }
    if (contains_any(m, {"no matching", "unable to exchange encryption keys",
                         "kex", "method not supported", "no common"})) {
        return ErrorType::AlgorithmMismatch;
    }
    if (contains_any(m, {"connection refused", "connection reset",
                         "closed by remote host", "broken pipe",
                         "no route to host", "network is unreachable",
                         "host is down", "failed to resolve", "host not found"})) {
        return ErrorType::NetworkUnreachable;
    }
    return ErrorType::Unknown;
}
