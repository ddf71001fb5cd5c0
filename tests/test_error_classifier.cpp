#include <gtest/gtest.h>
#include <core/error_classifier.hpp>

TEST(ErrorClassifier, Authentication) {
    EXPECT_EQ(classify_error_message("Authentication failed (username/password)"),
              ErrorType::AuthenticationFailed);
    EXPECT_EQ(classify_error_message("Permission denied (publickey,password)"),
              ErrorType::AuthenticationFailed);
    EXPECT_EQ(classify_error_message("Invalid SSH key format"), ErrorType::AuthenticationFailed);
    EXPECT_EQ(classify_error_message("Unable to extract public key from private key file"),
              ErrorType::AuthenticationFailed);
}

TEST(ErrorClassifier, Timeout) {
    EXPECT_EQ(classify_error_message("Connection to 10.0.0.1:22 timed out"), ErrorType::Timeout);
    EXPECT_EQ(classify_error_message("Keepalive timeout (3 probes missed)"), ErrorType::Timeout);
}

TEST(ErrorClassifier, Network) {
    EXPECT_EQ(classify_error_message("Failed to connect to 10.0.0.1:22: Connection refused"),
              ErrorType::NetworkUnreachable);
    EXPECT_EQ(classify_error_message("Connection reset by peer"), ErrorType::NetworkUnreachable);
    EXPECT_EQ(classify_error_message("Failed to resolve host nowhere: Name or service not known"),
              ErrorType::NetworkUnreachable);
}

TEST(ErrorClassifier, Algorithms) {
    EXPECT_EQ(classify_error_message("Unable to exchange encryption keys"),
              ErrorType::AlgorithmMismatch);
    EXPECT_EQ(classify_error_message("No matching cipher found"), ErrorType::AlgorithmMismatch);
}

TEST(ErrorClassifier, Bind) {
    EXPECT_EQ(classify_error_message("Port forwarding failed: cannot listen on localhost:8080"),
              ErrorType::BindFailed);
}

TEST(ErrorClassifier, CaseInsensitive) {
    EXPECT_EQ(classify_error_message("CONNECTION REFUSED"), ErrorType::NetworkUnreachable);
}

TEST(ErrorClassifier, UnknownAndEmpty) {
    EXPECT_EQ(classify_error_message(""), ErrorType::Unknown);
    EXPECT_EQ(classify_error_message("something odd happened"), ErrorType::Unknown);
}

TEST(ErrorClassifier, Names) {
    EXPECT_STREQ(error_type_name(ErrorType::EndpointHostNotFound), "ENDPOINT_HOST_NOT_FOUND");
    EXPECT_STREQ(error_type_name(ErrorType::CredentialUnavailable), "CREDENTIAL_UNAVAILABLE");
}
