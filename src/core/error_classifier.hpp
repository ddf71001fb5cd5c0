#pragma once

#include <string>
#include "types.hpp"

// Classify a free-form error message (libssh2 last-error text, socket
// errors, server disconnect reasons) into an ErrorType.
ErrorType classify_error_message(const std::string& message);
