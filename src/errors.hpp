#pragma once
#include <stdexcept>
#include <string>

namespace wakeprompt {

// Rejected schedule input: unknown type, bad weekday, non-future one-time instant.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

// A run could not start: missing executable, credential, or output file.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& msg) : std::runtime_error(msg) {}
};

// The OS timer rejected an install or wake request.
class RegistrationError : public std::runtime_error {
public:
    explicit RegistrationError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace wakeprompt
