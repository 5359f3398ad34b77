#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the signing pipeline.
// All of them mean malformed input or a caller bug, never a transient condition.
class SigningError : public std::runtime_error {
public:
    explicit SigningError(const std::string& what) : std::runtime_error(what) {}
};

// Magnitude cannot be rendered at the required scale within tolerance
class PrecisionLossError : public SigningError {
public:
    using SigningError::SigningError;
};

// Order type is neither limit nor trigger (or carries an unknown tag)
class InvalidOrderTypeError : public SigningError {
public:
    using SigningError::SigningError;
};

// Routing / vault address is not 20 bytes of hex
class MalformedAddressError : public SigningError {
public:
    using SigningError::SigningError;
};

class InvalidCloidError : public SigningError {
public:
    using SigningError::SigningError;
};

// Signing backend returned a bad length or recovery id
class InvalidSignatureError : public SigningError {
public:
    using SigningError::SigningError;
};
