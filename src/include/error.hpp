#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <crow/json.h>

#include "token_grammar.hpp"

namespace asftoken {

// Error kinds callers branch on; never collapsed into a generic failure
enum class ErrorCode {
    InvalidComponentFormat,  // Component is not 3-6 lowercase ASCII letters
    UnallocatedComponent,    // Component is well formed but not in the registry
    RegistryUnavailable,     // Registry could not give a definitive answer
    MalformedToken,          // Candidate does not match the token grammar
    ChecksumMismatch,        // Structurally valid, checksum does not match entropy
    EncodingOverflow,        // Base62 value does not fit the requested width
    InvalidDigit,            // Character outside the base62 alphabet
    EntropySourceFailure,    // Secure random source could not supply bytes
    Internal                 // Unexpected library failure
};

// Error details structure
struct Error {
    ErrorCode code;
    std::string message;
    std::string details;

    // Only meaningful for MalformedToken
    ParserState failed_state = ParserState::Start;
    std::size_t failed_offset = 0;
    RejectReason reject_reason = RejectReason::None;

    static Error InvalidComponentFormat(const std::string& component) {
        return Error{ErrorCode::InvalidComponentFormat,
                     "Invalid component format",
                     "Component '" + component + "' must be 3-6 lowercase ASCII letters"};
    }

    static Error UnallocatedComponent(const std::string& component) {
        return Error{ErrorCode::UnallocatedComponent,
                     "Component is not allocated",
                     "Component '" + component + "' is not present in the registry"};
    }

    static Error RegistryUnavailable(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCode::RegistryUnavailable, msg, details};
    }

    static Error MalformedToken(ParserState state, std::size_t offset, RejectReason reason) {
        Error err{ErrorCode::MalformedToken,
                  "Malformed token",
                  rejectReasonDescription(reason) + " in " + parserStateName(state) +
                      " at offset " + std::to_string(offset)};
        err.failed_state = state;
        err.failed_offset = offset;
        err.reject_reason = reason;
        return err;
    }

    static Error ChecksumMismatch(const std::string& expected, const std::string& actual) {
        return Error{ErrorCode::ChecksumMismatch,
                     "Checksum mismatch",
                     "Expected checksum " + expected + " but token carries " + actual};
    }

    static Error EncodingOverflow(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCode::EncodingOverflow, msg, details};
    }

    static Error InvalidDigit(char digit, std::size_t position) {
        return Error{ErrorCode::InvalidDigit,
                     "Invalid base62 digit",
                     "Character code " + std::to_string(static_cast<unsigned char>(digit)) +
                         " at position " + std::to_string(position) + " is not in the base62 alphabet"};
    }

    static Error EntropyFailure(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCode::EntropySourceFailure, msg, details};
    }

    static Error Internal(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCode::Internal, msg, details};
    }

    // Convert error to JSON representation
    crow::json::wvalue toJson() const;

    // Stable name of the error code, e.g. "ChecksumMismatch"
    std::string getCodeName() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
// This is the Result type pattern for operations that can fail
template<typename T, typename E = Error>
class Expected {
public:
    // Constructor for value types (excluding E type and Expected itself)
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    // Constructor for error types, only enabled when U decays to E
    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    // Get the value (only valid if has_value() is true)
    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    // Get the error (only valid if has_value() is false)
    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Result<T> means Expected<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace asftoken
