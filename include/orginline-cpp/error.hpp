/// @file error.hpp
/// @brief Error types for the orginline-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace orginline_cpp {

/// Categories of errors that can occur in the library.
///
/// Parsing itself never reports an error: malformed markup degrades to
/// literal text. These kinds cover programming errors and rejected input
/// to the serialization and configuration layers.
enum class ErrorKind : std::uint8_t {
    invariant_violation,  ///< An internal grammar invariant was broken.
    invalid_node,         ///< Serialized node data is malformed.
    invalid_option,       ///< A ParseOptions value is unusable.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invariant_violation: return "invariant_violation";
        case ErrorKind::invalid_node:        return "invalid_node";
        case ErrorKind::invalid_option:      return "invalid_option";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown when the grammar observes a state that well-formed dispatcher
/// output can never produce. Fatal to the parsing session.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(std::string message)
        : std::logic_error{message},
          error_{ErrorKind::invariant_violation, std::move(message)} {}

    /// The structured error carried by this exception.
    auto error() const -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace orginline_cpp
