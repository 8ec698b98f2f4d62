//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the
//! formatter. It establishes the foundational abstractions that the scanner,
//! parser, layout engine and command-line front end depend on.
//!
//! ## Overview
//!
//! - **Version Information**: Formatter version constants
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Trees own their children through `Box<T>`

#ifndef SCHEMAT_COMMON_HPP
#define SCHEMAT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace schemat {

// ============================================================================
// Version Information
// ============================================================================

/// The formatter version string.
constexpr const char* VERSION = "0.4.1";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 4;

/// Patch version number.
constexpr int VERSION_PATCH = 1;

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number (in bytes)
/// - `offset`: 0-based byte offset from the start of the input
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    /// Line number (1-based).
    uint32_t line;

    /// Column number (1-based).
    uint32_t column;

    /// Byte offset from start of input (0-based).
    uint32_t offset;

    /// Length of the source element in bytes.
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    /// Merges two spans into one that covers both.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = formatter.format(source);
/// if (is_ok(result)) {
///     std::cout << unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// Syntax trees and layout documents own their children through `Box<T>`,
/// so neither can contain cycles or shared aliases.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace schemat

#endif // SCHEMAT_COMMON_HPP
