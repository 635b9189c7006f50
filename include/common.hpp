//! # Common Definitions
//!
//! Shared types and constants used by every tsbuild component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//! - **Platform**: Host platform detection used by tool discovery

#ifndef TSBUILD_COMMON_HPP
#define TSBUILD_COMMON_HPP

#include <string>
#include <variant>

namespace tsbuild {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.1";

// ============================================================================
// Platform
// ============================================================================

/// Host platform families that change how tools are discovered.
enum class Platform {
    Unix,   ///< Linux, BSD, macOS
    Windows ///< Win32
};

/// Returns the platform this binary was compiled for.
constexpr Platform host_platform() {
#ifdef _WIN32
    return Platform::Windows;
#else
    return Platform::Unix;
#endif
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Manifest> manifest = Manifest::load("translations.toml");
/// if (is_err(manifest)) {
///     std::cerr << "error: " << unwrap_err(manifest) << "\n";
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

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace tsbuild

#endif // TSBUILD_COMMON_HPP
