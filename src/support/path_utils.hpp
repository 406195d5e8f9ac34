// File: src/support/path_utils.hpp
// Purpose: Declare helpers for normalizing and comparing file paths.
// Key invariants: Normalized paths always use forward slashes and have dot
// segments resolved.
// Ownership/Lifetime: Stateless helpers returning owned strings.
// Links: support/source_manager.hpp
#pragma once

#include <string>
#include <string_view>

namespace horder::support
{

/// @brief Normalize @p path lexically.
/// @param path Arbitrary file system path, possibly using backslashes.
/// @return Path with dot segments collapsed and forward slashes; "." for empty input.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief Compute basename component of @p path after normalization.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string basename(std::string_view path);

/// @brief Lower-cased extension of @p path including the dot (".hpp").
/// @return Extension or empty string when the last component has none.
[[nodiscard]] std::string extensionOf(std::string_view path);

/// @brief Express @p path relative to @p root when it lies underneath it.
/// @return Root-relative path with forward slashes, or the normalized
///         @p path unchanged when it is outside @p root.
[[nodiscard]] std::string relativeTo(std::string_view path, std::string_view root);

} // namespace horder::support
