#pragma once

#include <string>
#include <string_view>

// Returns an absolute path that does not contain any . or .. components, nor any repeated path
// separators (/), nor a trailing separator (unless the result is "/"). If @p path begins with /
// then @p curr_dir is ignored. @p curr_dir has to be absolute.
std::string path_absolute(std::string_view path, std::string_view curr_dir = "/");

// Resolves the longest existing prefix of the absolute @p path through the filesystem (symlinks
// and the .. components that follow them), then appends the remaining components normalized. The
// result is a normalized absolute path.
std::string path_resolve_existing_prefix(const std::string& path);

// Checks whether @p path is @p subtree or lies beneath it; both must be normalized absolute paths
[[nodiscard]] bool path_is_within(std::string_view path, std::string_view subtree) noexcept;

// Returns the current working directory, throws std::runtime_error on error
std::string get_cwd();
