#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pm {

using PathSegments = std::vector<std::string>;

// Splits a relative path on both '/' and '\'. Empty and "." segments are
// dropped, so "009//disc 1.chd" and "009\disc 1.chd" give the same result.
PathSegments split_path(const std::string& path);

// Joins segments with '/'.
std::string join_path(const PathSegments& segments);

// First segment of a path that has at least one directory component.
std::optional<std::string> leading_directory(const std::string& path);

// Last segment, or an empty string for an empty path.
std::string file_name(const std::string& path);

// Lowercase extension of the file name without the dot, or an empty string.
std::string file_extension(const std::string& path);

// Asset path conventions: media/<title>/<file> for the well-known kinds.
std::string default_asset_file(const std::string& kind);
std::map<std::string, std::string> default_assets(const std::string& title);

// Moves an asset under <root>/<directory>/<file name>. The root is the
// first segment of the asset path, or "media" for a bare file name.
std::string rebase_asset_path(const std::string& asset, const std::string& directory);

}  // namespace pm
