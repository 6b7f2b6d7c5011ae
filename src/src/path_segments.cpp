#include <pm/path_segments.h>
#include <pm/model.h>
#include <pm/text_utils.h>

namespace pm {

PathSegments split_path(const std::string& path) {
    PathSegments segments;
    std::string segment;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!segment.empty() && segment != ".") {
                segments.push_back(segment);
            }
            segment.clear();
        } else {
            segment += c;
        }
    }
    if (!segment.empty() && segment != ".") {
        segments.push_back(segment);
    }
    return segments;
}

std::string join_path(const PathSegments& segments) {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += segments[i];
    }
    return out;
}

std::optional<std::string> leading_directory(const std::string& path) {
    auto segments = split_path(path);
    if (segments.size() < 2) {
        return std::nullopt;
    }
    return segments.front();
}

std::string file_name(const std::string& path) {
    auto segments = split_path(path);
    if (segments.empty()) {
        return "";
    }
    return segments.back();
}

std::string default_asset_file(const std::string& kind) {
    if (kind == asset_kind::box_front) return "boxfront.png";
    if (kind == asset_kind::logo) return "logo.png";
    if (kind == asset_kind::video) return "video.mp4";
    return kind + ".png";
}

std::map<std::string, std::string> default_assets(const std::string& title) {
    std::map<std::string, std::string> assets;
    for (const auto& kind : {asset_kind::box_front, asset_kind::logo, asset_kind::video}) {
        assets[kind] = join_path({"media", title, default_asset_file(kind)});
    }
    return assets;
}

std::string rebase_asset_path(const std::string& asset, const std::string& directory) {
    auto segments = split_path(asset);
    if (segments.empty()) {
        return asset;
    }
    std::string root = segments.size() >= 2 ? segments.front() : std::string("media");
    return join_path({root, directory, segments.back()});
}

std::string file_extension(const std::string& path) {
    std::string name = file_name(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return "";
    }
    return text_utils::to_lower(name.substr(dot + 1));
}

}  // namespace pm
