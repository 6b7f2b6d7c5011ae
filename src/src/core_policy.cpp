#include <pm/core_policy.h>
#include <pm/launch.h>
#include <pm/path_segments.h>
#include <pm/text_utils.h>
#include <utility>

namespace pm {

TableCorePolicy::TableCorePolicy(std::map<std::string, std::string> platform_cores,
                                 std::map<std::string, std::string> extension_cores)
    : platform_cores_(std::move(platform_cores)), extension_cores_(std::move(extension_cores)) {}

void TableCorePolicy::set_platform_core(const std::string& platform_key, const std::string& core) {
    platform_cores_[platform_key] = core;
}

void TableCorePolicy::set_extension_core(const std::string& extension, const std::string& core) {
    std::string ext = text_utils::to_lower(extension);
    if (!ext.empty() && ext.front() == '.') ext.erase(ext.begin());
    extension_cores_[ext] = core;
}

std::optional<std::string> TableCorePolicy::choose_core(const std::string& platform_key,
                                                        const Header& header,
                                                        const Game& game) const {
    if (game.coreOverride && !game.coreOverride->empty()) {
        return game.coreOverride;
    }

    if (header.launchBlock) {
        if (auto core = extract_core(*header.launchBlock)) {
            return core;
        }
    }

    auto platform = platform_cores_.find(platform_key);
    if (platform != platform_cores_.end()) {
        return platform->second;
    }

    std::string file = game.primaryFile ? *game.primaryFile : (game.roms.empty() ? "" : game.roms.front());
    std::string ext = file_extension(file);
    if (!ext.empty()) {
        auto by_ext = extension_cores_.find(ext);
        if (by_ext != extension_cores_.end()) {
            return by_ext->second;
        }
    }
    return std::nullopt;
}

}  // namespace pm
