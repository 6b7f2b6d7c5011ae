#include <pm/discover.h>
#include <pm/log.h>
#include <pm/path_segments.h>
#include <pm/text_utils.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace pm {

std::string platform_key(const std::string& directory_name) {
    std::string key = text_utils::to_lower(text_utils::trim(file_name(directory_name)));
    for (char& c : key) {
        if (c == ' ') c = '_';
    }
    return key;
}

std::map<std::string, CollectionSource> discover_collections(const std::string& resource_root) {
    std::map<std::string, CollectionSource> found;

    std::error_code ec;
    if (!fs::is_directory(resource_root, ec)) {
        log_warn("resource root '" + resource_root + "' is not a directory");
        return found;
    }

    fs::directory_iterator it(resource_root, ec);
    if (ec) {
        log_warn("cannot list '" + resource_root + "': " + ec.message());
        return found;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;

        fs::path meta = entry.path() / kMetadataFileName;
        if (!fs::is_regular_file(meta, entry_ec)) continue;

        std::string name = entry.path().filename().string();
        std::string key = platform_key(name);
        if (found.count(key)) {
            log_warn("platform key '" + key + "' of '" + name + "' already taken by '" +
                     found[key].name + "', skipped");
            continue;
        }
        found[key] = CollectionSource{name, meta.string()};
    }
    if (ec) {
        log_warn("listing '" + resource_root + "' stopped early: " + ec.message());
    }
    return found;
}

}  // namespace pm
