#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pm {

// Asset kinds the writer knows how to order. Any other kind found in the
// text is kept and written after these, sorted by name.
namespace asset_kind {
    inline const std::string box_front = "box_front";
    inline const std::string logo = "logo";
    inline const std::string video = "video";
}

// Collection-wide defaults shared by every game of one metadata file.
struct Header {
    std::string collection;
    std::optional<std::string> defaultSortKey;
    std::optional<std::string> launchBlock;
    std::vector<std::string> ignoreFiles;
    std::vector<std::string> extensions;

    // Recognized pass-through keys (shortname, summary, workdir), stored
    // under their normalized name.
    std::map<std::string, std::string> extra;
};

// One library entry. `title` is never empty in a parsed result.
struct Game {
    std::string title;
    std::optional<std::string> primaryFile;
    std::vector<std::string> roms;
    std::optional<std::string> sortKey;
    std::optional<std::string> developer;
    std::optional<std::string> description;
    std::optional<std::string> launchOverride;
    std::optional<std::string> coreOverride;
    std::map<std::string, std::string> assets;
    std::map<std::string, std::string> extra;

    bool isMultiDisc() const { return roms.size() > 1; }
};

// Result of parsing one metadata file.
struct Collection {
    Header header;
    std::vector<Game> games;
};

}  // namespace pm
