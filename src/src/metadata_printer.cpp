#include <pm/metadata.h>
#include <pm/errors.h>
#include <pm/path_segments.h>
#include <pm/text_utils.h>
#include <fstream>
#include <sstream>

namespace pm {

using text_utils::split_lines;
using text_utils::trim;

static std::string format_key(const std::string& stored_key) {
    std::string key = stored_key;
    for (char& c : key) {
        if (c == '_') c = '-';
    }
    return key;
}

// Single line when the text fits on one line, block form otherwise.
static void emit_text(std::ostringstream& out, const std::string& key, const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& l : split_lines(text)) {
        std::string t = trim(l);
        if (!t.empty()) lines.push_back(t);
    }
    if (lines.empty()) return;
    if (lines.size() == 1) {
        out << key << ": " << lines.front() << '\n';
        return;
    }
    out << key << ":\n";
    for (const auto& l : lines) {
        out << "  " << l << '\n';
    }
}

static void emit_list(std::ostringstream& out, const std::string& key, const std::vector<std::string>& items) {
    bool opened = false;
    for (const auto& item : items) {
        std::string t = trim(item);
        if (t.empty()) continue;
        if (!opened) {
            out << key << ":\n";
            opened = true;
        }
        out << "  " << t << '\n';
    }
}

static void emit_extra(std::ostringstream& out, const std::map<std::string, std::string>& extra) {
    for (const auto& entry : extra) {
        std::string value = trim(entry.second);
        if (value.empty()) continue;
        out << format_key(entry.first) << ": " << value << '\n';
    }
}

// Asset lines of a multi-disc game, pointed at the directory its roms share.
static void emit_assets(std::ostringstream& out, const Game& game) {
    if (!game.isMultiDisc() || game.assets.empty()) return;

    auto directory = leading_directory(game.roms.front());
    auto emit_one = [&](const std::string& kind, const std::string& path) {
        if (trim(path).empty()) return;
        std::string target = directory ? rebase_asset_path(path, *directory) : path;
        out << "assets." << kind << ": " << target << '\n';
    };

    const std::vector<std::string> fixed = {asset_kind::box_front, asset_kind::logo, asset_kind::video};
    for (const auto& kind : fixed) {
        auto it = game.assets.find(kind);
        if (it != game.assets.end()) emit_one(kind, it->second);
    }
    for (const auto& entry : game.assets) {
        if (entry.first == asset_kind::box_front || entry.first == asset_kind::logo ||
            entry.first == asset_kind::video) {
            continue;
        }
        emit_one(entry.first, entry.second);
    }
}

static void emit_header(std::ostringstream& out, const Header& header) {
    if (!trim(header.collection).empty()) {
        out << "collection: " << trim(header.collection) << '\n';
    }
    if (header.defaultSortKey && !trim(*header.defaultSortKey).empty()) {
        out << "sort-by: " << trim(*header.defaultSortKey) << '\n';
    }
    if (header.launchBlock) {
        emit_text(out, "launch", *header.launchBlock);
    }
    emit_list(out, "ignore-files", header.ignoreFiles);
    emit_list(out, "extension", header.extensions);
    emit_extra(out, header.extra);
    out << '\n';
}

static void emit_game(std::ostringstream& out, const Game& game, const Header& header) {
    std::string title = trim(game.title);
    if (title.empty()) return;

    out << "game: " << title << '\n';

    if (game.roms.size() == 1) {
        out << "file: " << trim(game.roms.front()) << '\n';
    } else if (game.roms.size() > 1) {
        emit_list(out, "files", game.roms);
    }

    if (game.sortKey && !trim(*game.sortKey).empty()) {
        out << "sort-by: " << trim(*game.sortKey) << '\n';
    }
    if (game.developer && !trim(*game.developer).empty()) {
        out << "developer: " << trim(*game.developer) << '\n';
    }
    emit_extra(out, game.extra);
    emit_assets(out, game);

    if (game.description) {
        emit_text(out, "description", *game.description);
    }

    // An override identical to the inherited default is never written.
    if (game.launchOverride) {
        bool inherited = header.launchBlock && trim(*header.launchBlock) == trim(*game.launchOverride);
        if (!inherited) {
            emit_text(out, "launch", *game.launchOverride);
        }
    }

    out << '\n';
}

std::string dump_metadata(const Header& header, const std::vector<Game>& games) {
    std::ostringstream out;
    emit_header(out, header);
    for (const auto& game : games) {
        emit_game(out, game, header);
    }
    return out.str();
}

std::string dump_metadata(const Collection& collection) {
    return dump_metadata(collection.header, collection.games);
}

void write_metadata_file(const std::string& path, const Header& header, const std::vector<Game>& games) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FormatError(path, "cannot open for writing");
    }
    out << dump_metadata(header, games);
    out.flush();
    if (!out) {
        throw FormatError(path, "cannot write");
    }
}

}  // namespace pm
