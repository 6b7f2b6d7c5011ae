#include <pm/metadata.h>
#include <pm/errors.h>
#include <pm/launch.h>
#include <pm/log.h>
#include <pm/path_segments.h>
#include <pm/text_utils.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace pm {

using text_utils::split_list;
using text_utils::starts_with;
using text_utils::to_lower;
using text_utils::trim;

namespace {
    const std::set<std::string>& header_passthrough_keys() {
        static const std::set<std::string> keys = {"shortname", "summary", "workdir"};
        return keys;
    }

    const std::set<std::string>& game_passthrough_keys() {
        static const std::set<std::string> keys = {
            "summary", "publisher", "genre", "tag", "players", "release", "rating", "workdir"
        };
        return keys;
    }

    // Hyphens in stored key names become underscores.
    std::string normalize_key(std::string key) {
        std::replace(key.begin(), key.end(), '-', '_');
        return key;
    }

    std::string normalize_asset_kind(const std::string& kind) {
        std::string k = normalize_key(to_lower(trim(kind)));
        if (k == "boxfront") return asset_kind::box_front;
        return k;
    }

    bool is_indented(const std::string& line) {
        return !line.empty() && (line[0] == ' ' || line[0] == '\t');
    }

    bool is_comment(const std::string& line) {
        return starts_with(line, "#") || starts_with(line, "//");
    }

    // Removes every repeated "<key>:" marker from the first buffered line.
    void strip_key_prefix(std::vector<std::string>& lines, const std::string& key) {
        const std::string marker = key + ":";
        while (!lines.empty() && to_lower(lines.front()).compare(0, marker.size(), marker) == 0) {
            std::string rest = trim(lines.front().substr(marker.size()));
            if (rest.empty()) {
                lines.erase(lines.begin());
            } else {
                lines.front() = rest;
            }
        }
    }

    std::optional<std::string> join_block(const std::vector<std::string>& lines) {
        std::vector<std::string> kept;
        for (const auto& l : lines) {
            if (!l.empty()) kept.push_back(l);
        }
        if (kept.empty()) return std::nullopt;
        return text_utils::join(kept, "\n");
    }

    void append_extensions(std::vector<std::string>& out, const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            for (auto token : split_list(line, ',')) {
                token = to_lower(token);
                while (!token.empty() && token.front() == '.') {
                    token.erase(token.begin());
                }
                if (!token.empty()) {
                    out.push_back(token);
                }
            }
        }
    }
}  // anonymous namespace

void MetadataParser::feed_line(std::string line) {
    ++line_no_;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (trim(line).empty()) {
        return;
    }

    if (is_indented(line)) {
        if (block_ == Block::None) {
            drop("continuation line outside of a block");
            return;
        }
        block_lines_.push_back(trim(line));
        return;
    }

    if (is_comment(line)) {
        return;
    }

    flush_block();

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        drop("line without ':'");
        return;
    }
    std::string key = to_lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    handle_key_line(key, value);
}

void MetadataParser::handle_key_line(const std::string& key, const std::string& value) {
    if (key == "game") {
        finalize_current();
        state_ = State::Game;
        if (value.empty()) {
            drop("game without a title");
            return;
        }
        Game game;
        game.title = value;
        current_ = std::move(game);
        return;
    }

    // Lines following a title-less game: nothing to attach them to.
    if (state_ == State::Game && !current_) {
        drop("key '" + key + "' belongs to a game without a title");
        return;
    }

    if (key == "launch") {
        start_block(Block::Launch, value);
    } else if (key == "description") {
        start_block(Block::Description, value);
    } else if (key == "ignore-files") {
        start_block(Block::IgnoreFiles, value);
    } else if (key == "extension" || key == "extensions") {
        start_block(Block::Extensions, value);
    } else if (key == "files") {
        start_block(Block::Files, value);
    } else if (key == "sort-by") {
        if (value.empty()) return;
        if (state_ == State::Header) {
            header_.defaultSortKey = value;
        } else {
            current_->sortKey = value;
        }
    } else if (state_ == State::Header) {
        if (key == "collection") {
            header_.collection = value;
        } else if (header_passthrough_keys().count(key) && !value.empty()) {
            header_.extra[normalize_key(key)] = value;
        } else {
            drop("unrecognized header key '" + key + "'");
        }
    } else {
        Game& game = *current_;
        if (key == "file") {
            if (!value.empty()) game.roms.push_back(value);
        } else if (key == "developer") {
            if (!value.empty()) game.developer = value;
        } else if (starts_with(key, "assets.")) {
            std::string kind = normalize_asset_kind(key.substr(7));
            if (!kind.empty() && !value.empty()) game.assets[kind] = value;
        } else if (game_passthrough_keys().count(key) && !value.empty()) {
            game.extra[normalize_key(key)] = value;
        } else {
            drop("unrecognized game key '" + key + "'");
        }
    }
}

void MetadataParser::start_block(Block block, const std::string& seed) {
    block_ = block;
    block_lines_.clear();
    if (!seed.empty()) {
        block_lines_.push_back(seed);
    }
}

void MetadataParser::flush_block() {
    if (block_ == Block::None) return;

    Block block = block_;
    std::vector<std::string> lines = std::move(block_lines_);
    block_ = Block::None;
    block_lines_.clear();

    const bool in_header = state_ == State::Header;
    if (!in_header && !current_) return;

    switch (block) {
        case Block::Launch: {
            strip_key_prefix(lines, "launch");
            auto text = join_block(lines);
            if (!text) break;
            if (in_header) {
                header_.launchBlock = text;
            } else {
                current_->launchOverride = text;
            }
            break;
        }
        case Block::Description: {
            if (in_header) {
                drop("description outside of a game");
                break;
            }
            strip_key_prefix(lines, "description");
            auto text = join_block(lines);
            if (text) current_->description = text;
            break;
        }
        case Block::IgnoreFiles:
            if (!in_header) {
                drop("ignore-files inside a game");
                break;
            }
            for (const auto& l : lines) {
                if (!l.empty()) header_.ignoreFiles.push_back(l);
            }
            break;
        case Block::Extensions:
            if (!in_header) {
                drop("extension list inside a game");
                break;
            }
            append_extensions(header_.extensions, lines);
            break;
        case Block::Files:
            if (in_header) {
                drop("files outside of a game");
                break;
            }
            for (const auto& l : lines) {
                if (l.empty() || to_lower(l) == "files:") continue;
                current_->roms.push_back(l);
            }
            break;
        case Block::None:
            break;
    }
}

void MetadataParser::finalize_current() {
    if (!current_) return;
    finalize_game(*current_);
    games_.push_back(std::move(*current_));
    current_.reset();
}

void MetadataParser::drop(const std::string& why) {
    std::ostringstream ss;
    ss << "metadata line " << line_no_ << " ignored: " << why;
    log_debug(ss.str());
}

Collection MetadataParser::finish() {
    flush_block();
    finalize_current();

    for (auto& game : games_) {
        if (game.launchOverride) {
            game.coreOverride = extract_core(*game.launchOverride);
        }
    }

    Collection result;
    result.header = std::move(header_);
    result.games = std::move(games_);
    *this = MetadataParser();
    return result;
}

void finalize_game(Game& game) {
    if (game.roms.empty() && game.primaryFile) {
        game.roms.push_back(*game.primaryFile);
    } else if (!game.roms.empty() && !game.primaryFile) {
        game.primaryFile = game.roms.front();
    }
    if (game.assets.empty()) {
        game.assets = default_assets(game.title);
    }
}

Collection parse_metadata(const std::string& text) {
    MetadataParser parser;
    std::istringstream in(text);
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        // UTF-8 byte order mark
        if (first && starts_with(line, "\xEF\xBB\xBF")) {
            line.erase(0, 3);
        }
        first = false;
        parser.feed_line(line);
    }
    return parser.finish();
}

Collection parse_metadata_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FormatError(path, "cannot open");
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FormatError(path, "cannot read");
    }
    return parse_metadata(content);
}

}  // namespace pm
