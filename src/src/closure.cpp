#include <pm/closure.h>
#include <pm/errors.h>
#include <pm/log.h>
#include <pm/metadata.h>
#include <pm/text_utils.h>
#include <algorithm>
#include <filesystem>
#include <set>
#include <sstream>
#include <system_error>
#include <tuple>

namespace fs = std::filesystem;

namespace pm {

using text_utils::split_lines;
using text_utils::split_list;
using text_utils::trim;

namespace {
    std::optional<std::string> normalize_scalar(const std::optional<std::string>& value) {
        if (!value) return std::nullopt;
        std::string t = trim(*value);
        if (t.empty()) return std::nullopt;
        return t;
    }

    // Strips every line's indentation and the blank lines around the text.
    std::optional<std::string> normalize_block(const std::optional<std::string>& value) {
        if (!value) return std::nullopt;
        std::vector<std::string> lines;
        for (const auto& l : split_lines(*value)) {
            lines.push_back(trim(l));
        }
        while (!lines.empty() && lines.front().empty()) lines.erase(lines.begin());
        while (!lines.empty() && lines.back().empty()) lines.pop_back();
        if (lines.empty()) return std::nullopt;
        return text_utils::join(lines, "\n");
    }

    std::vector<std::string> normalize_list(const std::vector<std::string>& items) {
        std::vector<std::string> out;
        for (const auto& item : items) {
            for (const auto& part : split_list(item, ',')) {
                if (!part.empty()) out.push_back(part);
            }
        }
        return out;
    }

    std::map<std::string, std::string> normalize_extra(const std::map<std::string, std::string>& extra) {
        std::map<std::string, std::string> out;
        for (const auto& entry : extra) {
            std::string v = trim(entry.second);
            if (!v.empty()) out[entry.first] = v;
        }
        return out;
    }

    std::string show(const std::optional<std::string>& v) {
        return v ? "\"" + *v + "\"" : std::string("<absent>");
    }

    std::string show(const std::string& v) {
        return "\"" + v + "\"";
    }

    std::string show(const std::vector<std::string>& items) {
        std::ostringstream ss;
        ss << '[';
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << '"' << items[i] << '"';
        }
        ss << ']';
        return ss.str();
    }

    std::string show(const std::map<std::string, std::string>& m) {
        std::ostringstream ss;
        ss << '{';
        bool first = true;
        for (const auto& entry : m) {
            if (!first) ss << ", ";
            first = false;
            ss << entry.first << "=\"" << entry.second << '"';
        }
        ss << '}';
        return ss.str();
    }

    template <typename T>
    void compare_field(std::vector<FieldDiff>& diffs, const std::string& name, const T& a, const T& b) {
        if (a != b) {
            diffs.push_back({name, show(a), show(b)});
        }
    }

    std::pair<std::string, std::string> game_key(const Game& g) {
        return {g.title, g.roms.empty() ? std::string() : g.roms.front()};
    }

    void sort_games(std::vector<Game>& games) {
        std::vector<std::pair<std::string, Game>> tagged;
        for (auto& g : games) {
            tagged.emplace_back(describe_game(g), std::move(g));
        }
        std::sort(tagged.begin(), tagged.end(), [](const auto& a, const auto& b) {
            auto ka = game_key(a.second);
            auto kb = game_key(b.second);
            return std::tie(ka, a.first) < std::tie(kb, b.first);
        });
        games.clear();
        for (auto& t : tagged) {
            games.push_back(std::move(t.second));
        }
    }

    // Removes the scratch file (and its directory once empty) on scope exit.
    struct ScratchCleanup {
        fs::path file;
        fs::path dir;
        bool remove_dir = false;
        bool active = true;

        ~ScratchCleanup() {
            if (!active) return;
            std::error_code ec;
            fs::remove(file, ec);
            if (ec) {
                log_warn("cannot remove scratch file '" + file.string() + "': " + ec.message());
                return;
            }
            if (!remove_dir) return;
            std::error_code ec_dir;
            if (fs::is_directory(dir, ec_dir) && fs::is_empty(dir, ec_dir)) {
                fs::remove(dir, ec_dir);
            }
            if (ec_dir) {
                log_warn("cannot remove scratch directory '" + dir.string() + "': " + ec_dir.message());
            }
        }
    };
}  // anonymous namespace

Header normalize_header(const Header& header) {
    Header h;
    h.collection = trim(header.collection);
    h.defaultSortKey = normalize_scalar(header.defaultSortKey);
    h.launchBlock = normalize_block(header.launchBlock);
    h.ignoreFiles = normalize_list(header.ignoreFiles);
    h.extensions = normalize_list(header.extensions);
    h.extra = normalize_extra(header.extra);
    return h;
}

Game normalize_game(const Game& game, const Header& header) {
    Game g;
    g.title = trim(game.title);

    std::set<std::string> roms;
    for (const auto& r : game.roms) {
        std::string t = trim(r);
        if (!t.empty()) roms.insert(t);
    }
    g.roms.assign(roms.begin(), roms.end());

    g.sortKey = normalize_scalar(game.sortKey);
    g.developer = normalize_scalar(game.developer);
    g.description = normalize_block(game.description);
    g.launchOverride = normalize_block(game.launchOverride);
    g.coreOverride = normalize_scalar(game.coreOverride);
    g.extra = normalize_extra(game.extra);

    // The writer drops an override equal to the inherited default, and the
    // core derived from it with it.
    auto inherited = normalize_block(header.launchBlock);
    if (g.launchOverride && inherited && *g.launchOverride == *inherited) {
        g.launchOverride.reset();
        g.coreOverride.reset();
    }
    return g;
}

std::vector<FieldDiff> diff_headers(const Header& before, const Header& after) {
    std::vector<FieldDiff> diffs;
    compare_field(diffs, "collection", before.collection, after.collection);
    compare_field(diffs, "defaultSortKey", before.defaultSortKey, after.defaultSortKey);
    compare_field(diffs, "launchBlock", before.launchBlock, after.launchBlock);
    compare_field(diffs, "ignoreFiles", before.ignoreFiles, after.ignoreFiles);
    compare_field(diffs, "extensions", before.extensions, after.extensions);
    compare_field(diffs, "extra", before.extra, after.extra);
    return diffs;
}

std::vector<FieldDiff> diff_games(const Game& before, const Game& after) {
    std::vector<FieldDiff> diffs;
    compare_field(diffs, "title", before.title, after.title);
    compare_field(diffs, "roms", before.roms, after.roms);
    compare_field(diffs, "sortKey", before.sortKey, after.sortKey);
    compare_field(diffs, "developer", before.developer, after.developer);
    compare_field(diffs, "description", before.description, after.description);
    compare_field(diffs, "launchOverride", before.launchOverride, after.launchOverride);
    compare_field(diffs, "coreOverride", before.coreOverride, after.coreOverride);
    compare_field(diffs, "extra", before.extra, after.extra);
    return diffs;
}

std::string describe_game(const Game& game) {
    std::ostringstream ss;
    ss << "title: " << show(game.title) << '\n';
    ss << "roms: " << show(game.roms) << '\n';
    ss << "sortKey: " << show(game.sortKey) << '\n';
    ss << "developer: " << show(game.developer) << '\n';
    ss << "description: " << show(game.description) << '\n';
    ss << "launchOverride: " << show(game.launchOverride) << '\n';
    ss << "coreOverride: " << show(game.coreOverride) << '\n';
    ss << "extra: " << show(game.extra) << '\n';
    return ss.str();
}

std::string ClosureReport::describe() const {
    std::ostringstream ss;
    ss << "header equal: " << (header_equal ? "yes" : "no") << '\n';
    ss << "games equal: " << (games_equal ? "yes" : "no")
       << " (" << games_before << " before, " << games_after << " after)\n";
    for (const auto& d : header_diff) {
        ss << "header." << d.field << ": " << d.before << " != " << d.after << '\n';
    }
    if (first_game_mismatch) {
        const auto& m = *first_game_mismatch;
        ss << "first differing game:\n";
        ss << "-- before --\n" << (m.before ? describe_game(*m.before) : std::string("<missing>\n"));
        ss << "-- after --\n" << (m.after ? describe_game(*m.after) : std::string("<missing>\n"));
        for (const auto& d : m.fields) {
            ss << "game." << d.field << ": " << d.before << " != " << d.after << '\n';
        }
    }
    return ss.str();
}

ClosureReport compare_collections(const Collection& before, const Collection& after) {
    ClosureReport report;
    report.games_before = before.games.size();
    report.games_after = after.games.size();

    report.header_diff = diff_headers(normalize_header(before.header), normalize_header(after.header));
    report.header_equal = report.header_diff.empty();

    std::vector<Game> lhs;
    std::vector<Game> rhs;
    for (const auto& g : before.games) lhs.push_back(normalize_game(g, before.header));
    for (const auto& g : after.games) rhs.push_back(normalize_game(g, after.header));
    sort_games(lhs);
    sort_games(rhs);

    report.games_equal = lhs.size() == rhs.size();
    size_t common = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < common; ++i) {
        auto fields = diff_games(lhs[i], rhs[i]);
        if (!fields.empty()) {
            report.games_equal = false;
            report.first_game_mismatch = GameMismatch{lhs[i], rhs[i], fields};
            break;
        }
    }
    if (!report.first_game_mismatch && lhs.size() != rhs.size()) {
        GameMismatch m;
        if (lhs.size() > common) m.before = lhs[common];
        if (rhs.size() > common) m.after = rhs[common];
        report.first_game_mismatch = m;
    }

    report.ok = report.header_equal && report.games_equal;
    return report;
}

std::string scratch_path_for(const std::string& source, const ClosureOptions& options) {
    fs::path src(source);
    fs::path dir = src.parent_path();
    if (!options.scratch_dir.empty()) {
        dir /= options.scratch_dir;
    }
    return (dir / (src.filename().string() + options.scratch_suffix)).string();
}

ClosureReport verify_closure(const std::string& path, const ClosureOptions& options) {
    Collection before = parse_metadata_file(path);

    fs::path scratch(scratch_path_for(path, options));
    fs::path scratch_dir = scratch.parent_path();
    if (!scratch_dir.empty()) {
        std::error_code ec;
        fs::create_directories(scratch_dir, ec);
        if (ec) {
            throw FormatError(scratch_dir.string(), "cannot create scratch directory");
        }
    }

    ScratchCleanup cleanup{scratch, scratch_dir, !options.scratch_dir.empty(), !options.keep_scratch};

    write_metadata_file(scratch.string(), before.header, before.games);
    Collection after = parse_metadata_file(scratch.string());

    ClosureReport report = compare_collections(before, after);
    report.scratch_path = scratch.string();

    if (report.ok) {
        log_info("closure holds for '" + path + "'");
    } else {
        log_warn("closure broken for '" + path + "'\n" + report.describe());
    }
    return report;
}

}  // namespace pm
