#pragma once

#include <pm/model.h>
#include <optional>
#include <string>
#include <vector>

namespace pm {

struct ClosureOptions {
    // Leave the serialized scratch file on disk for inspection.
    bool keep_scratch = false;
    // Subdirectory of the source directory that receives the scratch file.
    // Empty means the source directory itself.
    std::string scratch_dir = "_norm_test";
    std::string scratch_suffix = ".norm";
};

struct FieldDiff {
    std::string field;
    std::string before;
    std::string after;
};

// First pair of games that did not survive the round trip. One side is
// absent when the game counts differ.
struct GameMismatch {
    std::optional<Game> before;
    std::optional<Game> after;
    std::vector<FieldDiff> fields;
};

struct ClosureReport {
    bool ok = false;
    bool header_equal = false;
    bool games_equal = false;
    size_t games_before = 0;
    size_t games_after = 0;
    std::vector<FieldDiff> header_diff;
    std::optional<GameMismatch> first_game_mismatch;
    std::string scratch_path;

    std::string describe() const;
};

// Semantic normalization used for the closure comparison.
Header normalize_header(const Header& header);
Game normalize_game(const Game& game, const Header& header);

// Field-by-field differences of already normalized values.
std::vector<FieldDiff> diff_headers(const Header& before, const Header& after);
std::vector<FieldDiff> diff_games(const Game& before, const Game& after);

// Readable dump of the compared fields of a game.
std::string describe_game(const Game& game);

// Compares two parse results under normalization, games in any order.
ClosureReport compare_collections(const Collection& before, const Collection& after);

// <source dir>/<scratch_dir>/<source file name><scratch_suffix>
std::string scratch_path_for(const std::string& source, const ClosureOptions& options = {});

// Parse, serialize to the scratch file, reparse and compare. Throws
// FormatError when the source cannot be read or the scratch file written.
ClosureReport verify_closure(const std::string& path, const ClosureOptions& options = {});

}  // namespace pm
