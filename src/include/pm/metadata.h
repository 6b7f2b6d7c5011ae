#pragma once

#include <pm/model.h>
#include <optional>
#include <string>
#include <vector>

namespace pm {

// Line-driven parser for collection metadata. Feed the text one line at a
// time and call finish() once; the object then starts over from an empty
// state. Malformed lines never raise, they are dropped.
class MetadataParser {
public:
    enum class State { Header, Game };

    // Multi-line property currently accumulating continuation lines.
    enum class Block { None, Launch, Description, IgnoreFiles, Extensions, Files };

    void feed_line(std::string line);
    Collection finish();

    State state() const { return state_; }
    Block active_block() const { return block_; }
    const std::vector<std::string>& block_lines() const { return block_lines_; }
    const Header& header() const { return header_; }
    const std::vector<Game>& games() const { return games_; }
    const std::optional<Game>& current_game() const { return current_; }
    size_t line_number() const { return line_no_; }

private:
    void handle_key_line(const std::string& key, const std::string& value);
    void start_block(Block block, const std::string& seed);
    void flush_block();
    void finalize_current();
    void drop(const std::string& why);

    State state_ = State::Header;
    Block block_ = Block::None;
    std::vector<std::string> block_lines_;
    std::optional<Game> current_;
    Header header_;
    std::vector<Game> games_;
    size_t line_no_ = 0;
};

// Parses metadata text. Never throws on content.
Collection parse_metadata(const std::string& text);

// Reads and parses a metadata file. Throws FormatError if it cannot be read.
Collection parse_metadata_file(const std::string& path);

// Reconciles `roms` with `primaryFile` and fills default assets when the
// game declared none. Applied by the parser to every game it produces.
void finalize_game(Game& game);

// Canonical text for a header and its games. Field order is fixed by the
// writer, so equal input always gives byte-identical output.
std::string dump_metadata(const Header& header, const std::vector<Game>& games);
std::string dump_metadata(const Collection& collection);

// Throws FormatError if the file cannot be written.
void write_metadata_file(const std::string& path, const Header& header, const std::vector<Game>& games);

}  // namespace pm
