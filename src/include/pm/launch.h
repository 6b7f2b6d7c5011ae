#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pm {

// Structured view of a launch command. Only `raw` is guaranteed; the other
// fields are filled when the command makes them recognizable.
struct LaunchInfo {
    std::string raw;
    std::optional<std::string> emulator;
    std::optional<std::string> binary;
    std::optional<std::string> core;
    std::optional<size_t> romArgIndex;
};

// Shell-style tokenizer. Whitespace (newlines included) separates tokens,
// single and double quotes group, and backslashes stay literal so Windows
// paths survive; only \" inside double quotes is an escape.
// Throws std::runtime_error on an unterminated quote.
std::vector<std::string> tokenize_command(const std::string& command);

// Finds the file name of a dynamically loaded libretro core
// (e.g. "mednafen_psx_hw_libretro_android.so") anywhere in the text. The
// text is cut into name segments at every character that cannot appear in a
// core file name (whitespace, quotes, path separators).
std::optional<std::string> extract_core(const std::string& text);

// Emulator id for a binary path or package token, if it is a known front-end.
// Tokens carrying a ROM placeholder or a ROM extension are never front-ends.
std::optional<std::string> identify_emulator(const std::string& token,
                                             const std::vector<std::string>& rom_extensions = {});

// True when the token contains a "current file" substitution marker.
bool is_rom_placeholder(const std::string& token);

// Never throws; an unparseable command yields a record with only `raw`.
// `rom_extensions` are the collection's extensions (see Header::extensions).
LaunchInfo normalize_launch(const std::string& raw, const std::vector<std::string>& rom_extensions = {});

}  // namespace pm
