#include <pm/launch.h>
#include <pm/log.h>
#include <pm/path_segments.h>
#include <pm/text_utils.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pm {

using text_utils::ends_with;
using text_utils::starts_with;
using text_utils::to_lower;

namespace {
    struct CommandTokenizer {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t column = 1;

        CommandTokenizer(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }
        bool at_end() const { return i >= s.size(); }

        char get() {
            char c = s[i++];
            if (c == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
            return c;
        }

        std::string parse_error(const std::string& msg, size_t at_line, size_t at_column) const {
            std::ostringstream ss;
            ss << "launch tokenize error: " << msg << " (line " << at_line << ", column " << at_column << ")";
            return ss.str();
        }

        static bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        void skip_ws() {
            while (!at_end()) {
                char c = peek();
                if (is_space(c)) {
                    get();
                } else if (c == '\\' && i + 1 < s.size() && (s[i + 1] == '\n' || s[i + 1] == '\r')) {
                    // shell line continuation
                    get();
                } else {
                    break;
                }
            }
        }

        void read_quoted(char quote, std::string& token) {
            size_t open_line = line;
            size_t open_column = column;
            get();  // opening quote
            while (!at_end()) {
                char c = get();
                if (c == quote) {
                    return;
                }
                if (quote == '"' && c == '\\' && peek() == '"') {
                    token += get();
                    continue;
                }
                token += c;
            }
            std::string what = "unterminated ";
            what += (quote == '"' ? "double" : "single");
            what += " quote";
            throw std::runtime_error(parse_error(what, open_line, open_column));
        }

        std::vector<std::string> tokenize() {
            std::vector<std::string> tokens;
            while (true) {
                skip_ws();
                if (at_end()) break;

                std::string token;
                while (!at_end() && !is_space(peek())) {
                    char c = peek();
                    if (c == '"' || c == '\'') {
                        read_quoted(c, token);
                    } else {
                        token += get();
                    }
                }
                tokens.push_back(token);
            }
            return tokens;
        }
    };

    // Front-end executables, matched on the lowercase base name.
    const std::vector<std::string>& known_emulators() {
        static const std::vector<std::string> ids = {
            "retroarch", "pcsx2", "duckstation", "dolphin", "ppsspp", "flycast",
            "redream", "mame", "mednafen", "cemu", "rpcs3", "xemu", "yuzu",
            "ryujinx", "citra", "melonds", "mgba", "aethersx2"
        };
        return ids;
    }

    const std::vector<std::pair<std::string, std::string>>& emulator_aliases() {
        static const std::vector<std::pair<std::string, std::string>> aliases = {
            {"ppssppsdl", "ppsspp"},
            {"ppssppqt", "ppsspp"},
            {"ppssppwindows64", "ppsspp"},
            {"mame64", "mame"},
            {"retroarch64", "retroarch"},
        };
        return aliases;
    }

    // Android package names and flatpak application ids.
    const std::vector<std::pair<std::string, std::string>>& package_prefixes() {
        static const std::vector<std::pair<std::string, std::string>> packages = {
            {"com.retroarch", "retroarch"},
            {"org.libretro.retroarch", "retroarch"},
            {"org.ppsspp.ppsspp", "ppsspp"},
            {"com.github.stenzek.duckstation", "duckstation"},
            {"org.duckstation.duckstation", "duckstation"},
            {"org.dolphinemu.dolphinemu", "dolphin"},
            {"com.flycast.emulator", "flycast"},
            {"org.flycast.flycast", "flycast"},
            {"io.recompiled.redream", "redream"},
            {"xyz.aethersx2.android", "aethersx2"},
            {"net.pcsx2.pcsx2", "pcsx2"},
            {"org.yuzu.yuzu_emu", "yuzu"},
            {"org.citra.citra_emu", "citra"},
            {"me.magnum.melonds", "melonds"},
            {"info.cemu.cemu", "cemu"},
            {"net.rpcs3.rpcs3", "rpcs3"},
        };
        return packages;
    }

    std::string strip_program_extension(const std::string& base) {
        for (const char* ext : {".exe", ".appimage", ".app"}) {
            if (ends_with(base, ext)) {
                return base.substr(0, base.size() - std::string(ext).size());
            }
        }
        return base;
    }

    std::optional<std::string> match_binary(const std::string& lower_token) {
        size_t cut = lower_token.find_last_of("/\\");
        std::string base = cut == std::string::npos ? lower_token : lower_token.substr(cut + 1);
        base = strip_program_extension(base);
        if (base.empty()) return std::nullopt;

        for (const auto& alias : emulator_aliases()) {
            if (base == alias.first) return alias.second;
        }
        for (const auto& id : known_emulators()) {
            if (base == id) return id;
            if (base.size() > id.size() && starts_with(base, id) &&
                (base[id.size()] == '-' || base[id.size()] == '_')) {
                return id;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> match_package(const std::string& lower_token) {
        std::string package = lower_token.substr(0, lower_token.find('/'));
        for (const auto& entry : package_prefixes()) {
            if (package == entry.first || starts_with(package, entry.first + ".")) {
                return entry.second;
            }
        }
        return std::nullopt;
    }
}  // anonymous namespace

std::vector<std::string> tokenize_command(const std::string& command) {
    CommandTokenizer tokenizer(command);
    return tokenizer.tokenize();
}

std::optional<std::string> extract_core(const std::string& text) {
    auto is_name_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '+' || c == '-';
    };
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !is_name_char(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && is_name_char(text[i])) ++i;
        if (i == start) break;

        std::string segment = text.substr(start, i - start);
        size_t tag = segment.find("_libretro");
        if (tag == std::string::npos || tag == 0) continue;
        for (const char* ext : {".so", ".dll", ".dylib"}) {
            if (ends_with(segment, ext) && segment.size() - std::string(ext).size() >= tag + 9) {
                return segment;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> identify_emulator(const std::string& token,
                                             const std::vector<std::string>& rom_extensions) {
    if (token.empty() || token[0] == '-') {
        return std::nullopt;
    }
    // A core file such as mednafen_psx_libretro.so names a core, not a front-end.
    if (extract_core(token) || is_rom_placeholder(token)) {
        return std::nullopt;
    }
    std::string ext = file_extension(token);
    if (!ext.empty()) {
        for (auto rom_ext : rom_extensions) {
            rom_ext = to_lower(rom_ext);
            if (!rom_ext.empty() && rom_ext.front() == '.') rom_ext.erase(rom_ext.begin());
            if (rom_ext == ext) return std::nullopt;
        }
    }
    std::string lower = to_lower(token);
    if (auto id = match_binary(lower)) {
        return id;
    }
    return match_package(lower);
}

bool is_rom_placeholder(const std::string& token) {
    static const std::vector<std::string> markers = {
        "{file.path}", "{file.uri}", "{file.name}", "{file.basename}", "{file.dir}",
        "%ROM%", "%ROMRAW%", "%ITEM_FILEPATH%"
    };
    return std::any_of(markers.begin(), markers.end(), [&](const std::string& m) {
        return token.find(m) != std::string::npos;
    });
}

LaunchInfo normalize_launch(const std::string& raw, const std::vector<std::string>& rom_extensions) {
    LaunchInfo info;
    info.raw = raw;

    std::vector<std::string> tokens;
    try {
        tokens = tokenize_command(raw);
    } catch (const std::runtime_error& e) {
        log_debug(e.what());
    }

    for (const auto& token : tokens) {
        if (auto id = identify_emulator(token, rom_extensions)) {
            info.emulator = *id;
            info.binary = token;
            break;
        }
    }

    info.core = extract_core(raw);

    for (size_t idx = 0; idx < tokens.size(); ++idx) {
        if (is_rom_placeholder(tokens[idx])) {
            info.romArgIndex = idx;
            break;
        }
    }

    return info;
}

}  // namespace pm
