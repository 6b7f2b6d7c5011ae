#include <catch2/catch.hpp>
#include <pm/launch.h>
#include <pm/metadata.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pm;

TEST_CASE("tokenizer groups quoted arguments", "[launch][tokenize]") {
    auto t = tokenize_command(R"(retroarch -L "/path/my cores/core_libretro.so" '%ROM%')");
    REQUIRE(t.size() == 4);
    REQUIRE(t[0] == "retroarch");
    REQUIRE(t[1] == "-L");
    REQUIRE(t[2] == "/path/my cores/core_libretro.so");
    REQUIRE(t[3] == "%ROM%");
}

TEST_CASE("tokenizer keeps Windows backslashes", "[launch][tokenize]") {
    auto t = tokenize_command(R"("C:\Emulators\RetroArch\retroarch.exe" -L C:\Emulators\RetroArch\cores\snes9x_libretro.dll "{file.path}")");
    REQUIRE(t.size() == 4);
    REQUIRE(t[0] == R"(C:\Emulators\RetroArch\retroarch.exe)");
    REQUIRE(t[2] == R"(C:\Emulators\RetroArch\cores\snes9x_libretro.dll)");
}

TEST_CASE("tokenizer treats newlines as separators", "[launch][tokenize]") {
    auto t = tokenize_command("am start\n-n com.retroarch/x\n-e ROM {file.path}");
    REQUIRE(t.size() == 7);
    REQUIRE(t[2] == "-n");
    REQUIRE(t[6] == "{file.path}");
}

TEST_CASE("tokenizer unescapes quotes inside double quotes", "[launch][tokenize]") {
    auto t = tokenize_command(R"(echo "say \"hi\"")");
    REQUIRE(t.size() == 2);
    REQUIRE(t[1] == R"(say "hi")");
}

TEST_CASE("tokenizer rejects an unterminated quote", "[launch][tokenize]") {
    try {
        tokenize_command("retroarch \"unterminated");
        FAIL("expected tokenize_command to throw");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("unterminated double quote") != std::string::npos);
        REQUIRE(msg.find("column 11") != std::string::npos);
    }
}

TEST_CASE("extract_core finds the libretro core file", "[launch][core]") {
    REQUIRE(extract_core(R"(retroarch -L "/path/cores/mednafen_psx_hw_libretro_android.so" "%ROM%")") ==
            std::optional<std::string>("mednafen_psx_hw_libretro_android.so"));
    REQUIRE(extract_core("-e LIBRETRO /data/cores/flycast_libretro_android.so") ==
            std::optional<std::string>("flycast_libretro_android.so"));
    REQUIRE(extract_core(R"(C:\RA\cores\snes9x_libretro.dll)") == std::optional<std::string>("snes9x_libretro.dll"));
    REQUIRE_FALSE(extract_core("pcsx2-qt -batch {file.path}").has_value());
}

TEST_CASE("extract_core works on name segments", "[launch][core]") {
    REQUIRE(extract_core("LIBRETRO=/cores/fbneo_libretro.so") == std::optional<std::string>("fbneo_libretro.so"));
    REQUIRE(extract_core("'cores/mupen64plus_next_libretro.dylib'") ==
            std::optional<std::string>("mupen64plus_next_libretro.dylib"));
    REQUIRE_FALSE(extract_core("cores/_libretro.so").has_value());
    REQUIRE_FALSE(extract_core("cores/fbneo_libretro.cfg").has_value());
}

TEST_CASE("extract_core handles very long tokens", "[launch][core]") {
    const std::string name(100000, 'a');
    REQUIRE_FALSE(extract_core("retroarch -L cores/" + name + ".so {file.path}").has_value());
    REQUIRE(extract_core("retroarch -L cores/" + name + "_libretro.so {file.path}") ==
            std::optional<std::string>(name + "_libretro.so"));

    auto c = parse_metadata("collection: X\n\ngame: Long\nfile: long.zip\nlaunch: retroarch -L cores/" + name +
                            ".so {file.path}\n");
    REQUIRE(c.games.size() == 1);
    REQUIRE(c.games[0].launchOverride.has_value());
    REQUIRE_FALSE(c.games[0].coreOverride.has_value());
}

TEST_CASE("normalize_launch fills every field for a retroarch command", "[launch]") {
    auto info = normalize_launch(R"(retroarch -L "/path/cores/mednafen_psx_hw_libretro_android.so" "%ROM%")");
    REQUIRE(info.emulator == std::optional<std::string>("retroarch"));
    REQUIRE(info.binary == std::optional<std::string>("retroarch"));
    REQUIRE(info.core == std::optional<std::string>("mednafen_psx_hw_libretro_android.so"));
    REQUIRE(info.romArgIndex == std::optional<size_t>(3));
}

TEST_CASE("normalize_launch recognizes front-end binaries by base name", "[launch]") {
    auto info = normalize_launch(R"("C:\Program Files\PCSX2\pcsx2-qt.exe" -fullscreen -- "{file.path}")");
    REQUIRE(info.emulator == std::optional<std::string>("pcsx2"));
    REQUIRE(info.binary == std::optional<std::string>(R"(C:\Program Files\PCSX2\pcsx2-qt.exe)"));
    REQUIRE_FALSE(info.core.has_value());
    REQUIRE(info.romArgIndex == std::optional<size_t>(3));

    REQUIRE(identify_emulator("/usr/bin/dolphin-emu") == std::optional<std::string>("dolphin"));
    REQUIRE(identify_emulator("PPSSPPSDL") == std::optional<std::string>("ppsspp"));
    REQUIRE_FALSE(identify_emulator("--config=/home/me/retroarch.cfg").has_value());
    REQUIRE_FALSE(identify_emulator("/cores/mednafen_psx_libretro.so").has_value());
}

TEST_CASE("normalize_launch handles Android am start blocks", "[launch]") {
    std::string raw =
        "am start\n"
        "-n com.retroarch.aarch64/com.retroarch.browser.retroactivity.RetroActivityFuture\n"
        "-e ROM {file.path}\n"
        "-e LIBRETRO /data/data/com.retroarch.aarch64/cores/flycast_libretro_android.so";
    auto info = normalize_launch(raw);
    REQUIRE(info.emulator == std::optional<std::string>("retroarch"));
    REQUIRE(info.binary ==
            std::optional<std::string>("com.retroarch.aarch64/com.retroarch.browser.retroactivity.RetroActivityFuture"));
    REQUIRE(info.core == std::optional<std::string>("flycast_libretro_android.so"));
    REQUIRE(info.romArgIndex == std::optional<size_t>(6));
}

TEST_CASE("normalize_launch recognizes flatpak application ids", "[launch]") {
    auto info = normalize_launch("flatpak run org.libretro.RetroArch -L cores/genesis_plus_gx_libretro.so {file.path}");
    REQUIRE(info.emulator == std::optional<std::string>("retroarch"));
    REQUIRE(info.binary == std::optional<std::string>("org.libretro.RetroArch"));
    REQUIRE(info.core == std::optional<std::string>("genesis_plus_gx_libretro.so"));
    REQUIRE(info.romArgIndex == std::optional<size_t>(5));
}

TEST_CASE("normalize_launch degrades gracefully on bad quoting", "[launch]") {
    std::string raw = R"(retroarch -L "/cores/fceumm_libretro.so {file.path})";
    auto info = normalize_launch(raw);
    REQUIRE(info.raw == raw);
    REQUIRE_FALSE(info.emulator.has_value());
    REQUIRE_FALSE(info.binary.has_value());
    REQUIRE_FALSE(info.romArgIndex.has_value());
    // core lookup runs on the raw text, not on tokens
    REQUIRE(info.core == std::optional<std::string>("fceumm_libretro.so"));
}

TEST_CASE("normalize_launch of an unknown command keeps only raw", "[launch]") {
    auto info = normalize_launch("./run.sh");
    REQUIRE(info.raw == "./run.sh");
    REQUIRE_FALSE(info.emulator.has_value());
    REQUIRE_FALSE(info.core.has_value());
    REQUIRE_FALSE(info.romArgIndex.has_value());
}

TEST_CASE("ROM paths are never taken for the front-end", "[launch]") {
    const std::vector<std::string> extensions = {"cue", "chd"};
    REQUIRE_FALSE(identify_emulator("/roms/mednafen-test.cue", extensions).has_value());
    REQUIRE_FALSE(identify_emulator("/roms/mednafen-test.CUE", {".cue"}).has_value());
    REQUIRE_FALSE(identify_emulator("{file.dir}/mednafen-test").has_value());
    REQUIRE(identify_emulator("/usr/bin/mednafen", extensions) == std::optional<std::string>("mednafen"));

    auto rom_first = normalize_launch("/roms/mednafen-test.cue", extensions);
    REQUIRE_FALSE(rom_first.emulator.has_value());

    auto info = normalize_launch("mednafen -force_module psx /roms/mednafen-test.cue", extensions);
    REQUIRE(info.emulator == std::optional<std::string>("mednafen"));
    REQUIRE(info.binary == std::optional<std::string>("mednafen"));
}
