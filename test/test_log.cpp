#include <catch2/catch.hpp>
#include <pm/log.h>

#include <sstream>

using namespace pm;

// Points the log at a local stream and restores the defaults on scope exit.
struct LogCapture {
    std::ostringstream out;

    LogCapture() { set_log_stream(&out); }
    ~LogCapture() {
        set_log_stream(nullptr);
        set_log_level(LogLevel::Warn);
    }
};

TEST_CASE("log messages are filtered by level", "[log]") {
    LogCapture capture;
    auto& out = capture.out;
    REQUIRE(log_level() == LogLevel::Warn);

    log_debug("hidden");
    log_info("hidden too");
    log_warn("careful");
    log_error("broken");
    REQUIRE(out.str() == "[WARN] careful\n[ERROR] broken\n");

    SECTION("debug shows everything") {
        out.str("");
        set_log_level(LogLevel::Debug);
        log_debug("d");
        log_info("i");
        REQUIRE(out.str() == "[DEBUG] d\n[INFO] i\n");
    }

    SECTION("off silences errors") {
        out.str("");
        set_log_level(LogLevel::Off);
        log_error("nobody hears this");
        log_message(LogLevel::Off, "nor this");
        REQUIRE(out.str().empty());
    }
}
