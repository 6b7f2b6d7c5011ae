#include <pm/log.h>
#include <iostream>

namespace pm {

namespace {
    LogLevel g_level = LogLevel::Warn;
    std::ostream* g_stream = nullptr;

    const char* prefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "[DEBUG] ";
            case LogLevel::Info: return "[INFO] ";
            case LogLevel::Warn: return "[WARN] ";
            case LogLevel::Error: return "[ERROR] ";
            case LogLevel::Off: break;
        }
        return "";
    }
}  // anonymous namespace

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

void set_log_stream(std::ostream* out) {
    g_stream = out;
}

void log_message(LogLevel level, const std::string& msg) {
    if (level == LogLevel::Off || level < g_level) return;
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << prefix(level) << msg << "\n";
}

}  // namespace pm
