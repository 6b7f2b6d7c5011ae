#pragma once

#include <pm/model.h>
#include <pm/path_segments.h>
#include <map>
#include <optional>
#include <string>

namespace pm {

// Chooses the emulator core a game should run with. Product heuristics live
// in implementations of this interface, never in the parser or the writer.
class CorePolicy {
public:
    virtual ~CorePolicy() = default;

    virtual std::optional<std::string> choose_core(const std::string& platform_key,
                                                   const Header& header,
                                                   const Game& game) const = 0;
};

// Table-driven policy. Precedence: the game's coreOverride, the core named in
// the header launch block, the platform table, then the extension table
// (lowercase, no dot) looked up with the primary file.
class TableCorePolicy : public CorePolicy {
public:
    TableCorePolicy() = default;
    TableCorePolicy(std::map<std::string, std::string> platform_cores,
                    std::map<std::string, std::string> extension_cores);

    void set_platform_core(const std::string& platform_key, const std::string& core);
    void set_extension_core(const std::string& extension, const std::string& core);

    std::optional<std::string> choose_core(const std::string& platform_key,
                                           const Header& header,
                                           const Game& game) const override;

private:
    std::map<std::string, std::string> platform_cores_;
    std::map<std::string, std::string> extension_cores_;
};

}  // namespace pm
