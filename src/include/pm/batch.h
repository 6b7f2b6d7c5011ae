#pragma once

#include <pm/closure.h>
#include <pm/discover.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pm {

struct FileOutcome {
    enum class Status { Passed, Failed, Error };

    std::string key;
    std::string path;
    Status status = Status::Error;
    std::optional<ClosureReport> report;  // set unless status is Error
    std::string error;                    // set when status is Error
};

struct BatchSummary {
    size_t passed = 0;
    size_t failed = 0;
    size_t errored = 0;
    std::vector<FileOutcome> outcomes;

    size_t total() const { return outcomes.size(); }
    bool all_passed() const { return failed == 0 && errored == 0; }
};

// Verifies every collection in key order. A failing or unreadable file is
// recorded and the loop goes on.
BatchSummary verify_batch(const std::map<std::string, CollectionSource>& collections,
                          const ClosureOptions& options = {});

}  // namespace pm
