#include <pm/batch.h>
#include <pm/errors.h>
#include <pm/log.h>
#include <sstream>

namespace pm {

BatchSummary verify_batch(const std::map<std::string, CollectionSource>& collections,
                          const ClosureOptions& options) {
    BatchSummary summary;

    for (const auto& entry : collections) {
        FileOutcome outcome;
        outcome.key = entry.first;
        outcome.path = entry.second.path;

        try {
            ClosureReport report = verify_closure(entry.second.path, options);
            outcome.status = report.ok ? FileOutcome::Status::Passed : FileOutcome::Status::Failed;
            outcome.report = std::move(report);
        } catch (const FormatError& e) {
            outcome.status = FileOutcome::Status::Error;
            outcome.error = e.what();
            log_error(entry.first + ": " + e.what());
        }

        switch (outcome.status) {
            case FileOutcome::Status::Passed: ++summary.passed; break;
            case FileOutcome::Status::Failed: ++summary.failed; break;
            case FileOutcome::Status::Error: ++summary.errored; break;
        }
        summary.outcomes.push_back(std::move(outcome));
    }

    std::ostringstream ss;
    ss << "closure batch: " << summary.passed << " passed, " << summary.failed << " failed, "
       << summary.errored << " errors";
    log_info(ss.str());
    return summary;
}

}  // namespace pm
