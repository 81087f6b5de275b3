#pragma once

#include "core/services/IResultReporter.hpp"

#include <ostream>
#include <string>

namespace eyes::infra {

/**
 * @brief Human-readable rendering of the outcome stream.
 *
 * Prints "<port>: open" for open ports and "<port>: error (<cause>)" for
 * probe errors. In verbose mode closed and timed-out ports are printed too,
 * together with a configuration preamble and a summary line. The stream end
 * is marked with "[eyes] Finished scan" (or "[eyes] Scan cancelled").
 */
class TextReporter : public core::IResultReporter {
public:
    /**
     * @brief Constructs a reporter writing to the given stream.
     * @param out Destination stream; must outlive the reporter.
     * @param verbose Print every outcome instead of only open ports and errors.
     */
    TextReporter(std::ostream& out, bool verbose);

    void onStart(const core::ScanConfig& config) override;
    void onOutcome(const core::ProbeOutcome& outcome) override;
    void onFinished(const core::ScanSummary& summary) override;

    /**
     * @brief Formats the line printed for one outcome.
     * @return The line without trailing newline.
     */
    static std::string formatOutcome(const core::ProbeOutcome& outcome);

private:
    std::ostream& out_;
    bool verbose_;
};

} // namespace eyes::infra
