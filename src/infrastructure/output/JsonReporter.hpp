#pragma once

#include "core/services/IResultReporter.hpp"

#include <nlohmann/json.hpp>
#include <ostream>

namespace eyes::infra {

/**
 * @brief Line-delimited JSON rendering of the outcome stream.
 *
 * Emits one object per reported outcome and a final "finished" event.
 * Follows the same verbosity filter as the text output.
 */
class JsonReporter : public core::IResultReporter {
public:
    JsonReporter(std::ostream& out, bool verbose);

    void onStart(const core::ScanConfig& config) override;
    void onOutcome(const core::ProbeOutcome& outcome) override;
    void onFinished(const core::ScanSummary& summary) override;

    static nlohmann::json toJson(const core::ProbeOutcome& outcome);
    static nlohmann::json toJson(const core::ScanSummary& summary);

private:
    void writeLine(const nlohmann::json& j);

    std::ostream& out_;
    bool verbose_;
};

} // namespace eyes::infra
