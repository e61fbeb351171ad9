#include "../../include/aeo_engine/orchestrator/CrawlRecords.h"

namespace aeo_engine::orchestrator {

using nlohmann::json;

std::string toString(PageOutcomeStatus status) {
    return status == PageOutcomeStatus::BLOCKED ? "blocked" : "failed";
}

std::string toString(RunState state) {
    switch (state) {
        case RunState::QUEUED: return "queued";
        case RunState::RUNNING: return "running";
        case RunState::PAUSED: return "paused";
        case RunState::COMPLETED: return "completed";
        case RunState::FAILED: return "failed";
    }
    return "queued";
}

std::string toString(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::COMPLETED: return "completed";
        case AnalysisStatus::BLOCKED: return "blocked";
        case AnalysisStatus::FAILED: return "failed";
    }
    return "failed";
}

ScoreRecord toScoreRecord(const PageAnalysis& analysis) {
    ScoreRecord record;
    if (analysis.snapshot) {
        record.snapshotId = analysis.snapshot->id;
        record.runId = analysis.snapshot->runId;
        record.url = analysis.snapshot->url;
    } else {
        record.url = analysis.url;
    }
    record.pageType = analysis.pageType;
    record.ruleScore = analysis.ruleScore;
    record.recommendations = analysis.recommendations;
    record.aiScore = analysis.aiScore;
    record.aiScoreUnavailable = analysis.aiScoreUnavailable;
    record.aiUnavailableReason = analysis.aiUnavailableReason;
    return record;
}

bool isTerminal(RunState state) {
    return state == RunState::COMPLETED || state == RunState::FAILED;
}

void to_json(json& j, const PageSnapshot& snapshot) {
    j = json{
        {"id", snapshot.id},
        {"runId", snapshot.runId},
        {"url", snapshot.url},
        {"urlHash", snapshot.urlHash},
        {"fetchedUrl", snapshot.fetchedUrl},
        {"statusCode", snapshot.statusCode},
        {"cleanedText", snapshot.cleanedText},
        {"contentHash", snapshot.contentHash},
        {"extraction", snapshot.extraction},
        {"metrics", snapshot.metrics},
        {"pageType", extraction::toString(snapshot.pageType)},
        {"capturedAt", snapshot.capturedAt}
    };
    if (snapshot.rawHtml) {
        j["rawHtml"] = *snapshot.rawHtml;
    }
}

void to_json(json& j, const ScoreRecord& record) {
    j = json{
        {"snapshotId", record.snapshotId},
        {"runId", record.runId},
        {"url", record.url},
        {"pageType", extraction::toString(record.pageType)},
        {"ruleScore", record.ruleScore},
        {"recommendations", record.recommendations},
        {"aiScoreUnavailable", record.aiScoreUnavailable}
    };
    if (record.aiScore) {
        j["aiScore"] = *record.aiScore;
    }
    if (!record.aiUnavailableReason.empty()) {
        j["aiUnavailableReason"] = record.aiUnavailableReason;
    }
}

void to_json(json& j, const PageOutcome& outcome) {
    j = json{
        {"runId", outcome.runId},
        {"url", outcome.url},
        {"status", toString(outcome.status)},
        {"reason", outcome.reason},
        {"statusCode", outcome.statusCode},
        {"recommendations", outcome.recommendations}
    };
}

void to_json(json& j, const RunStatus& status) {
    j = json{
        {"runId", status.runId},
        {"projectId", status.projectId},
        {"runType", status.runType},
        {"status", toString(status.state)},
        {"pagesDiscovered", status.pagesDiscovered},
        {"pagesProcessed", status.pagesProcessed},
        {"pagesFailed", status.pagesFailed},
        {"pagesBlocked", status.pagesBlocked},
        {"pagesUnchanged", status.pagesUnchanged},
        {"snapshotsCreated", status.snapshotsCreated},
        {"tokensUsed", status.tokensUsed},
        {"reason", status.reason},
        {"startedAt", status.startedAt},
        {"finishedAt", status.finishedAt}
    };
}

void to_json(json& j, const PageAnalysis& analysis) {
    j = json{
        {"status", toString(analysis.status)},
        {"url", analysis.url},
        {"pageType", extraction::toString(analysis.pageType)},
        {"ruleScore", analysis.ruleScore},
        {"recommendations", analysis.recommendations},
        {"aiScoreUnavailable", analysis.aiScoreUnavailable},
        {"crawlStrategy", analysis.crawlStrategy},
        {"statusCode", analysis.statusCode}
    };
    if (analysis.snapshot) {
        // Raw HTML stays with the snapshot record
        json snapshot = *analysis.snapshot;
        snapshot.erase("rawHtml");
        j["snapshot"] = snapshot;
    }
    if (analysis.aiScore) {
        j["aiScore"] = *analysis.aiScore;
    }
    if (!analysis.aiUnavailableReason.empty()) {
        j["aiUnavailableReason"] = analysis.aiUnavailableReason;
    }
    if (!analysis.error.empty()) {
        j["error"] = analysis.error;
    }
}

} // namespace aeo_engine::orchestrator
