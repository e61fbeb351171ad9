#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../ai/AiRubricScorer.h"
#include "../common/Recommendation.h"
#include "../extraction/ContentExtraction.h"
#include "../extraction/PageTypeClassifier.h"
#include "../scoring/RuleScoreCalculator.h"

namespace aeo_engine::orchestrator {

// Immutable capture of one fetched page
struct PageSnapshot {
    std::string id;            // snap_<shortHash>_<n>
    std::string runId;
    std::string url;           // canonical URL
    std::string urlHash;
    std::string fetchedUrl;
    int statusCode = 0;
    std::optional<std::string> rawHtml;
    std::string cleanedText;
    std::string contentHash;
    extraction::ContentExtraction extraction;
    extraction::PageMetrics metrics;
    extraction::PageType pageType = extraction::PageType::RESOURCE;
    std::string capturedAt;
};

struct ScoreRecord {
    std::string snapshotId;
    std::string runId;
    std::string url;
    extraction::PageType pageType = extraction::PageType::RESOURCE;
    scoring::RuleScore ruleScore;
    std::vector<common::Recommendation> recommendations;
    std::optional<ai::AiScoreResult> aiScore;
    bool aiScoreUnavailable = false;
    std::string aiUnavailableReason;
};

enum class PageOutcomeStatus {
    BLOCKED,
    FAILED
};

std::string toString(PageOutcomeStatus status);

// Terminal record for a page that produced no snapshot
struct PageOutcome {
    std::string runId;
    std::string url;
    PageOutcomeStatus status = PageOutcomeStatus::FAILED;
    std::string reason;
    int statusCode = 0;
    std::vector<common::Recommendation> recommendations;
};

enum class RunState {
    QUEUED,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED
};

std::string toString(RunState state);
bool isTerminal(RunState state);

struct RunStatus {
    std::string runId;
    std::string projectId;
    std::string runType;
    RunState state = RunState::QUEUED;
    size_t pagesDiscovered = 0;
    size_t pagesProcessed = 0;
    size_t pagesFailed = 0;
    size_t pagesBlocked = 0;
    size_t pagesUnchanged = 0;
    size_t snapshotsCreated = 0;
    long long tokensUsed = 0;
    std::string reason;
    std::string startedAt;
    std::string finishedAt;
};

enum class AnalysisStatus {
    COMPLETED,
    BLOCKED,
    FAILED
};

std::string toString(AnalysisStatus status);

// Outcome of analyzing a single page
struct PageAnalysis {
    AnalysisStatus status = AnalysisStatus::FAILED;
    std::string url;
    std::optional<PageSnapshot> snapshot;
    extraction::PageType pageType = extraction::PageType::RESOURCE;
    scoring::RuleScore ruleScore;
    std::vector<common::Recommendation> recommendations;
    std::optional<ai::AiScoreResult> aiScore;
    bool aiScoreUnavailable = false;
    std::string aiUnavailableReason;
    std::string crawlStrategy;
    std::string error;
    int statusCode = 0;
};

// Score record for an analysis that produced a snapshot
ScoreRecord toScoreRecord(const PageAnalysis& analysis);

void to_json(nlohmann::json& j, const PageSnapshot& snapshot);
void to_json(nlohmann::json& j, const ScoreRecord& record);
void to_json(nlohmann::json& j, const PageOutcome& outcome);
void to_json(nlohmann::json& j, const RunStatus& status);
void to_json(nlohmann::json& j, const PageAnalysis& analysis);

} // namespace aeo_engine::orchestrator
