#include "../../include/aeo_engine/orchestrator/ResultStore.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/Logger.h"

namespace aeo_engine::orchestrator {

using nlohmann::json;

InMemoryResultStore::InMemoryResultStore(const std::string& mirrorPath) {
    if (!mirrorPath.empty()) {
        mirror_.open(mirrorPath, std::ios::app);
        if (!mirror_.is_open()) {
            throw common::ConfigError("cannot open results file " + mirrorPath);
        }
        LOG_INFO("Mirroring crawl records to " + mirrorPath);
    }
}

InMemoryResultStore::~InMemoryResultStore() {
    if (mirror_.is_open()) {
        mirror_.close();
    }
}

void InMemoryResultStore::mirror(const std::string& type, const json& record) {
    if (!mirror_.is_open()) {
        return;
    }
    mirror_ << json{{"type", type}, {"record", record}}.dump() << '\n';
    mirror_.flush();
}

void InMemoryResultStore::emitSnapshot(const PageSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshotIndex_.count(snapshot.id) > 0) {
        throw common::AeoError("snapshot " + snapshot.id + " already exists");
    }
    snapshotIndex_[snapshot.id] = snapshots_.size();
    snapshots_.push_back(snapshot);
    latestHashByUrl_[snapshot.urlHash] = snapshot.contentHash;
    mirror("snapshot", snapshot);
}

void InMemoryResultStore::emitScore(const ScoreRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    scores_.push_back(record);
    mirror("score", record);
}

void InMemoryResultStore::emitPageOutcome(const PageOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
    mirror("page_outcome", outcome);
}

void InMemoryResultStore::emitRunStatus(const RunStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    runStatuses_[status.runId].push_back(status);
    mirror("run_status", status);
}

std::optional<PageSnapshot> InMemoryResultStore::findSnapshot(const std::string& snapshotId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshotIndex_.find(snapshotId);
    if (it == snapshotIndex_.end()) {
        return std::nullopt;
    }
    return snapshots_[it->second];
}

std::optional<std::string> InMemoryResultStore::latestContentHash(const std::string& urlHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latestHashByUrl_.find(urlHash);
    if (it == latestHashByUrl_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string InMemoryResultStore::allocateSnapshotId(const std::string& urlHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    return "snap_" + urlHash.substr(0, 16) + "_" + std::to_string(++snapshotCounter_);
}

std::vector<PageSnapshot> InMemoryResultStore::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

std::vector<ScoreRecord> InMemoryResultStore::scores() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scores_;
}

std::vector<PageOutcome> InMemoryResultStore::pageOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::vector<RunStatus> InMemoryResultStore::runStatusHistory(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runStatuses_.find(runId);
    return it == runStatuses_.end() ? std::vector<RunStatus>() : it->second;
}

std::optional<ScoreRecord> InMemoryResultStore::latestScore(const std::string& snapshotId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = scores_.rbegin(); it != scores_.rend(); ++it) {
        if (it->snapshotId == snapshotId) {
            return *it;
        }
    }
    return std::nullopt;
}

} // namespace aeo_engine::orchestrator
