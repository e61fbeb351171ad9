#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "CrawlRecords.h"

namespace aeo_engine::orchestrator {

// Outbound records of the pipeline. Implementations must be thread-safe.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    // Snapshots are immutable: re-emitting an existing id throws AeoError
    virtual void emitSnapshot(const PageSnapshot& snapshot) = 0;
    virtual void emitScore(const ScoreRecord& record) = 0;
    virtual void emitPageOutcome(const PageOutcome& outcome) = 0;
    virtual void emitRunStatus(const RunStatus& status) = 0;
};

class SnapshotRepository {
public:
    virtual ~SnapshotRepository() = default;

    virtual std::optional<PageSnapshot> findSnapshot(const std::string& snapshotId) const = 0;

    // Content hash of the newest snapshot for a canonical URL hash
    virtual std::optional<std::string> latestContentHash(const std::string& urlHash) const = 0;

    // Unique id for the next snapshot of a canonical URL hash
    virtual std::string allocateSnapshotId(const std::string& urlHash) = 0;
};

/**
 * Process-local store for snapshots, scores and run states, optionally mirrored
 * to a JSON-lines file ({"type": ..., "record": ...} per line).
 */
class InMemoryResultStore : public ResultSink, public SnapshotRepository {
public:
    explicit InMemoryResultStore(const std::string& mirrorPath = "");
    ~InMemoryResultStore() override;

    InMemoryResultStore(const InMemoryResultStore&) = delete;
    InMemoryResultStore& operator=(const InMemoryResultStore&) = delete;

    void emitSnapshot(const PageSnapshot& snapshot) override;
    void emitScore(const ScoreRecord& record) override;
    void emitPageOutcome(const PageOutcome& outcome) override;
    void emitRunStatus(const RunStatus& status) override;

    std::optional<PageSnapshot> findSnapshot(const std::string& snapshotId) const override;
    std::optional<std::string> latestContentHash(const std::string& urlHash) const override;
    std::string allocateSnapshotId(const std::string& urlHash) override;

    std::vector<PageSnapshot> snapshots() const;
    std::vector<ScoreRecord> scores() const;
    std::vector<PageOutcome> pageOutcomes() const;
    // Every emitted status, oldest first
    std::vector<RunStatus> runStatusHistory(const std::string& runId) const;

    // Newest score for a snapshot
    std::optional<ScoreRecord> latestScore(const std::string& snapshotId) const;

private:
    void mirror(const std::string& type, const nlohmann::json& record);

    mutable std::mutex mutex_;
    std::vector<PageSnapshot> snapshots_;
    std::unordered_map<std::string, size_t> snapshotIndex_;
    std::unordered_map<std::string, std::string> latestHashByUrl_;
    std::vector<ScoreRecord> scores_;
    std::vector<PageOutcome> outcomes_;
    std::map<std::string, std::vector<RunStatus>> runStatuses_;
    uint64_t snapshotCounter_ = 0;
    std::ofstream mirror_;
};

} // namespace aeo_engine::orchestrator
