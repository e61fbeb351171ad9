#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/Hashing.h"
#include "../../include/aeo_engine/orchestrator/ResultStore.h"

#include <cstdio>
#include <fstream>

using namespace aeo_engine::orchestrator;
using nlohmann::json;

namespace {

PageSnapshot makeSnapshot(InMemoryResultStore& store, const std::string& url, const std::string& text) {
    PageSnapshot snapshot;
    snapshot.url = url;
    snapshot.urlHash = aeo_engine::common::sha256Hex(url);
    snapshot.id = store.allocateSnapshotId(snapshot.urlHash);
    snapshot.runId = "crawl_1_1";
    snapshot.statusCode = 200;
    snapshot.cleanedText = text;
    snapshot.contentHash = aeo_engine::common::contentHash(text);
    return snapshot;
}

} // namespace

TEST_CASE("InMemoryResultStore keeps immutable snapshots", "[InMemoryResultStore]") {
    InMemoryResultStore store;

    const auto first = makeSnapshot(store, "https://example.com/a", "first version");
    REQUIRE(first.id == "snap_" + first.urlHash.substr(0, 16) + "_1");
    store.emitSnapshot(first);

    REQUIRE(store.latestContentHash(first.urlHash) == first.contentHash);
    REQUIRE(store.findSnapshot(first.id)->cleanedText == "first version");
    REQUIRE_FALSE(store.findSnapshot("snap_missing").has_value());

    SECTION("Re-emitting an id is rejected") {
        auto changed = first;
        changed.cleanedText = "rewritten";
        REQUIRE_THROWS_AS(store.emitSnapshot(changed), aeo_engine::common::AeoError);
        REQUIRE(store.findSnapshot(first.id)->cleanedText == "first version");
    }

    SECTION("A new snapshot of the same URL becomes the latest") {
        const auto second = makeSnapshot(store, "https://example.com/a", "second version");
        REQUIRE(second.id != first.id);
        store.emitSnapshot(second);
        REQUIRE(store.snapshots().size() == 2);
        REQUIRE(store.latestContentHash(first.urlHash) == second.contentHash);
    }
}

TEST_CASE("InMemoryResultStore tracks scores and run statuses", "[InMemoryResultStore]") {
    InMemoryResultStore store;

    ScoreRecord older;
    older.snapshotId = "snap_x_1";
    older.ruleScore.overall = 40;
    ScoreRecord newer = older;
    newer.ruleScore.overall = 65;
    store.emitScore(older);
    store.emitScore(newer);
    REQUIRE(store.latestScore("snap_x_1")->ruleScore.overall == 65);
    REQUIRE_FALSE(store.latestScore("snap_y_1").has_value());

    RunStatus status;
    status.runId = "crawl_1_1";
    store.emitRunStatus(status);
    status.state = RunState::COMPLETED;
    store.emitRunStatus(status);
    const auto history = store.runStatusHistory("crawl_1_1");
    REQUIRE(history.size() == 2);
    REQUIRE(history.back().state == RunState::COMPLETED);
    REQUIRE(store.runStatusHistory("crawl_2_2").empty());
}

TEST_CASE("InMemoryResultStore mirrors records as JSON lines", "[InMemoryResultStore]") {
    const std::string path = "result_store_mirror_test.jsonl";
    std::remove(path.c_str());
    {
        InMemoryResultStore store(path);
        store.emitSnapshot(makeSnapshot(store, "https://example.com/", "home"));

        PageOutcome outcome;
        outcome.url = "https://example.com/private";
        outcome.status = PageOutcomeStatus::BLOCKED;
        outcome.reason = "Disallowed by robots.txt";
        store.emitPageOutcome(outcome);
    }

    std::ifstream in(path);
    std::string line;
    std::vector<json> records;
    while (std::getline(in, line)) {
        records.push_back(json::parse(line));
    }
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["type"] == "snapshot");
    REQUIRE(records[0]["record"]["cleanedText"] == "home");
    REQUIRE(records[1]["type"] == "page_outcome");
    REQUIRE(records[1]["record"]["status"] == "blocked");
    in.close();
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(InMemoryResultStore("no_such_dir/records.jsonl"), aeo_engine::common::ConfigError);
}
