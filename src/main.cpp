#include "../include/Logger.h"
#include "../include/aeo_engine/ai/AiRubricScorer.h"
#include "../include/aeo_engine/ai/ContentPreparer.h"
#include "../include/aeo_engine/ai/LlmClient.h"
#include "../include/aeo_engine/ai/RubricStore.h"
#include "../include/aeo_engine/common/Config.h"
#include "../include/aeo_engine/common/Errors.h"
#include "../include/aeo_engine/http/HttpClient.h"
#include "../include/aeo_engine/orchestrator/CrawlOrchestrator.h"
#include "../include/crawler/CrawlLogger.h"

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <unistd.h>

using namespace aeo_engine;
using nlohmann::json;

namespace {

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        char** messages = backtrace_symbols(array, size);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        if (messages) {
            for (int i = 0; i < size; ++i) {
                std::cerr << messages[i] << "\n";
            }
        }
        std::cerr.flush();
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void printUsage() {
    std::cerr << "Usage:\n"
              << "  aeo-engine analyze <domain> [url] [--ai]\n"
              << "  aeo-engine crawl <project.json>\n"
              << "  aeo-engine rubric-stats\n";
}

std::shared_ptr<ai::AiRubricScorer> makeScorer(const common::AppConfig& config, http::HttpClient& httpClient) {
    if (config.openAiApiKey.empty()) {
        LOG_WARNING("OPENAI_API_KEY is not set; AI scoring disabled");
        return nullptr;
    }

    ai::OpenAiLlmClient::Options llmOptions;
    llmOptions.apiKey = config.openAiApiKey;
    llmOptions.baseUrl = config.openAiBaseUrl;
    llmOptions.model = config.openAiModel;
    llmOptions.maxTokens = config.openAiMaxTokens;
    auto llm = std::make_shared<ai::OpenAiLlmClient>(httpClient, llmOptions);

    ai::ContentPreparer::Options preparerOptions;
    preparerOptions.thresholdTokens = config.summaryThresholdTokens;
    preparerOptions.targetWords = config.summaryTargetWords;
    preparerOptions.timeout = config.llmTimeout;
    auto preparer = std::make_shared<ai::ContentPreparer>(llm, preparerOptions);

    ai::AiRubricScorer::Options scorerOptions;
    scorerOptions.maxTokens = config.openAiMaxTokens;
    scorerOptions.maxConcurrency = config.llmMaxConcurrency;
    scorerOptions.timeout = config.llmTimeout;
    scorerOptions.cacheTtl = std::chrono::duration_cast<std::chrono::milliseconds>(config.aiCacheTtl);

    auto rubric = std::make_shared<ai::RubricStore>(config.rubricPath);
    return std::make_shared<ai::AiRubricScorer>(llm, rubric, preparer, scorerOptions);
}

int runAnalyze(const common::AppConfig& config, int argc, char* argv[]) {
    std::string domain;
    std::optional<std::string> specificUrl;
    bool withAi = false;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--ai") {
            withAi = true;
        } else if (domain.empty()) {
            domain = arg;
        } else if (!specificUrl) {
            specificUrl = arg;
        } else {
            printUsage();
            return 2;
        }
    }
    if (domain.empty()) {
        printUsage();
        return 2;
    }

    http::CurlHttpClient httpClient;
    orchestrator::InMemoryResultStore store(config.resultsFile);
    auto scorer = withAi ? makeScorer(config, httpClient) : nullptr;
    orchestrator::CrawlOrchestrator engine(config, httpClient, store, store, scorer);

    const orchestrator::PageAnalysis analysis = engine.analyzeDomain(domain, specificUrl, withAi);
    std::cout << json(analysis).dump(2) << std::endl;
    return analysis.status == orchestrator::AnalysisStatus::FAILED ? 1 : 0;
}

int runCrawl(const common::AppConfig& config, const std::string& projectPath) {
    const orchestrator::ProjectConfig project = orchestrator::ProjectConfig::loadFromFile(projectPath);

    CrawlLogger::setRunLogBroadcastFunction([](const std::string& runId, const std::string& message,
                                               const std::string& level) {
        LOG_DEBUG("[" + runId + "] [" + level + "] " + message);
    });

    http::CurlHttpClient httpClient;
    orchestrator::InMemoryResultStore store(config.resultsFile);
    auto scorer = project.aiScoring ? makeScorer(config, httpClient) : nullptr;
    orchestrator::CrawlOrchestrator engine(config, httpClient, store, store, scorer);

    const orchestrator::CrawlRunId runId = engine.startCrawl(project);
    const orchestrator::RunStatus status = engine.waitForRun(runId, std::chrono::hours(24));

    json output{
        {"run", status},
        {"scores", store.scores()},
        {"pageOutcomes", store.pageOutcomes()}
    };
    std::cout << output.dump(2) << std::endl;
    return status.state == orchestrator::RunState::COMPLETED ? 0 : 1;
}

int runRubricStats(const common::AppConfig& config) {
    ai::RubricStore rubric(config.rubricPath);
    std::cout << json(rubric.stats()).dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();
    Logger::getInstance().initFromEnvironment();

    if (argc < 2) {
        printUsage();
        return 2;
    }
    const std::string command = argv[1];

    try {
        const common::AppConfig config = common::AppConfig::fromEnvironment();
        if (command == "analyze") {
            return runAnalyze(config, argc, argv);
        }
        if (command == "crawl" && argc == 3) {
            return runCrawl(config, argv[2]);
        }
        if (command == "rubric-stats") {
            return runRubricStats(config);
        }
        printUsage();
        return 2;
    } catch (const common::AeoError& e) {
        LOG_ERROR(e.what());
        std::cout << json{{"error", e.what()}}.dump(2) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
