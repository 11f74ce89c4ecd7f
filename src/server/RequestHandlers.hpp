#pragma once

#include "../analysis/AnalysisRequest.hpp"
#include "../analysis/AnalysisSettings.hpp"
#include "../analysis/DetectionOrchestrator.hpp"
#include "../analysis/GenerationOrchestrator.hpp"
#include "../analysis/SummarizationOrchestrator.hpp"
#include "../persistence/ResultStore.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace server
{

struct HandlerResponse
{
    int status = 200;
    nlohmann::json body; // null for bodiless responses (204)
};

/**
 * @brief Request validation, dispatch and persistence, independent of the HTTP library.
 *
 * handle() maps the outcome onto a status code: 204 for OPTIONS, 405 for
 * anything but POST, 400 for validation failures, 500 for unexpected
 * exceptions and 200 otherwise (degraded results included, with "error" set).
 */
class RequestHandlers
{
public:
    RequestHandlers(const analysis::DetectionOrchestrator& detector,
                    const analysis::SummarizationOrchestrator& summarizer,
                    const analysis::GenerationOrchestrator& generator, persistence::IResultStore& store,
                    analysis::AnalysisSettings settings);

    HandlerResponse handle(analysis::RequestKind kind, const std::string& method, const std::string& body);

    HandlerResponse detectAIText(const std::string& method, const std::string& body)
    {
        return handle(analysis::RequestKind::Detection, method, body);
    }
    HandlerResponse summarizeText(const std::string& method, const std::string& body)
    {
        return handle(analysis::RequestKind::Summarization, method, body);
    }
    HandlerResponse generateText(const std::string& method, const std::string& body)
    {
        return handle(analysis::RequestKind::Generation, method, body);
    }

    // {status, version, uptimeSeconds, pendingWrites, errors}
    nlohmann::json health() const;

    static HandlerResponse error(int status, const std::string& message);

private:
    static constexpr std::size_t kHealthRecentErrors = 5;

    struct Outcome
    {
        std::string input;
        nlohmann::json output;
    };

    Outcome run(const analysis::AnalysisRequest& request) const;
    // Queues the record; store failures are logged and reported, never thrown.
    void persist(analysis::RequestKind kind, std::string input, const nlohmann::json& output) const;

    const analysis::DetectionOrchestrator& detector_;
    const analysis::SummarizationOrchestrator& summarizer_;
    const analysis::GenerationOrchestrator& generator_;
    persistence::IResultStore& store_;
    analysis::AnalysisSettings settings_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace server
