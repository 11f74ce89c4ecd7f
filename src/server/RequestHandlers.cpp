#include "RequestHandlers.hpp"

#include "../app/Version.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <type_traits>
#include <variant>

namespace server
{

RequestHandlers::RequestHandlers(const analysis::DetectionOrchestrator& detector,
                                 const analysis::SummarizationOrchestrator& summarizer,
                                 const analysis::GenerationOrchestrator& generator, persistence::IResultStore& store,
                                 analysis::AnalysisSettings settings)
    : detector_(detector)
    , summarizer_(summarizer)
    , generator_(generator)
    , store_(store)
    , settings_(std::move(settings))
    , started_(std::chrono::steady_clock::now())
{
}

HandlerResponse RequestHandlers::error(int status, const std::string& message)
{
    return { status, nlohmann::json{ { "error", message } } };
}

HandlerResponse RequestHandlers::handle(analysis::RequestKind kind, const std::string& method,
                                        const std::string& body)
{
    PROFILE_SCOPE_FUNCTION();

    if (method == "OPTIONS")
        return { 204, nullptr };
    if (method != "POST")
        return error(405, "Method not allowed");

    try
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded())
            return error(400, "Request body must be valid JSON");

        analysis::AnalysisRequest request;
        std::string validation_error;
        if (!analysis::parseRequest(kind, json, settings_, request, validation_error))
        {
            PLOG_DEBUG << analysis::recordType(kind) << " request rejected: " << validation_error;
            return error(400, validation_error);
        }

        auto outcome = run(request);

        persist(kind, std::move(outcome.input), outcome.output);
        return { 200, std::move(outcome.output) };
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Unhandled error in " << analysis::recordType(kind) << " handler: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Server, "Request handler failed", ex.what());
        return error(500, std::string("Internal server error: ") + ex.what());
    }
}

void RequestHandlers::persist(analysis::RequestKind kind, std::string input, const nlohmann::json& output) const
{
    try
    {
        persistence::ResultRecord record;
        record.type = analysis::recordType(kind);
        record.input = std::move(input);
        record.output = output;
        store_.append(std::move(record));
    }
    catch (const std::exception& ex)
    {
        // The response is already computed; a lost record only shows up in the logs.
        PLOG_ERROR << "Could not queue " << analysis::recordType(kind) << " record: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Result record dropped", ex.what());
    }
}

RequestHandlers::Outcome RequestHandlers::run(const analysis::AnalysisRequest& request) const
{
    return std::visit(
        [this](const auto& req) -> Outcome {
            using T = std::decay_t<decltype(req)>;
            if constexpr (std::is_same_v<T, analysis::DetectionRequest>)
            {
                PLOG_INFO << "Detecting text: " << processing::Diagnostics::Preview(req.text);
                return { req.text, analysis::toJson(detector_.detect(req.text)) };
            }
            else if constexpr (std::is_same_v<T, analysis::SummarizationRequest>)
            {
                PLOG_INFO << "Summarizing with ratio " << req.ratio;
                return { req.text, analysis::toJson(summarizer_.summarize(req.text, req.ratio, req.format)) };
            }
            else
            {
                PLOG_INFO << "Generating from prompt: " << processing::Diagnostics::Preview(req.prompt);
                return { req.prompt, analysis::toJson(generator_.generate(req.prompt, req.tone, req.max_length,
                                                                          req.temperature)) };
            }
        },
        request);
}

nlohmann::json RequestHandlers::health() const
{
    const auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count();
    return nlohmann::json{
        { "status", "ok" },
        { "version", app::kVersionString },
        { "uptimeSeconds", uptime },
        { "pendingWrites", store_.pendingWrites() },
        { "errors", utils::ErrorReporter::Snapshot(kHealthRecentErrors) },
    };
}

} // namespace server
