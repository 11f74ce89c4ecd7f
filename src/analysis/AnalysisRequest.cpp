#include "AnalysisRequest.hpp"

#include "ToneTemplate.hpp"
#include "../processing/TextUtils.hpp"

#include <cmath>
#include <sstream>

namespace analysis
{

namespace
{

bool readString(const nlohmann::json& body, const char* key, std::string& out, std::string& error)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
    {
        out.clear();
        return true;
    }
    if (!it->is_string())
    {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = processing::trim(it->get<std::string>());
    return true;
}

bool readNumber(const nlohmann::json& body, const char* key, double fallback, double& out, std::string& error)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
    {
        out = fallback;
        return true;
    }
    if (it->is_number())
    {
        out = it->get<double>();
    }
    else if (it->is_string())
    {
        // Form-style clients send numbers as strings.
        std::istringstream ss(it->get<std::string>());
        if (!(ss >> out) || !(ss >> std::ws).eof())
        {
            error = std::string("'") + key + "' must be a number";
            return false;
        }
    }
    else
    {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    if (!std::isfinite(out))
    {
        error = std::string("'") + key + "' must be a finite number";
        return false;
    }
    return true;
}

std::string formatRange(double lo, double hi)
{
    std::ostringstream ss;
    ss << lo << " and " << hi;
    return ss.str();
}

} // namespace

bool DetectionRequest::parse(const nlohmann::json& body, const DetectionSettings& settings, DetectionRequest& out,
                             std::string& error)
{
    if (!body.is_object())
    {
        error = "Request body must be a JSON object";
        return false;
    }
    if (!readString(body, "text", out.text, error))
        return false;
    if (out.text.empty())
    {
        error = "No text provided";
        return false;
    }
    if (processing::codepointCount(out.text) < settings.min_chars)
    {
        error = "Text must be at least " + std::to_string(settings.min_chars) + " characters";
        return false;
    }
    return true;
}

bool SummarizationRequest::parse(const nlohmann::json& body, const SummarizationSettings& settings,
                                 SummarizationRequest& out, std::string& error)
{
    if (!body.is_object())
    {
        error = "Request body must be a JSON object";
        return false;
    }
    if (!readString(body, "text", out.text, error))
        return false;
    if (out.text.empty())
    {
        error = "No text provided";
        return false;
    }

    if (!readNumber(body, "ratio", settings.default_ratio, out.ratio, error))
        return false;
    if (out.ratio < kMinRatio || out.ratio > kMaxRatio)
    {
        error = "ratio must be between " + formatRange(kMinRatio, kMaxRatio);
        return false;
    }

    std::string format;
    if (!readString(body, "format", format, error))
        return false;
    if (format.empty() || format == "paragraph")
    {
        out.format = SummaryFormat::Paragraph;
    }
    else if (format == "bullets")
    {
        out.format = SummaryFormat::Bullets;
    }
    else
    {
        error = "format must be 'paragraph' or 'bullets'";
        return false;
    }
    return true;
}

bool GenerationRequest::parse(const nlohmann::json& body, const GenerationSettings& settings, GenerationRequest& out,
                              std::string& error)
{
    if (!body.is_object())
    {
        error = "Request body must be a JSON object";
        return false;
    }
    if (!readString(body, "prompt", out.prompt, error))
        return false;
    if (out.prompt.empty())
    {
        error = "No prompt provided";
        return false;
    }

    std::string tone;
    if (!readString(body, "tone", tone, error))
        return false;
    out.tone = parseTone(tone.empty() ? settings.default_tone : tone);

    double max_length = 0.0;
    if (!readNumber(body, "maxLength", settings.default_max_length, max_length, error))
        return false;
    if (max_length < kMinMaxLength || max_length > kMaxMaxLength)
    {
        error = "maxLength must be between " + formatRange(kMinMaxLength, kMaxMaxLength);
        return false;
    }
    out.max_length = static_cast<int>(max_length);

    if (!readNumber(body, "temperature", settings.default_temperature, out.temperature, error))
        return false;
    if (out.temperature < kMinTemperature || out.temperature > kMaxTemperature)
    {
        error = "temperature must be between " + formatRange(kMinTemperature, kMaxTemperature);
        return false;
    }
    return true;
}

RequestKind kindOf(const AnalysisRequest& request)
{
    switch (request.index())
    {
    case 0:
        return RequestKind::Detection;
    case 1:
        return RequestKind::Summarization;
    default:
        return RequestKind::Generation;
    }
}

bool parseRequest(RequestKind kind, const nlohmann::json& body, const AnalysisSettings& settings,
                  AnalysisRequest& out, std::string& error)
{
    switch (kind)
    {
    case RequestKind::Detection:
    {
        DetectionRequest req;
        if (!DetectionRequest::parse(body, settings.detection, req, error))
            return false;
        out = std::move(req);
        return true;
    }
    case RequestKind::Summarization:
    {
        SummarizationRequest req;
        if (!SummarizationRequest::parse(body, settings.summarization, req, error))
            return false;
        out = std::move(req);
        return true;
    }
    case RequestKind::Generation:
    {
        GenerationRequest req;
        if (!GenerationRequest::parse(body, settings.generation, req, error))
            return false;
        out = std::move(req);
        return true;
    }
    }
    error = "Unknown request kind";
    return false;
}

} // namespace analysis
