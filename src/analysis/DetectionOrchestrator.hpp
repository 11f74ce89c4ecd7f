#pragma once

#include "AnalysisSettings.hpp"
#include "AnalysisTypes.hpp"
#include "Heuristics.hpp"

#include <string>

namespace analysis
{

/**
 * @brief Fuses the classifier verdict with the lexical heuristics.
 *
 * detect() never throws: any oracle or protocol failure produces the neutral
 * fallback result with `error` set. Input validation (non-empty, minimum
 * length) is the caller's job. The orchestrator holds no per-call state, so
 * one instance serves all request threads.
 */
class DetectionOrchestrator
{
public:
    explicit DetectionOrchestrator(oracle::IClassifierOracle& classifier, DetectionSettings settings = {});

    DetectionResult detect(const std::string& text) const;

    // {isAI false, confidence 50, perplexity 0, burstiness 0} annotated with `error`.
    static DetectionResult fallback(const std::string& error);

    const DetectionSettings& settings() const { return settings_; }

private:
    oracle::IClassifierOracle& classifier_;
    DetectionSettings settings_;
};

} // namespace analysis
