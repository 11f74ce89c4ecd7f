#pragma once

#include "../analysis/AnalysisSettings.hpp"
#include "../oracle/HttpOracleBase.hpp"

#include <cstddef>
#include <string>

class ConfigManager;

struct ServerSettings
{
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string cors_origin = "*";
    int thread_count = 8;
};

struct LoggingSettings
{
    int level = 4; // plog::info
    bool append = true;
    bool verbose_pipeline = false;
};

struct PersistenceSettings
{
    bool enabled = true;
    std::string path = "data/results.jsonl";
    std::size_t snippet_chars = 500;
    std::size_t max_pending = 10000;
};

struct ServiceConfig
{
    ServerSettings server;
    LoggingSettings logging;
    oracle::OracleConfig classifier;
    oracle::OracleConfig generator;
    oracle::OracleConfig summarizer; // empty base_url: share the generator backend
    analysis::AnalysisSettings analysis;
    PersistenceSettings persistence;

    ServiceConfig();

    // Summarizer settings with the generator backend substituted when unset.
    oracle::OracleConfig effectiveSummarizer() const;
};

// Binds every section of config.toml to `config`. `config` must outlive `manager`.
bool registerServiceConfig(ConfigManager& manager, ServiceConfig& config);
