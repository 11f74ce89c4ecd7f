#include "ServiceConfig.hpp"
#include "ConfigManager.hpp"
#include "../processing/Diagnostics.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <vector>

namespace
{

template <typename T>
void readValue(const toml::table& section, const char* key, T& out)
{
    if (auto v = section[key].value<T>())
        out = *v;
}

void readInt(const toml::table& section, const char* key, int& out, int lo, int hi)
{
    if (auto v = section[key].value<std::int64_t>())
    {
        if (*v < lo || *v > hi)
        {
            PLOG_WARNING << "Config key '" << key << "' out of range (" << *v << "), keeping " << out;
            return;
        }
        out = static_cast<int>(*v);
    }
}

void readSize(const toml::table& section, const char* key, std::size_t& out)
{
    if (auto v = section[key].value<std::int64_t>())
    {
        if (*v <= 0)
        {
            PLOG_WARNING << "Config key '" << key << "' must be positive, keeping " << out;
            return;
        }
        out = static_cast<std::size_t>(*v);
    }
}

void readDouble(const toml::table& section, const char* key, double& out, double lo, double hi)
{
    // value<double>() also accepts integer nodes.
    if (auto v = section[key].value<double>())
    {
        if (*v < lo || *v > hi)
        {
            PLOG_WARNING << "Config key '" << key << "' out of range (" << *v << "), keeping " << out;
            return;
        }
        out = *v;
    }
}

const std::vector<std::string> kOracleKeys = { "base_url",   "api_key",    "max_input_tokens", "connect_timeout_ms",
                                               "timeout_ms", "max_retries" };

SectionLoader oracleCallbacks(oracle::OracleConfig& cfg)
{
    return { [&cfg](const toml::table& t) {
        readValue(t, "base_url", cfg.base_url);
        readValue(t, "api_key", cfg.api_key);
        readSize(t, "max_input_tokens", cfg.max_input_tokens);
        readInt(t, "connect_timeout_ms", cfg.connect_timeout_ms, 1, 600000);
        readInt(t, "timeout_ms", cfg.timeout_ms, 1, 3600000);
        readInt(t, "max_retries", cfg.max_retries, 0, 10);
    } };
}

} // namespace

ServiceConfig::ServiceConfig()
{
    classifier.base_url = "http://127.0.0.1:8001";
    generator.base_url = "http://127.0.0.1:8002";
    summarizer.max_input_tokens = analysis.summarization.max_input_tokens;
}

oracle::OracleConfig ServiceConfig::effectiveSummarizer() const
{
    if (!summarizer.base_url.empty())
        return summarizer;
    auto cfg = generator;
    cfg.max_input_tokens = summarizer.max_input_tokens;
    return cfg;
}

bool registerServiceConfig(ConfigManager& manager, ServiceConfig& config)
{
    bool ok = true;

    ok &= manager.registerTable(
        "server",
        { [&config](const toml::table& t) {
            auto& s = config.server;
            readValue(t, "host", s.host);
            readInt(t, "port", s.port, 0, 65535);
            readValue(t, "cors_origin", s.cors_origin);
            readInt(t, "thread_count", s.thread_count, 1, 256);
        } },
        { "host", "port", "cors_origin", "thread_count" });

    ok &= manager.registerTable(
        "logging",
        { [&config](const toml::table& t) {
            auto& l = config.logging;
            readInt(t, "level", l.level, 0, 6);
            readValue(t, "append", l.append);
            readValue(t, "verbose_pipeline", l.verbose_pipeline);
            processing::Diagnostics::SetVerbose(l.verbose_pipeline);
        } },
        { "level", "append", "verbose_pipeline" });

    ok &= manager.registerTable("oracle.classifier", oracleCallbacks(config.classifier), kOracleKeys);
    ok &= manager.registerTable("oracle.generator", oracleCallbacks(config.generator), kOracleKeys);
    ok &= manager.registerTable("oracle.summarizer", oracleCallbacks(config.summarizer), kOracleKeys);

    ok &= manager.registerTable(
        "detection",
        { [&config](const toml::table& t) {
            auto& d = config.analysis.detection;
            readSize(t, "min_chars", d.min_chars);
            readDouble(t, "threshold", d.threshold, 0.0, 100.0);
            if (auto v = t["ai_label_index"].value<std::int64_t>())
            {
                if (*v == 0 || *v == 1)
                    d.ai_label_index = static_cast<std::size_t>(*v);
                else
                    PLOG_WARNING << "ai_label_index must be 0 or 1, keeping " << d.ai_label_index;
            }
            d.max_input_tokens = config.classifier.max_input_tokens;
        } },
        { "min_chars", "threshold", "ai_label_index" });

    ok &= manager.registerTable(
        "generation",
        { [&config](const toml::table& t) {
            auto& g = config.analysis.generation;
            readDouble(t, "words_to_tokens_ratio", g.words_to_tokens_ratio, 0.1, 10.0);
            readInt(t, "top_k", g.sampling.top_k, 0, 100000);
            readDouble(t, "top_p", g.sampling.top_p, 0.0, 1.0);
            readInt(t, "no_repeat_ngram_size", g.sampling.no_repeat_ngram_size, 0, 100);
            readInt(t, "min_length", g.sampling.min_length, 0, 100000);
            if (auto seed = t["seed"].value<std::int64_t>())
                g.sampling.seed = static_cast<std::uint64_t>(*seed);
            readValue(t, "default_tone", g.default_tone);
            readInt(t, "default_max_length", g.default_max_length, 100, 1000);
            readDouble(t, "default_temperature", g.default_temperature, 0.1, 1.0);
            g.max_input_tokens = config.generator.max_input_tokens;
        } },
        { "words_to_tokens_ratio", "top_k", "top_p", "no_repeat_ngram_size", "min_length", "seed", "default_tone",
          "default_max_length", "default_temperature" });

    ok &= manager.registerTable(
        "summarization",
        { [&config](const toml::table& t) {
            auto& s = config.analysis.summarization;
            readDouble(t, "default_ratio", s.default_ratio, 0.1, 0.9);
            readInt(t, "min_summary_words", s.min_summary_words, 1, 10000);
            readInt(t, "min_length", s.min_length, 0, 100000);
            readDouble(t, "temperature", s.temperature, 0.1, 1.0);
            s.max_input_tokens = config.effectiveSummarizer().max_input_tokens;
        } },
        { "default_ratio", "min_summary_words", "min_length", "temperature" });

    ok &= manager.registerTable(
        "persistence",
        { [&config](const toml::table& t) {
            auto& p = config.persistence;
            readValue(t, "enabled", p.enabled);
            readValue(t, "path", p.path);
            readSize(t, "snippet_chars", p.snippet_chars);
            readSize(t, "max_pending", p.max_pending);
        } },
        { "enabled", "path", "snippet_chars", "max_pending" });

    return ok;
}
