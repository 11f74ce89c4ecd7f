#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <string>

#include "analysis/DetectionOrchestrator.hpp"
#include "../utils/fake_oracles.hpp"

using namespace analysis;
using Catch::Matchers::WithinAbs;

namespace {
const std::string kText =
    "Artificial intelligence systems produce fluent text. Human writers vary their rhythm a lot more than that.";
}

TEST_CASE("Detection fuses classifier confidence with heuristics", "[detection]") {
    test_utils::FakeClassifier classifier({0.0, 2.0});
    DetectionOrchestrator detector(classifier);

    SECTION("AI-leaning logits") {
        const auto result = detector.detect(kText);
        REQUIRE_FALSE(result.error);
        REQUIRE(result.confidence == 88.08);
        REQUIRE(result.is_ai);
        // exp(logsumexp(0, 2) - 0) = 1 + e^2
        REQUIRE(result.perplexity == 8.39);
        REQUIRE(result.burstiness == roundTo2(HeuristicsEngine::burstiness(kText)));
        REQUIRE(classifier.classify_calls == 1);
        REQUIRE(classifier.last_max_tokens == 512);
    }

    SECTION("Human-leaning logits") {
        classifier.setLogits({2.0, 0.0});
        const auto result = detector.detect(kText);
        REQUIRE(result.confidence == 11.92);
        REQUIRE_FALSE(result.is_ai);
    }

    SECTION("Exactly 50 percent is not AI") {
        classifier.setLogits({1.5, 1.5});
        const auto result = detector.detect(kText);
        REQUIRE(result.confidence == 50.0);
        REQUIRE_FALSE(result.is_ai);
    }

    SECTION("Verdict follows the rounded confidence") {
        // p = 0.5000025 rounds to 50.00
        classifier.setLogits({0.0, 0.00001});
        const auto result = detector.detect(kText);
        REQUIRE(result.confidence == 50.0);
        REQUIRE_FALSE(result.is_ai);
    }

    SECTION("Scores stay in range") {
        for (double l : {-30.0, -3.0, 0.0, 3.0, 30.0}) {
            classifier.setLogits({0.0, l});
            const auto result = detector.detect(kText);
            REQUIRE(result.confidence >= 0.0);
            REQUIRE(result.confidence <= 100.0);
            REQUIRE(result.perplexity >= 0.0);
            REQUIRE(result.perplexity <= 100.0);
            REQUIRE(result.burstiness >= 0.0);
            REQUIRE(result.burstiness <= 1.0);
            REQUIRE(result.is_ai == (result.confidence > 50.0));
        }
    }

    SECTION("Repeated calls are identical") {
        const auto a = detector.detect(kText);
        const auto b = detector.detect(kText);
        REQUIRE(a.confidence == b.confidence);
        REQUIRE(a.perplexity == b.perplexity);
        REQUIRE(a.burstiness == b.burstiness);
    }
}

TEST_CASE("Detection settings are honoured", "[detection]") {
    test_utils::FakeClassifier classifier({2.0, 0.0});

    SECTION("Custom threshold") {
        DetectionSettings settings;
        settings.threshold = 10.0;
        DetectionOrchestrator detector(classifier, settings);
        REQUIRE(detector.detect(kText).is_ai);
    }

    SECTION("AI label at index 0") {
        DetectionSettings settings;
        settings.ai_label_index = 0;
        DetectionOrchestrator detector(classifier, settings);
        const auto result = detector.detect(kText);
        REQUIRE(result.confidence == 88.08);
        REQUIRE(result.is_ai);
    }
}

TEST_CASE("Detection falls back on oracle failure", "[detection][fallback]") {
    test_utils::FakeClassifier classifier({0.0, 2.0});
    DetectionOrchestrator detector(classifier);

    auto requireFallback = [](const DetectionResult& r) {
        REQUIRE_FALSE(r.is_ai);
        REQUIRE(r.confidence == 50.0);
        REQUIRE(r.perplexity == 0.0);
        REQUIRE(r.burstiness == 0.0);
        REQUIRE(r.error);
    };

    SECTION("Classifier throws") {
        classifier.throw_on_classify = true;
        const auto result = detector.detect(kText);
        requireFallback(result);
        REQUIRE(*result.error == "classifier backend down");
    }

    SECTION("Classifier throws something that is not a std::exception") {
        classifier.throw_foreign_on_classify = true;
        const auto result = detector.detect(kText);
        requireFallback(result);
        REQUIRE(*result.error == "unknown exception");
    }

    SECTION("Tokenizer throws") {
        classifier.throw_on_encode = true;
        requireFallback(detector.detect(kText));
    }

    SECTION("Wrong number of logits") {
        classifier.setLogits({0.1, 0.2, 0.3});
        const auto result = detector.detect(kText);
        requireFallback(result);
        REQUIRE(result.error->find("expected 2") != std::string::npos);
    }

    SECTION("Fallback serializes with the error field") {
        const auto json = toJson(DetectionOrchestrator::fallback("boom"));
        REQUIRE(json["isAI"] == false);
        REQUIRE(json["confidence"] == 50.0);
        REQUIRE(json["perplexity"] == 0.0);
        REQUIRE(json["burstiness"] == 0.0);
        REQUIRE(json["error"] == "boom");
    }
}
