#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>
#include <string>

#include "analysis/Heuristics.hpp"
#include "../utils/fake_oracles.hpp"

using analysis::HeuristicsEngine;
using Catch::Matchers::WithinAbs;

TEST_CASE("Burstiness of short or uniform text", "[heuristics][burstiness]") {
    SECTION("Single sentence scores zero") {
        REQUIRE(HeuristicsEngine::burstiness("Hello world") == 0.0);
        REQUIRE(HeuristicsEngine::burstiness("Hello world.") == 0.0);
    }

    SECTION("Empty and punctuation-only input scores zero") {
        REQUIRE(HeuristicsEngine::burstiness("") == 0.0);
        REQUIRE(HeuristicsEngine::burstiness(" . . .  ") == 0.0);
    }

    SECTION("Equal sentence lengths have no variation") {
        REQUIRE(HeuristicsEngine::burstiness("One two three. Four five six. Seven eight nine.") == 0.0);
    }
}

TEST_CASE("Burstiness is the coefficient of variation of sentence lengths", "[heuristics][burstiness]") {
    SECTION("Two sentences of 2 and 4 words") {
        // mean 3, population std 1
        REQUIRE_THAT(HeuristicsEngine::burstiness("One two. One two three four."), WithinAbs(1.0 / 3.0, 1e-9));
    }

    SECTION("Whitespace-only segments are ignored") {
        REQUIRE_THAT(HeuristicsEngine::burstiness("One two.   . One two three four.  "), WithinAbs(1.0 / 3.0, 1e-9));
    }

    SECTION("Large variation is clipped to 1") {
        std::string text;
        for (int i = 0; i < 9; ++i)
            text += "Short. ";
        for (int i = 0; i < 50; ++i)
            text += "word ";
        text += ".";
        REQUIRE(HeuristicsEngine::burstiness(text) == 1.0);
    }
}

TEST_CASE("Perplexity proxy from logits", "[heuristics][perplexity]") {
    SECTION("Equal logits give exp(ln 2)") {
        REQUIRE_THAT(HeuristicsEngine::perplexityFromLogits({0.0, 0.0}), WithinAbs(2.0, 1e-9));
    }

    SECTION("Confident label 0 approaches 1") {
        REQUIRE_THAT(HeuristicsEngine::perplexityFromLogits({5.0, -5.0}), WithinAbs(1.0, 1e-3));
    }

    SECTION("Huge loss is clipped to 100") {
        REQUIRE(HeuristicsEngine::perplexityFromLogits({-10.0, 10.0}) == HeuristicsEngine::kMaxPerplexity);
    }

    SECTION("Degenerate input maps to zero") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        REQUIRE(HeuristicsEngine::perplexityFromLogits({}) == 0.0);
        REQUIRE(HeuristicsEngine::perplexityFromLogits({nan, 0.0}) == 0.0);
        REQUIRE(HeuristicsEngine::perplexityFromLogits({inf, 0.0}) == 0.0);
    }
}

TEST_CASE("Perplexity proxy through the classifier oracle", "[heuristics][perplexity]") {
    test_utils::FakeClassifier classifier({0.0, 0.0});
    HeuristicsEngine engine(classifier);
    const std::string text = "The quick brown fox jumps over the lazy dog. It was not amused.";

    SECTION("Uses the 512-token window") {
        REQUIRE_THAT(engine.perplexityProxy(text), WithinAbs(2.0, 1e-9));
        REQUIRE(classifier.last_max_tokens == 512);
        REQUIRE(classifier.classify_calls == 1);
    }

    SECTION("Repeated calls are identical") {
        const double first = engine.perplexityProxy(text);
        REQUIRE(engine.perplexityProxy(text) == first);
        REQUIRE(HeuristicsEngine::burstiness(text) == HeuristicsEngine::burstiness(text));
    }

    SECTION("Oracle failure yields zero") {
        classifier.throw_on_classify = true;
        REQUIRE(engine.perplexityProxy(text) == 0.0);
    }
}

TEST_CASE("Softmax is stable for large logits", "[heuristics]") {
    const auto probs = HeuristicsEngine::softmax({1000.0, 1000.0});
    REQUIRE(probs.size() == 2);
    REQUIRE_THAT(probs[0], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(probs[1], WithinAbs(0.5, 1e-12));
    REQUIRE(HeuristicsEngine::softmax({}).empty());
}
