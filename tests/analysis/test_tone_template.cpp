#include <catch2/catch_test_macros.hpp>

#include "analysis/ToneTemplate.hpp"

using namespace analysis;

TEST_CASE("Tone prefixes", "[tone]") {
    REQUIRE(tonePrefix(Tone::Formal) == "Write in a formal, professional manner: ");
    REQUIRE(tonePrefix(Tone::Casual) == "Write in a casual, conversational style: ");
    REQUIRE(tonePrefix(Tone::Creative) == "Write creatively and imaginatively: ");
    REQUIRE(tonePrefix(Tone::Technical) == "Write in a technical, precise manner: ");
    REQUIRE(tonePrefix(Tone::Neutral).empty());
}

TEST_CASE("Tone parsing", "[tone]") {
    REQUIRE(parseTone("formal") == Tone::Formal);
    REQUIRE(parseTone("Casual") == Tone::Casual);
    REQUIRE(parseTone("CREATIVE") == Tone::Creative);
    REQUIRE(parseTone("technical") == Tone::Technical);
    REQUIRE(parseTone("sarcastic") == Tone::Neutral);
    REQUIRE(parseTone("") == Tone::Neutral);

    for (auto tone : {Tone::Formal, Tone::Casual, Tone::Creative, Tone::Technical})
        REQUIRE(parseTone(toneName(tone)) == tone);
}

TEST_CASE("conditionPrompt", "[tone]") {
    REQUIRE(conditionPrompt("Tell me about oceans", Tone::Creative) ==
            "Write creatively and imaginatively: Tell me about oceans");
    REQUIRE(conditionPrompt("Tell me about oceans", Tone::Neutral) == "Tell me about oceans");
}
