#include <catch2/catch.hpp>

#include "mwetag/lemmatizer.h"

#include <string>
#include <utility>
#include <vector>

using mwetag::LemmaDictionary;
using mwetag::Lemmatizer;

namespace {

std::string pt(const std::string& word, const LemmaDictionary* overrides = nullptr) {
    return Lemmatizer::normalize(word, "portuguese", overrides);
}

} // namespace

TEST_CASE("Portuguese plural rules", "[lemmatizer]") {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"cafés", "café"},
        {"manhãs", "manhã"},
        {"limões", "limão"},
        {"pães", "pão"},
        {"mãos", "mão"},
        {"sóis", "sol"},
        {"anzóis", "anzol"},
        {"flores", "flor"},
        {"luzes", "luz"},
        {"meses", "mes"},
        {"jardins", "jardim"},
        {"uns", "um"},
    };
    for (const auto& [word, expected] : cases) {
        INFO(word);
        CHECK(pt(word) == expected);
    }
}

TEST_CASE("-eis depends on the character before the suffix", "[lemmatizer]") {
    CHECK(pt("roeis") == "rol");
    CHECK(pt("papeis") == "papil");
    // "éis" is not "eis": only the final s goes
    CHECK(pt("papéis") == "papéi");
}

TEST_CASE("Short words keep their final s", "[lemmatizer]") {
    CHECK(pt("os") == "os");
    CHECK(pt("as") == "as");
    CHECK(pt("da") == "da");
    CHECK(pt("uma") == "uma");
}

TEST_CASE("Gerunds become infinitives", "[lemmatizer]") {
    CHECK(pt("falando") == "falar");
    CHECK(pt("comendo") == "comer");
    CHECK(pt("partindo") == "parter");
}

TEST_CASE("Words are lowercased before anything else", "[lemmatizer]") {
    CHECK(pt("Cafés") == "café");
    CHECK(pt("MANHÃ") == "manhã");
    CHECK(pt("Tomei") == "tomei");
    CHECK(Lemmatizer::normalize("Cafés", "pt") == "café");
}

TEST_CASE("Empty input comes back unchanged", "[lemmatizer]") {
    CHECK(pt("").empty());
    CHECK(Lemmatizer::normalize("", "english").empty());
}

TEST_CASE("Languages without rules are only lowercased", "[lemmatizer]") {
    CHECK(Lemmatizer::normalize("Dogs", "english") == "dogs");
    CHECK(Lemmatizer::normalize("Flores", "spanish") == "flores");
}

TEST_CASE("Override dictionary takes priority over the rules", "[lemmatizer]") {
    LemmaDictionary overrides = {
        {"papéis", "papel"},
        {"cafés", "café"},
        {"foram", "ser"},
    };
    CHECK(pt("papéis", &overrides) == "papel");
    CHECK(pt("cafés", &overrides) == "café");
    CHECK(pt("foram", &overrides) == "ser");
    CHECK(pt("Foram", &overrides) == "ser");
    CHECK(pt("PAPÉIS", &overrides) == "papel");
    // Not in the overrides: rules apply
    CHECK(pt("flores", &overrides) == "flor");
    // Overrides apply to languages without rules as well
    CHECK(Lemmatizer::normalize("Foram", "english", &overrides) == "ser");
}

TEST_CASE("Normalizing a normalized lemma changes nothing", "[lemmatizer]") {
    for (const char* lemma : {"café", "manhã", "limão", "jardim", "flor", "falar", "de", "a", "em", "um"}) {
        INFO(lemma);
        std::string once = pt(lemma);
        CHECK(pt(once) == once);
    }
}
