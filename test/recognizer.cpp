#include <catch2/catch.hpp>

#include "mwetag/recognizer.h"
#include "test_utils.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace mwetag;
using mwetag::test::make_tokens;
using mwetag::test::write_temp_file;

namespace {

ExpressionDictionary breakfast_dictionary() {
    ExpressionDictionary dict;
    dict.insert("café da manhã", "café da manhã", "NOUN", "fixed");
    dict.insert("de acordo com", "de acordo com", "ADP", "fixed");
    return dict;
}

} // namespace

TEST_CASE("An empty dictionary disables the recognizer", "[recognizer]") {
    MweRecognizer recognizer("portuguese", ExpressionDictionary{});
    CHECK_FALSE(recognizer.enabled());
    CHECK(recognizer.size() == 0);

    auto tokens = make_tokens({"Tomei", "café", "da", "manhã"});
    auto result = recognizer.recognize(tokens);
    REQUIRE(result.size() == tokens.size());
    for (const auto& token : result) {
        CHECK_FALSE(token.mwe.has_value());
    }
    CHECK(recognizer.match(tokens).empty());

    MweRecognizer no_source("portuguese", std::monostate{});
    CHECK_FALSE(no_source.enabled());
}

TEST_CASE("Recognizer annotates a sentence", "[recognizer]") {
    MweRecognizer recognizer("portuguese", breakfast_dictionary());
    REQUIRE(recognizer.enabled());
    CHECK(recognizer.size() == 2);
    CHECK(recognizer.max_length() == kDefaultMaxLength);

    auto result = recognizer.recognize(make_tokens({"Tomei", "café", "da", "manhã"}));
    REQUIRE(result.size() == 4);
    CHECK_FALSE(result[0].mwe.has_value());
    REQUIRE(result[3].mwe.has_value());
    CHECK(result[3].mwe->start == 1);
    CHECK(result[3].mwe->end == 4);
    CHECK(result[3].mwe->pos == "NOUN");
    CHECK(result[3].mwe->position == 2);

    CHECK(recognizer.recognize({}).empty());
}

TEST_CASE("add and remove rebuild the index", "[recognizer]") {
    MweRecognizer recognizer("portuguese", ExpressionDictionary{});
    auto tokens = make_tokens({"Ele", "saiu", "uma", "a", "uma"});

    CHECK(recognizer.add("uma a uma"));
    CHECK(recognizer.enabled());
    CHECK(recognizer.size() == 1);

    auto spans = recognizer.match(tokens);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].start == 2);
    CHECK(spans[0].record.lemma == "uma a uma");
    CHECK(spans[0].record.pos == "X");
    CHECK(spans[0].record.type == MweType::Fixed);

    CHECK(recognizer.add("uma a uma", "um a um", "ADV", "flat"));
    CHECK(recognizer.size() == 1);
    spans = recognizer.match(tokens);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].record.lemma == "um a um");
    CHECK(spans[0].record.type == MweType::Flat);

    CHECK(recognizer.remove("uma a uma"));
    CHECK_FALSE(recognizer.remove("uma a uma"));
    CHECK_FALSE(recognizer.enabled());
    CHECK(recognizer.match(tokens).empty());
}

TEST_CASE("Snapshots are not affected by later edits", "[recognizer]") {
    MweRecognizer recognizer("portuguese", breakfast_dictionary());
    auto before = recognizer.snapshot();
    recognizer.add("de manhã");

    CHECK(before->dictionary.size() == 2);
    CHECK_FALSE(before->dictionary.contains("de manhã"));
    CHECK(recognizer.snapshot()->dictionary.contains("de manhã"));
}

TEST_CASE("Missing dictionary files only warn", "[recognizer]") {
    MweRecognizer recognizer("portuguese", std::string("/nonexistent/mwetag/expressions.json"),
                             std::string("/nonexistent/mwetag/lemmas.json"));
    CHECK_FALSE(recognizer.enabled());
    CHECK(recognizer.lemma_dictionary_size() == 0);
    CHECK(recognizer.load_warnings().size() == 2);
}

TEST_CASE("Dictionaries load from files", "[recognizer]") {
    std::string expressions = write_temp_file("recognizer_expressions.json", R"({
        "tomar café": {"lemma": "tomar café", "pos": "VERB", "type": "compound"}
    })");
    std::string lemmas = write_temp_file("recognizer_lemmas.json", R"({"Tomamos": "tomar"})");

    MweRecognizer recognizer("pt", expressions, lemmas);
    CHECK(recognizer.enabled());
    CHECK(recognizer.lemma_dictionary_size() == 1);
    CHECK(recognizer.load_warnings().empty());

    auto result = recognizer.recognize(make_tokens({"Nós", "tomamos", "café"}));
    REQUIRE(result[1].mwe.has_value());
    CHECK(result[1].mwe->type == MweType::Compound);
    CHECK(result[2].mwe->end == 3);
}

TEST_CASE("The short language code selects the Portuguese rules", "[recognizer]") {
    MweRecognizer recognizer("pt", breakfast_dictionary());
    auto spans = recognizer.match(make_tokens({"cafés", "da", "manhã"}));
    CHECK(spans.size() == 1);
}

TEST_CASE("Multiword tokens are matched inside and at top level", "[recognizer]") {
    ExpressionDictionary dict;
    dict.insert("can not", "", "AUX", "fixed");
    dict.insert("not go", "", "", "");
    MweRecognizer recognizer("english", dict);

    Sentence sentence;
    sentence.id = "s1";
    Token cannot("cannot");
    cannot.expanded = make_tokens({"can", "not"});
    sentence.tokens = {Token("I"), cannot, Token("go")};

    Sentence result = recognizer.recognize_sentence(sentence);
    CHECK(result.id == "s1");
    REQUIRE(result.tokens.size() == 3);
    const auto& words = result.tokens[1].expanded;
    REQUIRE(words.size() == 2);
    REQUIRE(words[0].mwe.has_value());
    CHECK(words[0].mwe->lemma == "can not");
    CHECK(words[1].mwe->position == 1);
    // "not go" would cross the multiword token boundary
    CHECK_FALSE(result.tokens[1].mwe.has_value());
    CHECK_FALSE(result.tokens[2].mwe.has_value());
}

TEST_CASE("recognize_document annotates every sentence", "[recognizer]") {
    MweRecognizer recognizer("portuguese", breakfast_dictionary());

    Document doc;
    doc.id = "doc";
    Sentence first;
    first.tokens = make_tokens({"Tomei", "café", "da", "manhã"});
    Sentence second;
    second.tokens = make_tokens({"De", "acordo", "com", "ele"});
    second.attrs["source"] = "test";
    doc.sentences = {first, second, Sentence{}};

    Document result = recognizer.recognize_document(doc);
    CHECK(result.id == "doc");
    REQUIRE(result.sentences.size() == 3);
    CHECK(result.sentences[0].tokens[1].mwe.has_value());
    CHECK(result.sentences[1].tokens[0].mwe->lemma == "de acordo com");
    CHECK(result.sentences[1].attrs.at("source") == "test");
    CHECK(result.sentences[2].tokens.empty());

    MweRecognizer disabled("portuguese", ExpressionDictionary{});
    Document passthrough = disabled.recognize_document(doc);
    CHECK_FALSE(passthrough.sentences[0].tokens[1].mwe.has_value());
}

TEST_CASE("Recognizer statistics follow the dictionary", "[recognizer]") {
    MweRecognizer recognizer("portuguese", breakfast_dictionary());
    recognizer.add("de manhã", "", "ADV", "");

    DictionaryStatistics stats = recognizer.statistics();
    CHECK(stats.total == 3);
    CHECK(stats.length_distribution.at(3) == 2);
    CHECK(stats.length_distribution.at(2) == 1);
    CHECK(stats.pos_distribution.at("ADV") == 1);
    CHECK(stats.type_distribution.at("fixed") == 3);
}

TEST_CASE("Readers run while the dictionary changes", "[recognizer][threads]") {
    MweRecognizer recognizer("portuguese", breakfast_dictionary());
    auto tokens = make_tokens({"Tomei", "café", "da", "manhã"});

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto result = recognizer.recognize(tokens);
                if (result.size() != tokens.size() || !result[1].mwe) {
                    ++failures;
                }
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        std::string surface = "expressão " + std::to_string(i);
        recognizer.add(surface);
        if (i % 2 == 0) {
            recognizer.remove(surface);
        }
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }

    CHECK(failures.load() == 0);
    CHECK(recognizer.size() == 2 + 25);
}

TEST_CASE("Collisions of the last build are reported", "[recognizer]") {
    ExpressionDictionary dict;
    dict.insert("café da manhã", "", "NOUN", "");
    dict.insert("cafés da manhã", "", "NOUN", "");
    MweRecognizer recognizer("portuguese", dict);

    auto collisions = recognizer.collisions();
    REQUIRE_FALSE(collisions.empty());
    CHECK(collisions[0].kept == "cafés da manhã");
    CHECK(collisions[0].dropped == "café da manhã");
    CHECK(recognizer.dictionary().size() == 2);

    recognizer.remove("cafés da manhã");
    CHECK(recognizer.collisions().empty());
    CHECK(recognizer.match(make_tokens({"cafés", "da", "manhã"})).size() == 1);
}
