#include <catch2/catch.hpp>

#include "mwetag/io_json.h"
#include "mwetag/recognizer.h"

#include <stdexcept>
#include <string>

using namespace mwetag;

TEST_CASE("Token records", "[io_json]") {
    Token token = token_from_json(nlohmann::json::parse(R"({
        "form": "cafés", "lemma": "café", "upos": "NOUN", "id": 3,
        "mwe_span": [0, 2], "mwe_lemma": "stale"
    })"));
    CHECK(token.text == "cafés");
    CHECK(token.lemma == "café");
    CHECK(token.attrs.at("upos") == "NOUN");
    CHECK(token.attrs.at("id") == "3");
    CHECK(token.attrs.count("mwe_span") == 0);
    CHECK_FALSE(token.mwe.has_value());

    CHECK(token_from_json("manhã").text == "manhã");
    CHECK(token_from_json(nlohmann::json::parse(R"({"text": "x", "lemma": null})")).lemma.empty());
    CHECK_THROWS_AS(token_from_json(42), std::runtime_error);

    Token nested = token_from_json(nlohmann::json::parse(R"({
        "text": "do", "expanded": [{"text": "de"}, "o"]
    })"));
    REQUIRE(nested.expanded.size() == 2);
    CHECK(nested.expanded[1].text == "o");
}

TEST_CASE("Annotated tokens carry the mwe fields", "[io_json]") {
    Token token("manhã");
    MweAnnotation mwe;
    mwe.start = 1;
    mwe.end = 4;
    mwe.lemma = "café da manhã";
    mwe.pos = "NOUN";
    mwe.type = MweType::Fixed;
    mwe.type_label = "fixed";
    mwe.head = 1;
    mwe.position = 2;
    token.mwe = mwe;

    nlohmann::json out = token_to_json(token);
    CHECK(out["text"] == "manhã");
    CHECK_FALSE(out.contains("lemma"));
    CHECK(out["mwe_span"] == nlohmann::json::array({1, 4}));
    CHECK(out["mwe_lemma"] == "café da manhã");
    CHECK(out["mwe_pos"] == "NOUN");
    CHECK(out["mwe_type"] == "fixed");
    CHECK(out["mwe_head"] == 1);
    CHECK(out["mwe_position"] == 2);

    CHECK_FALSE(token_to_json(Token("Tomei")).contains("mwe_span"));
}

namespace {

Document read_document(const std::string& content) {
    return document_from_json(parse_json(content));
}

ExpressionDictionary breakfast() {
    ExpressionDictionary dict;
    dict.insert("café da manhã", "", "NOUN", "");
    return dict;
}

} // namespace

TEST_CASE("Document shapes", "[io_json]") {
    SECTION("object with sentences") {
        Document doc = read_document(R"({
            "id": "d1",
            "sentences": [
                {"id": "s1", "text": "Tomei café", "tokens": ["Tomei", "café"], "source": "web"},
                {"tokens": []}
            ]
        })");
        CHECK(doc.id == "d1");
        REQUIRE(doc.sentences.size() == 2);
        CHECK(doc.sentences[0].id == "s1");
        CHECK(doc.sentences[0].text == "Tomei café");
        CHECK(doc.sentences[0].tokens.size() == 2);
        CHECK(doc.sentences[0].attrs.at("source") == "web");
        CHECK(doc.sentences[1].tokens.empty());
    }
    SECTION("sentence without tokens comes first") {
        Document doc = read_document(R"({"sentences": [
            {"id": "s1", "text": "Olá"},
            {"id": "s2", "tokens": [{"text": "café"}, {"text": "da"}]}
        ]})");
        REQUIRE(doc.sentences.size() == 2);
        CHECK(doc.sentences[0].id == "s1");
        CHECK(doc.sentences[0].tokens.empty());
        CHECK(doc.sentences[1].id == "s2");
        REQUIRE(doc.sentences[1].tokens.size() == 2);
        CHECK(doc.sentences[1].tokens[1].text == "da");
        CHECK_FALSE(document_to_json(doc)["sentences"][0].contains("tokens"));
    }
    SECTION("array of sentences") {
        Document doc = read_document(R"([["a", "b"], {"tokens": ["c"]}])");
        REQUIRE(doc.sentences.size() == 2);
        CHECK(doc.sentences[1].tokens[0].text == "c");

        Document mixed = read_document(R"([{"id": "s1"}, {"tokens": ["c"]}])");
        REQUIRE(mixed.sentences.size() == 2);
        CHECK(mixed.sentences[0].tokens.empty());
    }
    SECTION("flat token array") {
        Document doc = read_document(R"([{"text": "café"}, {"text": "da"}, "manhã"])");
        REQUIRE(doc.sentences.size() == 1);
        CHECK(doc.sentences[0].tokens.size() == 3);
        CHECK(read_document("[]").sentences.empty());
    }
    SECTION("malformed") {
        CHECK_THROWS_AS(parse_json("{not json"), std::runtime_error);
        CHECK_THROWS_AS(read_document(R"({"text": "Olá"})"), std::runtime_error);
        CHECK_THROWS_AS(read_document(R"({"sentences": 3})"), std::runtime_error);
        CHECK_THROWS_AS(read_document(R"({"sentences": [3]})"), std::runtime_error);
        CHECK_THROWS_AS(read_document("42"), std::runtime_error);
    }
}

TEST_CASE("Recognized document written back as JSON", "[io_json]") {
    nlohmann::json source = parse_json(R"({
        "sentences": [
            {"id": "s0", "text": "Bom dia"},
            {"id": "s1", "tokens": [
                {"text": "Tomei"}, {"text": "cafés"}, {"text": "da"}, {"text": "manhã"}
            ]}
        ]
    })");
    MweRecognizer recognizer("portuguese", breakfast());

    Document result = recognizer.recognize_document(document_from_json(source));
    nlohmann::json out = annotate_json_document(source, result);

    CHECK(out["sentences"][0] == source["sentences"][0]);
    const auto& tokens = out["sentences"][1]["tokens"];
    REQUIRE(tokens.size() == 4);
    CHECK_FALSE(tokens[0].contains("mwe_span"));
    CHECK(tokens[1]["mwe_span"] == nlohmann::json::array({1, 4}));
    CHECK(tokens[1]["mwe_lemma"] == "café da manhã");
    CHECK(tokens[3]["mwe_position"] == 2);
    CHECK(out["sentences"][1]["id"] == "s1");
}

TEST_CASE("Token fields keep their key and value type", "[io_json]") {
    nlohmann::json source = parse_json(R"({"id": 1, "tokens": [
        {"id": 1, "form": "Tomei", "feats": {"Number": "Sing"}},
        {"id": [2, 3], "text": "cafés", "expanded": [{"id": 2, "text": "café"}]},
        {"id": 4, "form": "da", "score": 0.5},
        "manhã"
    ]})");

    Document doc = document_from_json(source);
    REQUIRE(doc.sentences.size() == 1);
    REQUIRE(doc.sentences[0].tokens.size() == 4);
    CHECK(doc.sentences[0].tokens[0].text == "Tomei");

    SECTION("annotated tokens only gain mwe fields") {
        MweRecognizer recognizer("portuguese", breakfast());
        nlohmann::json out = annotate_json_document(source, recognizer.recognize_document(doc));

        CHECK(out["id"] == 1);
        const auto& tokens = out["tokens"];
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0] == source["tokens"][0]);

        CHECK(tokens[1]["id"] == nlohmann::json::array({2, 3}));
        CHECK(tokens[1]["expanded"] == source["tokens"][1]["expanded"]);
        CHECK(tokens[1]["mwe_span"] == nlohmann::json::array({1, 4}));

        CHECK(tokens[2]["form"] == "da");
        CHECK_FALSE(tokens[2].contains("text"));
        CHECK(tokens[2]["score"] == 0.5);
        CHECK(tokens[2]["mwe_position"] == 1);

        CHECK(tokens[3]["text"] == "manhã");
        CHECK(tokens[3]["mwe_position"] == 2);
    }
    SECTION("unchanged without a match") {
        MweRecognizer disabled("portuguese", ExpressionDictionary{});
        CHECK(annotate_json_document(source, disabled.recognize_document(doc)) == source);

        ExpressionDictionary other;
        other.insert("de acordo com", "", "", "");
        MweRecognizer unmatched("portuguese", other);
        CHECK(annotate_json_document(source, unmatched.recognize_document(doc)) == source);
    }
    SECTION("misaligned input is rejected") {
        Document shorter = doc;
        shorter.sentences[0].tokens.pop_back();
        CHECK_THROWS_AS(annotate_json_tokens(source["tokens"], shorter.sentences[0].tokens),
                        std::runtime_error);
    }
}

TEST_CASE("Statistics and expression reports", "[io_json]") {
    DictionaryStatistics stats;
    stats.total = 3;
    stats.length_distribution[2] = 1;
    stats.length_distribution[3] = 2;
    stats.pos_distribution["NOUN"] = 3;
    stats.type_distribution["fixed"] = 3;

    nlohmann::json out = statistics_to_json(stats);
    CHECK(out["total_mwes"] == 3);
    CHECK(out["length_distribution"]["3"] == 2);
    CHECK(out["pos_distribution"]["NOUN"] == 3);
    CHECK(out["type_distribution"]["fixed"] == 3);

    RecognizedExpression expr;
    expr.start = 1;
    expr.end = 3;
    expr.text = "de acordo";
    expr.lemma = "de acordo";
    expr.pos = "ADV";
    expr.type = "fixed";
    expr.tokens = {"de", "acordo"};
    nlohmann::json list = expressions_to_json({expr});
    REQUIRE(list.size() == 1);
    CHECK(list[0]["span"] == nlohmann::json::array({1, 3}));
    CHECK(list[0]["tokens"][1] == "acordo");
}
