#include "mwetag/io_json.h"
#include "mwetag/matcher.h"
#include "mwetag/unicode_utils.h"

#include <stdexcept>

namespace mwetag {

namespace {
using mwetag::unicode::sanitize_utf8;

std::string scalar_to_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

bool is_annotation_key(const std::string& key) {
    return key.rfind("mwe_", 0) == 0;
}

bool is_token_value(const nlohmann::json& value) {
    return value.is_string() || (value.is_object() && !value.contains("tokens"));
}

// A bare array counts as one sentence only if nothing in it looks like a sentence
bool is_token_array(const nlohmann::json& value) {
    if (!value.is_array() || value.empty()) {
        return false;
    }
    for (const auto& item : value) {
        if (!is_token_value(item)) {
            return false;
        }
    }
    return true;
}

Sentence sentence_from_json(const nlohmann::json& value) {
    Sentence sentence;
    if (value.is_array()) {
        sentence.tokens = tokens_from_json(value);
        return sentence;
    }
    if (!value.is_object()) {
        throw std::runtime_error("Sentence must be an object or an array of tokens");
    }
    for (const auto& [key, field] : value.items()) {
        if (key == "tokens") {
            sentence.tokens = tokens_from_json(field);
        } else if (key == "id" || key == "sent_id") {
            sentence.id = scalar_to_string(field);
        } else if (key == "text") {
            sentence.text = scalar_to_string(field);
        } else {
            sentence.attrs[key] = scalar_to_string(field);
        }
    }
    return sentence;
}

void set_annotation_fields(nlohmann::json& out, const MweAnnotation& mwe) {
    out["mwe_span"] = nlohmann::json::array({mwe.start, mwe.end});
    out["mwe_lemma"] = sanitize_utf8(mwe.lemma);
    out["mwe_pos"] = sanitize_utf8(mwe.pos);
    out["mwe_type"] = mwe.type_label.empty() ? to_string(mwe.type) : sanitize_utf8(mwe.type_label);
    out["mwe_head"] = mwe.head;
    out["mwe_position"] = mwe.position;
}

nlohmann::json annotate_json_token(const nlohmann::json& original, const Token& token) {
    if (original.is_string()) {
        if (!token.mwe) {
            return original;
        }
        nlohmann::json out = {{"text", original}};
        set_annotation_fields(out, *token.mwe);
        return out;
    }
    nlohmann::json out = original;
    if (token.mwe) {
        set_annotation_fields(out, *token.mwe);
    }
    auto it = out.find("expanded");
    if (it != out.end() && it->is_array()) {
        *it = annotate_json_tokens(*it, token.expanded);
    }
    return out;
}

nlohmann::json annotate_json_sentence(const nlohmann::json& original, const Sentence& sentence) {
    if (original.is_array()) {
        return annotate_json_tokens(original, sentence.tokens);
    }
    auto it = original.find("tokens");
    if (it == original.end()) {
        return original;
    }
    nlohmann::json out = original;
    out["tokens"] = annotate_json_tokens(*it, sentence.tokens);
    return out;
}

nlohmann::json annotate_json_sentences(const nlohmann::json& original, const std::vector<Sentence>& sentences) {
    if (!original.is_array() || original.size() != sentences.size()) {
        throw std::runtime_error("Annotated sentences do not line up with the JSON input");
    }
    nlohmann::json out = nlohmann::json::array();
    for (std::size_t i = 0; i < sentences.size(); ++i) {
        out.push_back(annotate_json_sentence(original[i], sentences[i]));
    }
    return out;
}

nlohmann::json sentence_to_json(const Sentence& sentence) {
    nlohmann::json out = nlohmann::json::object();
    if (!sentence.id.empty()) out["id"] = sanitize_utf8(sentence.id);
    if (!sentence.text.empty()) out["text"] = sanitize_utf8(sentence.text);
    for (const auto& [key, value] : sentence.attrs) {
        out[key] = sanitize_utf8(value);
    }
    if (!sentence.tokens.empty()) {
        out["tokens"] = tokens_to_json(sentence.tokens);
    }
    return out;
}

} // namespace

Token token_from_json(const nlohmann::json& value) {
    Token token;
    if (value.is_string()) {
        token.text = value.get<std::string>();
        return token;
    }
    if (!value.is_object()) {
        throw std::runtime_error("Token must be an object or a string");
    }
    for (const auto& [key, field] : value.items()) {
        if (key == "text") {
            token.text = scalar_to_string(field);
        } else if (key == "form") {
            if (!value.contains("text")) {
                token.text = scalar_to_string(field);
            }
        } else if (key == "lemma") {
            token.lemma = field.is_null() ? std::string() : scalar_to_string(field);
        } else if (key == "expanded") {
            if (!field.is_null()) {
                token.expanded = tokens_from_json(field);
            }
        } else if (is_annotation_key(key)) {
            // Stale annotations are recomputed
            continue;
        } else {
            token.attrs[key] = scalar_to_string(field);
        }
    }
    return token;
}

std::vector<Token> tokens_from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::runtime_error("Token list must be a JSON array");
    }
    std::vector<Token> tokens;
    tokens.reserve(value.size());
    for (const auto& item : value) {
        tokens.push_back(token_from_json(item));
    }
    return tokens;
}

Document document_from_json(const nlohmann::json& value) {
    Document doc;
    if (value.is_object()) {
        auto it = value.find("sentences");
        if (it == value.end()) {
            if (!value.contains("tokens")) {
                throw std::runtime_error("JSON document has neither 'sentences' nor 'tokens'");
            }
            doc.sentences.push_back(sentence_from_json(value));
            return doc;
        }
        if (!it->is_array()) {
            throw std::runtime_error("'sentences' must be a JSON array");
        }
        if (auto id_it = value.find("id"); id_it != value.end()) {
            doc.id = scalar_to_string(*id_it);
        }
        for (const auto& item : *it) {
            doc.sentences.push_back(sentence_from_json(item));
        }
        return doc;
    }
    if (!value.is_array()) {
        throw std::runtime_error("JSON document must be an object or an array");
    }

    // A flat array of tokens is a one-sentence document
    if (is_token_array(value)) {
        doc.sentences.push_back(sentence_from_json(value));
        return doc;
    }
    for (const auto& item : value) {
        doc.sentences.push_back(sentence_from_json(item));
    }
    return doc;
}

nlohmann::json parse_json(const std::string& content) {
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Invalid JSON document: ") + ex.what());
    }
}

nlohmann::json annotate_json_tokens(const nlohmann::json& original, const std::vector<Token>& annotated) {
    if (!original.is_array() || original.size() != annotated.size()) {
        throw std::runtime_error("Annotated tokens do not line up with the JSON input");
    }
    if (!has_annotations(annotated)) {
        return original;
    }
    nlohmann::json out = nlohmann::json::array();
    for (std::size_t i = 0; i < annotated.size(); ++i) {
        out.push_back(annotate_json_token(original[i], annotated[i]));
    }
    return out;
}

nlohmann::json annotate_json_document(const nlohmann::json& original, const Document& annotated) {
    if (original.is_object() && !original.contains("sentences")) {
        if (annotated.sentences.size() != 1) {
            throw std::runtime_error("Annotated sentences do not line up with the JSON input");
        }
        return annotate_json_sentence(original, annotated.sentences.front());
    }
    if (original.is_object()) {
        nlohmann::json out = original;
        out["sentences"] = annotate_json_sentences(original.at("sentences"), annotated.sentences);
        return out;
    }
    if (is_token_array(original)) {
        if (annotated.sentences.size() != 1) {
            throw std::runtime_error("Annotated sentences do not line up with the JSON input");
        }
        return annotate_json_tokens(original, annotated.sentences.front().tokens);
    }
    return annotate_json_sentences(original, annotated.sentences);
}

nlohmann::json token_to_json(const Token& token) {
    nlohmann::json out = nlohmann::json::object();
    out["text"] = sanitize_utf8(token.text);
    if (!token.lemma.empty()) {
        out["lemma"] = sanitize_utf8(token.lemma);
    }
    for (const auto& [key, value] : token.attrs) {
        out[key] = sanitize_utf8(value);
    }
    if (!token.expanded.empty()) {
        out["expanded"] = tokens_to_json(token.expanded);
    }
    if (token.mwe) {
        set_annotation_fields(out, *token.mwe);
    }
    return out;
}

nlohmann::json tokens_to_json(const std::vector<Token>& tokens) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& token : tokens) {
        out.push_back(token_to_json(token));
    }
    return out;
}

nlohmann::json document_to_json(const Document& doc) {
    nlohmann::json out = nlohmann::json::object();
    if (!doc.id.empty()) {
        out["id"] = sanitize_utf8(doc.id);
    }
    nlohmann::json sentences = nlohmann::json::array();
    for (const auto& sentence : doc.sentences) {
        sentences.push_back(sentence_to_json(sentence));
    }
    out["sentences"] = std::move(sentences);
    return out;
}

nlohmann::json statistics_to_json(const DictionaryStatistics& stats) {
    nlohmann::json lengths = nlohmann::json::object();
    for (const auto& [length, count] : stats.length_distribution) {
        lengths[std::to_string(length)] = count;
    }
    return {
        {"total_mwes", stats.total},
        {"length_distribution", lengths},
        {"pos_distribution", stats.pos_distribution},
        {"type_distribution", stats.type_distribution}
    };
}

nlohmann::json expressions_to_json(const std::vector<RecognizedExpression>& expressions) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& expr : expressions) {
        out.push_back({
            {"span", nlohmann::json::array({expr.start, expr.end})},
            {"text", sanitize_utf8(expr.text)},
            {"lemma", sanitize_utf8(expr.lemma)},
            {"pos", sanitize_utf8(expr.pos)},
            {"type", sanitize_utf8(expr.type)},
            {"tokens", expr.tokens}
        });
    }
    return out;
}

} // namespace mwetag
