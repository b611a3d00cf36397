#pragma once

#include "types.h"
#include "dictionary.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mwetag {

// Token records: {"text": ..., "lemma": ..., "expanded": [...]} ("form" is
// accepted for "text"). A bare string is a token with only text. Other
// fields land in attrs as strings, for the CoNLL-U writer.
Token token_from_json(const nlohmann::json& value);
std::vector<Token> tokens_from_json(const nlohmann::json& value);

// {"sentences": [...]} holds one sentence per element; a sentence object
// without "tokens" is read as an empty sentence. A single sentence object
// ({"tokens": [...]}) is a one-sentence document. A top-level array is a
// single sentence if every element is a token (a string, or an object
// without "tokens"), otherwise a list of sentences. Throws
// std::runtime_error on any other shape.
Document document_from_json(const nlohmann::json& value);

// Throws std::runtime_error on malformed input
nlohmann::json parse_json(const std::string& content);

// Copy of `original` with the mwe_* fields of the matching annotated token
// added. Keys, value types and fields other than mwe_* are left as they
// were; a token array without annotations comes back as is.
nlohmann::json annotate_json_tokens(const nlohmann::json& original, const std::vector<Token>& annotated);
// `annotated` must have been read from `original` with document_from_json
nlohmann::json annotate_json_document(const nlohmann::json& original, const Document& annotated);

// Documents that did not come from JSON (CoNLL-U input)
nlohmann::json token_to_json(const Token& token);
nlohmann::json tokens_to_json(const std::vector<Token>& tokens);
nlohmann::json document_to_json(const Document& doc);

nlohmann::json statistics_to_json(const DictionaryStatistics& stats);
nlohmann::json expressions_to_json(const std::vector<RecognizedExpression>& expressions);

} // namespace mwetag
