#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

namespace mwetag {

enum class MweType {
    Fixed,
    Flat,
    Compound,
    Other
};

std::string to_string(MweType type);
MweType parse_mwe_type(const std::string& label);

// Annotation carried by every token inside a recognized expression
struct MweAnnotation {
    int start = 0;     // first token of the span (inclusive)
    int end = 0;       // end of the span (exclusive)
    std::string lemma;
    std::string pos;
    MweType type = MweType::Fixed;
    std::string type_label;  // type as written in the dictionary
    int head = 0;
    int position = 0;  // offset from start
};

struct Token {
    std::string text;
    std::string lemma;  // externally supplied lemma, may be empty
    std::vector<Token> expanded;  // words of a multiword token (MWT)
    std::map<std::string, std::string> attrs;  // Additional custom attributes
    std::optional<MweAnnotation> mwe;

    Token() = default;
    explicit Token(std::string text_, std::string lemma_ = "")
        : text(std::move(text_)), lemma(std::move(lemma_)) {}
};

struct Sentence {
    std::string id;
    std::string text;
    std::vector<Token> tokens;
    std::map<std::string, std::string> attrs;
};

struct Document {
    std::string id;
    std::vector<Sentence> sentences;
};

// One recognized expression, as reported to callers of the annotator
struct RecognizedExpression {
    int start = 0;
    int end = 0;
    std::string text;
    std::string lemma;
    std::string pos;
    std::string type;
    std::vector<std::string> tokens;
};

enum class InputFormat {
    Auto,
    Json,
    Conllu
};

enum class OutputFormat {
    Json,
    Conllu
};

} // namespace mwetag
