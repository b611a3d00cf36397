#include "mwetag/matcher.h"
#include "mwetag/unicode_utils.h"

#include <algorithm>
#include <stdexcept>

namespace mwetag {

std::string token_lemma(const Token& token, const std::string& language,
                        const LemmaDictionary* overrides) {
    if (!token.lemma.empty() && token.lemma != "_") {
        return unicode::to_lower(token.lemma);
    }
    return Lemmatizer::normalize(token.text, language, overrides);
}

std::vector<MatchSpan> match_spans(const std::vector<Token>& tokens, const Trie& trie,
                                   const std::string& language, std::size_t max_length,
                                   const LemmaDictionary* overrides) {
    std::vector<MatchSpan> spans;
    if (tokens.empty() || trie.empty() || max_length == 0) {
        return spans;
    }

    const std::size_t n = tokens.size();
    // Lemmas are resolved lazily; a position can be visited by several walks
    std::vector<std::string> lemmas(n);
    std::vector<bool> resolved(n, false);
    auto lemma_at = [&](std::size_t j) -> const std::string& {
        if (!resolved[j]) {
            lemmas[j] = token_lemma(tokens[j], language, overrides);
            resolved[j] = true;
        }
        return lemmas[j];
    };

    std::size_t i = 0;
    while (i < n) {
        const TrieNode* node = &trie.root();
        const MatchRecord* longest = nullptr;
        std::size_t longest_length = 0;

        const std::size_t limit = std::min(n, i + max_length);
        for (std::size_t j = i; j < limit; ++j) {
            node = node->child(lemma_at(j));
            if (!node) {
                break;
            }
            if (node->record) {
                longest = &*node->record;
                longest_length = j - i + 1;
            }
        }

        if (longest) {
            spans.push_back(MatchSpan{i, i + longest_length, *longest});
            i += longest_length;
        } else {
            ++i;
        }
    }

    return spans;
}

std::vector<Token> annotate_tokens(const std::vector<Token>& tokens, const std::vector<MatchSpan>& spans) {
    std::size_t previous_end = 0;
    for (const auto& span : spans) {
        if (span.start >= span.end || span.end > tokens.size()) {
            throw std::invalid_argument("MWE span [" + std::to_string(span.start) + ", " +
                                        std::to_string(span.end) + ") is empty or out of range");
        }
        if (span.start < previous_end) {
            throw std::invalid_argument("MWE span [" + std::to_string(span.start) + ", " +
                                        std::to_string(span.end) + ") overlaps the previous span");
        }
        previous_end = span.end;
    }

    std::vector<Token> result = tokens;
    for (const auto& span : spans) {
        for (std::size_t idx = span.start; idx < span.end; ++idx) {
            MweAnnotation annotation;
            annotation.start = static_cast<int>(span.start);
            annotation.end = static_cast<int>(span.end);
            annotation.lemma = span.record.lemma;
            annotation.pos = span.record.pos;
            annotation.type = span.record.type;
            annotation.type_label = span.record.type_label;
            annotation.head = static_cast<int>(span.start);
            annotation.position = static_cast<int>(idx - span.start);
            result[idx].mwe = std::move(annotation);
        }
    }
    return result;
}

bool has_annotations(const std::vector<Token>& tokens) {
    for (const auto& token : tokens) {
        if (token.mwe || has_annotations(token.expanded)) {
            return true;
        }
    }
    return false;
}

std::vector<RecognizedExpression> collect_expressions(const std::vector<Token>& tokens) {
    std::vector<RecognizedExpression> expressions;
    for (const auto& token : tokens) {
        if (!token.mwe) {
            continue;
        }
        const MweAnnotation& mwe = *token.mwe;
        if (expressions.empty() || expressions.back().start != mwe.start ||
            expressions.back().end != mwe.end) {
            RecognizedExpression expr;
            expr.start = mwe.start;
            expr.end = mwe.end;
            expr.lemma = mwe.lemma;
            expr.pos = mwe.pos;
            expr.type = mwe.type_label.empty() ? to_string(mwe.type) : mwe.type_label;
            expressions.push_back(std::move(expr));
        }
        RecognizedExpression& current = expressions.back();
        if (!current.text.empty()) {
            current.text += ' ';
        }
        current.text += token.text;
        current.tokens.push_back(token.text);
    }
    return expressions;
}

} // namespace mwetag
