#pragma once

#include "types.h"
#include "trie.h"
#include "lemmatizer.h"

#include <string>
#include <vector>

namespace mwetag {

struct MatchSpan {
    std::size_t start = 0;  // inclusive
    std::size_t end = 0;    // exclusive
    MatchRecord record;
};

constexpr std::size_t kDefaultMaxLength = 10;

// Lemma used for matching: the token's own lemma if it has one, otherwise
// the normalizer applied to its text.
std::string token_lemma(const Token& token, const std::string& language,
                        const LemmaDictionary* overrides);

// Greedy left-to-right longest match. Spans never overlap and come out
// ordered by start.
std::vector<MatchSpan> match_spans(const std::vector<Token>& tokens, const Trie& trie,
                                   const std::string& language,
                                   std::size_t max_length = kDefaultMaxLength,
                                   const LemmaDictionary* overrides = nullptr);

// Copy of `tokens` with the annotation of the enclosing span set on every
// covered token. Throws std::invalid_argument if the spans are unordered,
// overlapping or out of range.
std::vector<Token> annotate_tokens(const std::vector<Token>& tokens, const std::vector<MatchSpan>& spans);

// True if any token, or any word of a multiword token, carries an annotation
bool has_annotations(const std::vector<Token>& tokens);

// Group annotated tokens back into one entry per recognized expression
std::vector<RecognizedExpression> collect_expressions(const std::vector<Token>& tokens);

} // namespace mwetag
