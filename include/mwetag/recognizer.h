#pragma once

#include "types.h"
#include "dictionary.h"
#include "lemmatizer.h"
#include "trie.h"
#include "matcher.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mwetag {

// Immutable snapshot: the dictionary and the trie built from it
struct RecognizerState {
    ExpressionDictionary dictionary;
    Trie trie;
    std::vector<TrieCollision> collisions;
    bool enabled = false;
};

struct RecognizerOptions {
    std::size_t max_length = kDefaultMaxLength;
    bool verbose = false;
};

class MweRecognizer {
public:
    MweRecognizer(std::string language, const ExpressionSource& expressions,
                  const LemmaSource& lemmas = {}, RecognizerOptions options = {});

    const std::string& language() const { return language_; }
    std::size_t max_length() const { return options_.max_length; }

    bool enabled() const { return snapshot()->enabled; }
    std::size_t size() const { return snapshot()->dictionary.size(); }
    std::size_t lemma_dictionary_size() const { return lemmas_.size(); }
    ExpressionDictionary dictionary() const { return snapshot()->dictionary; }
    // Surface forms that shared a lemma path in the last trie build
    std::vector<TrieCollision> collisions() const { return snapshot()->collisions; }

    // Warnings raised while loading the dictionaries
    const std::vector<std::string>& load_warnings() const { return load_warnings_; }

    // Readers always see a complete state, before or after a concurrent add/remove
    std::shared_ptr<const RecognizerState> snapshot() const;

    std::vector<MatchSpan> match(const std::vector<Token>& tokens) const;
    std::vector<Token> recognize(const std::vector<Token>& tokens) const;
    Sentence recognize_sentence(const Sentence& sentence) const;
    Document recognize_document(const Document& doc) const;

    // Both rebuild the trie before returning
    bool add(const std::string& surface, const std::string& lemma = "",
             const std::string& pos = "X", const std::string& type = "fixed");
    bool remove(const std::string& surface);

    DictionaryStatistics statistics() const;

private:
    std::string language_;
    RecognizerOptions options_;
    LemmaDictionary lemmas_;
    std::vector<std::string> load_warnings_;

    std::shared_ptr<const RecognizerState> state_;
    std::mutex writer_mutex_;

    std::shared_ptr<const RecognizerState> build_state(ExpressionDictionary dictionary) const;
    void publish(std::shared_ptr<const RecognizerState> state);
    std::vector<Token> recognize_with(const RecognizerState& state, const std::vector<Token>& tokens) const;
    Sentence recognize_sentence_with(const RecognizerState& state, const Sentence& sentence) const;
};

} // namespace mwetag
