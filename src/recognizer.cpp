#include "mwetag/recognizer.h"

#include <atomic>
#include <iostream>

namespace mwetag {

MweRecognizer::MweRecognizer(std::string language, const ExpressionSource& expressions,
                             const LemmaSource& lemmas, RecognizerOptions options)
    : language_(std::move(language)), options_(options) {
    ExpressionDictionary dictionary = resolve_expression_source(expressions, &load_warnings_);
    lemmas_ = resolve_lemma_source(lemmas, &load_warnings_);
    state_ = build_state(std::move(dictionary));

    if (options_.verbose && state_->enabled) {
        std::cerr << "[mwetag] Loaded MWE recognizer for " << language_ << ": "
                  << state_->dictionary.size() << " expressions";
        if (!lemmas_.empty()) {
            std::cerr << " with " << lemmas_.size() << " lemma mappings";
        }
        std::cerr << "\n";
    }
}

std::shared_ptr<const RecognizerState> MweRecognizer::snapshot() const {
    return std::atomic_load(&state_);
}

void MweRecognizer::publish(std::shared_ptr<const RecognizerState> state) {
    std::atomic_store(&state_, std::move(state));
}

std::shared_ptr<const RecognizerState> MweRecognizer::build_state(ExpressionDictionary dictionary) const {
    auto state = std::make_shared<RecognizerState>();
    state->trie = build_trie(dictionary, language_, &lemmas_, &state->collisions, options_.verbose);
    state->enabled = !dictionary.empty();
    state->dictionary = std::move(dictionary);
    return state;
}

std::vector<MatchSpan> MweRecognizer::match(const std::vector<Token>& tokens) const {
    auto state = snapshot();
    if (!state->enabled) {
        return {};
    }
    return match_spans(tokens, state->trie, language_, options_.max_length, &lemmas_);
}

std::vector<Token> MweRecognizer::recognize_with(const RecognizerState& state,
                                                 const std::vector<Token>& tokens) const {
    if (!state.enabled || tokens.empty()) {
        return tokens;
    }
    std::vector<MatchSpan> spans = match_spans(tokens, state.trie, language_, options_.max_length, &lemmas_);
    if (spans.empty()) {
        return tokens;
    }
    return annotate_tokens(tokens, spans);
}

std::vector<Token> MweRecognizer::recognize(const std::vector<Token>& tokens) const {
    auto state = snapshot();
    return recognize_with(*state, tokens);
}

Sentence MweRecognizer::recognize_sentence_with(const RecognizerState& state, const Sentence& sentence) const {
    Sentence result = sentence;
    // Words of a multiword token are matched on their own, never across its boundary
    for (auto& token : result.tokens) {
        if (!token.expanded.empty()) {
            token.expanded = recognize_with(state, token.expanded);
        }
    }
    result.tokens = recognize_with(state, result.tokens);
    return result;
}

Sentence MweRecognizer::recognize_sentence(const Sentence& sentence) const {
    auto state = snapshot();
    return recognize_sentence_with(*state, sentence);
}

Document MweRecognizer::recognize_document(const Document& doc) const {
    auto state = snapshot();
    if (!state->enabled) {
        return doc;
    }
    Document result;
    result.id = doc.id;
    result.sentences.reserve(doc.sentences.size());
    for (const auto& sentence : doc.sentences) {
        result.sentences.push_back(recognize_sentence_with(*state, sentence));
    }
    return result;
}

bool MweRecognizer::add(const std::string& surface, const std::string& lemma,
                        const std::string& pos, const std::string& type) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    ExpressionDictionary dictionary = snapshot()->dictionary;
    dictionary.insert(make_entry(surface, lemma, pos, type));
    publish(build_state(std::move(dictionary)));
    return true;
}

bool MweRecognizer::remove(const std::string& surface) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto current = snapshot();
    if (!current->dictionary.contains(surface)) {
        return false;
    }
    ExpressionDictionary dictionary = current->dictionary;
    dictionary.erase(surface);
    publish(build_state(std::move(dictionary)));
    return true;
}

DictionaryStatistics MweRecognizer::statistics() const {
    return compute_statistics(snapshot()->dictionary);
}

} // namespace mwetag
