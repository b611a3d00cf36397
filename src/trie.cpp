#include "mwetag/trie.h"
#include "mwetag/contractions.h"
#include "mwetag/unicode_utils.h"

#include <iostream>

namespace mwetag {

namespace {

// True if `candidate` should replace `current` at a shared terminal
bool takes_precedence(const MatchRecord& candidate, bool candidate_primary,
                      const MatchRecord& current, bool current_primary) {
    if (candidate_primary != current_primary) {
        return candidate_primary;
    }
    std::size_t candidate_len = unicode::char_count(candidate.original);
    std::size_t current_len = unicode::char_count(current.original);
    if (candidate_len != current_len) {
        return candidate_len > current_len;
    }
    return candidate.original < current.original;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& lemma : path) {
        if (!out.empty()) {
            out += ' ';
        }
        out += lemma;
    }
    return out;
}

} // namespace

const TrieNode* TrieNode::child(const std::string& lemma) const {
    auto it = children.find(lemma);
    if (it == children.end()) {
        return nullptr;
    }
    return it->second.get();
}

Trie::Trie() : root_(std::make_unique<TrieNode>()) {}

bool Trie::insert(const std::vector<std::string>& lemmas, MatchRecord record, bool primary,
                  TrieCollision* collision) {
    if (lemmas.empty()) {
        return true;
    }

    TrieNode* node = root_.get();
    for (const auto& lemma : lemmas) {
        auto& slot = node->children[lemma];
        if (!slot) {
            slot = std::make_unique<TrieNode>();
            ++node_count_;
        }
        node = slot.get();
    }

    record.length = lemmas.size();
    if (!node->record) {
        node->record = std::move(record);
        node->primary = primary;
        ++size_;
        return true;
    }

    // Same surface form reached twice (its expanded and plain paths coincide)
    if (node->record->original == record.original) {
        node->primary = node->primary || primary;
        return true;
    }

    bool replace = takes_precedence(record, primary, *node->record, node->primary);
    if (collision) {
        collision->path = lemmas;
        collision->kept = replace ? record.original : node->record->original;
        collision->dropped = replace ? node->record->original : record.original;
    }
    if (replace) {
        node->record = std::move(record);
        node->primary = primary;
    }
    return false;
}

const MatchRecord* Trie::find(const std::vector<std::string>& lemmas) const {
    const TrieNode* node = root_.get();
    for (const auto& lemma : lemmas) {
        node = node->child(lemma);
        if (!node) {
            return nullptr;
        }
    }
    return node->record ? &*node->record : nullptr;
}

std::vector<std::string> lemma_path(const std::string& surface, const std::string& language,
                                    const LemmaDictionary* overrides, bool expand_contractions) {
    std::vector<std::string> words = split_words(surface);
    if (expand_contractions) {
        words = ContractionExpander::expand_all(words, language);
    }
    std::vector<std::string> lemmas;
    lemmas.reserve(words.size());
    for (const auto& word : words) {
        lemmas.push_back(Lemmatizer::normalize(word, language, overrides));
    }
    return lemmas;
}

Trie build_trie(const ExpressionDictionary& dictionary, const std::string& language,
                const LemmaDictionary* overrides, std::vector<TrieCollision>* collisions,
                bool verbose) {
    Trie trie;

    auto insert_path = [&](const std::vector<std::string>& path, const ExpressionEntry& entry, bool primary) {
        MatchRecord record;
        record.original = entry.surface;
        record.lemma = entry.lemma;
        record.pos = entry.pos;
        record.type = entry.type;
        record.type_label = entry.type_label;

        TrieCollision collision;
        if (!trie.insert(path, std::move(record), primary, &collision)) {
            if (verbose) {
                std::cerr << "[mwetag] Warning: '" << collision.dropped << "' and '" << collision.kept
                          << "' share the lemma path '" << join_path(collision.path)
                          << "', keeping '" << collision.kept << "'\n";
            }
            if (collisions) {
                collisions->push_back(std::move(collision));
            }
        }
    };

    // Primary (contraction-expanded) paths first so that they are never
    // displaced by another entry's plain-surface path.
    for (const auto& [surface, entry] : dictionary) {
        std::vector<std::string> expanded = lemma_path(surface, language, overrides, true);
        insert_path(expanded, entry, true);
    }
    for (const auto& [surface, entry] : dictionary) {
        bool has_contraction = false;
        for (const auto& word : split_words(surface)) {
            if (ContractionExpander::is_contraction(word, language)) {
                has_contraction = true;
                break;
            }
        }
        if (!has_contraction) {
            continue;
        }
        insert_path(lemma_path(surface, language, overrides, false), entry, false);
    }

    return trie;
}

} // namespace mwetag
