#pragma once

#include "types.h"
#include "dictionary.h"
#include "lemmatizer.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mwetag {

// Stored at the node where an expression's lemma path ends
struct MatchRecord {
    std::string original;  // surface form as written in the dictionary
    std::string lemma;
    std::string pos;
    MweType type = MweType::Fixed;
    std::string type_label;
    std::size_t length = 0;  // tokens on the path
};

struct TrieNode {
    std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
    std::optional<MatchRecord> record;
    bool primary = false;  // record sits on its entry's expanded path

    const TrieNode* child(const std::string& lemma) const;
};

// Two surface forms that normalize to the same lemma path
struct TrieCollision {
    std::vector<std::string> path;
    std::string kept;
    std::string dropped;
};

class Trie {
public:
    Trie();
    Trie(Trie&&) noexcept = default;
    Trie& operator=(Trie&&) noexcept = default;
    Trie(const Trie&) = delete;
    Trie& operator=(const Trie&) = delete;

    // Store `record` at the end of `lemmas`. Returns false if the terminal was
    // already taken by another surface form; `collision` then says which one won.
    bool insert(const std::vector<std::string>& lemmas, MatchRecord record, bool primary,
                TrieCollision* collision = nullptr);

    const TrieNode& root() const { return *root_; }
    const MatchRecord* find(const std::vector<std::string>& lemmas) const;

    std::size_t size() const { return size_; }  // terminal records
    std::size_t node_count() const { return node_count_; }
    bool empty() const { return size_ == 0; }

private:
    std::unique_ptr<TrieNode> root_;
    std::size_t size_ = 0;
    std::size_t node_count_ = 1;
};

// Lemma path of a surface form: split on whitespace, optionally expand
// contractions, normalize every word.
std::vector<std::string> lemma_path(const std::string& surface, const std::string& language,
                                    const LemmaDictionary* overrides, bool expand_contractions);

Trie build_trie(const ExpressionDictionary& dictionary, const std::string& language,
                const LemmaDictionary* overrides = nullptr,
                std::vector<TrieCollision>* collisions = nullptr,
                bool verbose = false);

} // namespace mwetag
