#pragma once

#include "types.h"
#include "lemmatizer.h"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace mwetag {

struct ExpressionEntry {
    std::string surface;  // whitespace-delimited words, dictionary key
    std::string lemma;
    std::string pos;
    MweType type = MweType::Fixed;
    std::string type_label;
};

// Fill in the defaults used throughout: lemma = surface, pos = "X", type = "fixed"
ExpressionEntry make_entry(const std::string& surface, const std::string& lemma = "",
                           const std::string& pos = "", const std::string& type = "");

class ExpressionDictionary {
public:
    using const_iterator = std::map<std::string, ExpressionEntry>::const_iterator;

    // Insert or replace the entry keyed by entry.surface
    void insert(ExpressionEntry entry);
    void insert(const std::string& surface, const std::string& lemma,
                const std::string& pos, const std::string& type);
    bool erase(const std::string& surface);

    const ExpressionEntry* find(const std::string& surface) const;
    bool contains(const std::string& surface) const { return find(surface) != nullptr; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Iteration is ordered by surface form
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::map<std::string, ExpressionEntry> entries_;
};

// Where a dictionary comes from: nothing, an in-memory mapping, or a file path
using ExpressionSource = std::variant<std::monostate, ExpressionDictionary, std::string>;
using LemmaSource = std::variant<std::monostate, LemmaDictionary, std::string>;

// File loaders. On a missing or malformed file they leave `out` empty,
// print a warning and return false.
bool load_expression_dictionary(const std::string& path, ExpressionDictionary& out,
                                std::vector<std::string>* warnings = nullptr);
bool load_lemma_dictionary(const std::string& path, LemmaDictionary& out,
                           std::vector<std::string>* warnings = nullptr);

ExpressionDictionary resolve_expression_source(const ExpressionSource& source,
                                               std::vector<std::string>* warnings = nullptr);
// Keys and values come back lowercased whatever the source
LemmaDictionary resolve_lemma_source(const LemmaSource& source,
                                     std::vector<std::string>* warnings = nullptr);

bool save_expression_dictionary(const ExpressionDictionary& dictionary, const std::string& path);

struct DictionaryStatistics {
    std::size_t total = 0;
    std::map<std::size_t, std::size_t> length_distribution;  // words in surface form -> count
    std::map<std::string, std::size_t> pos_distribution;
    std::map<std::string, std::size_t> type_distribution;
};

DictionaryStatistics compute_statistics(const ExpressionDictionary& dictionary);

std::vector<std::string> split_words(const std::string& text);

} // namespace mwetag
