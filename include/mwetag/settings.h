#pragma once

#include "types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace mwetag {

struct LanguageConfig {
    std::string language = "portuguese";
    std::string mwe_database;  // path, empty = none
    std::string lemma_dict;    // path, empty = none
    std::size_t max_length = 10;
    bool enabled = true;
};

struct RecognizerSettings {
    std::unordered_map<std::string, std::string> options;
    std::vector<LanguageConfig> languages;
    std::string settings_file;
    std::string input = "-";
    std::string output = "-";
    std::string dump_dictionary;
    InputFormat input_format = InputFormat::Auto;
    OutputFormat output_format = OutputFormat::Json;
    bool stats = false;
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;

    // Configuration for `language`, or null
    const LanguageConfig* find_language(const std::string& language) const;
};

// --key=value and --flag arguments
RecognizerSettings parse_arguments(int argc, char** argv);

// Merge an XML settings file (settings_file of `base`) under the values of `base`.
// Throws std::runtime_error if the file cannot be read.
RecognizerSettings load_settings(const RecognizerSettings& base);

// Turn --language/--mwe_database/--lemma_dict/--max_length into a language entry.
// Replaces the entry of the same language coming from a settings file.
void apply_language_options(RecognizerSettings& settings);

} // namespace mwetag
