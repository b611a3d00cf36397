#include "mwetag/registry.h"
#include "mwetag/language.h"

#include <iostream>

namespace mwetag {

void RecognizerRegistry::add(std::shared_ptr<MweRecognizer> recognizer) {
    if (!recognizer) {
        return;
    }
    std::string key = canonical_language(recognizer->language());
    recognizers_[key] = std::move(recognizer);
}

std::shared_ptr<MweRecognizer> RecognizerRegistry::get(const std::string& language) const {
    auto it = recognizers_.find(canonical_language(language));
    if (it == recognizers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> RecognizerRegistry::languages() const {
    std::vector<std::string> result;
    result.reserve(recognizers_.size());
    for (const auto& [language, recognizer] : recognizers_) {
        result.push_back(language);
    }
    return result;
}

RecognizerRegistry build_registry(const RecognizerSettings& settings) {
    RecognizerRegistry registry;
    for (const auto& config : settings.languages) {
        if (!config.enabled) {
            if (settings.verbose) {
                std::cerr << "[mwetag] MWE recognition disabled for " << config.language << "\n";
            }
            continue;
        }
        ExpressionSource expressions;
        if (!config.mwe_database.empty()) {
            expressions = config.mwe_database;
        }
        LemmaSource lemmas;
        if (!config.lemma_dict.empty()) {
            lemmas = config.lemma_dict;
        }
        RecognizerOptions options;
        options.max_length = config.max_length;
        options.verbose = settings.verbose;
        registry.add(std::make_shared<MweRecognizer>(config.language, expressions, lemmas, options));
    }
    return registry;
}

} // namespace mwetag
