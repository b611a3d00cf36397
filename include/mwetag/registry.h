#pragma once

#include "recognizer.h"
#include "settings.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mwetag {

// One recognizer per language, built once and handed to whatever serves requests
class RecognizerRegistry {
public:
    RecognizerRegistry() = default;

    // Replaces any recognizer already registered for the same language
    void add(std::shared_ptr<MweRecognizer> recognizer);

    // Accepts aliases ("pt"); null if the language is not registered
    std::shared_ptr<MweRecognizer> get(const std::string& language) const;
    bool contains(const std::string& language) const { return get(language) != nullptr; }

    std::vector<std::string> languages() const;
    std::size_t size() const { return recognizers_.size(); }

private:
    std::map<std::string, std::shared_ptr<MweRecognizer>> recognizers_;
};

RecognizerRegistry build_registry(const RecognizerSettings& settings);

} // namespace mwetag
