#include "mwetag/dictionary.h"
#include "mwetag/unicode_utils.h"

#include <pugixml.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace mwetag {

namespace {

void warn(std::vector<std::string>* warnings, const std::string& message) {
    std::cerr << "[mwetag] Warning: " << message << "\n";
    if (warnings) {
        warnings->push_back(message);
    }
}

bool has_extension(const std::string& path, const std::string& ext) {
    std::string lower = unicode::to_lower(path);
    auto dot = lower.find_last_of('.');
    return dot != std::string::npos && lower.substr(dot + 1) == ext;
}

std::string string_field(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool read_json(const std::string& path, nlohmann::json& root, std::vector<std::string>* warnings) {
    std::ifstream input(path);
    if (!input) {
        warn(warnings, "dictionary file not found: " + path);
        return false;
    }
    try {
        input >> root;
    } catch (const nlohmann::json::exception& ex) {
        warn(warnings, "invalid JSON in " + path + ": " + ex.what());
        return false;
    }
    if (!root.is_object()) {
        warn(warnings, "expected a JSON object at the top of " + path);
        return false;
    }
    return true;
}

bool load_expressions_json(const std::string& path, ExpressionDictionary& out,
                           std::vector<std::string>* warnings) {
    nlohmann::json root;
    if (!read_json(path, root, warnings)) {
        return false;
    }
    for (const auto& [surface, value] : root.items()) {
        if (!value.is_object()) {
            warn(warnings, "skipping entry '" + surface + "' in " + path + ": not an object");
            continue;
        }
        out.insert(make_entry(surface,
                              string_field(value, "lemma", ""),
                              string_field(value, "pos", ""),
                              string_field(value, "type", "")));
    }
    return true;
}

bool load_expressions_xml(const std::string& path, ExpressionDictionary& out,
                          std::vector<std::string>* warnings) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        warn(warnings, "cannot read XML dictionary " + path + ": " + result.description());
        return false;
    }
    for (auto node : doc.child("mwetag").child("expressions").children("item")) {
        std::string surface = node.attribute("key").value();
        if (surface.empty()) {
            continue;
        }
        out.insert(make_entry(surface,
                              node.attribute("lemma").value(),
                              node.attribute("pos").value(),
                              node.attribute("type").value()));
    }
    return true;
}

bool load_lemmas_json(const std::string& path, LemmaDictionary& out,
                      std::vector<std::string>* warnings) {
    nlohmann::json root;
    if (!read_json(path, root, warnings)) {
        return false;
    }
    for (const auto& [form, value] : root.items()) {
        if (!value.is_string()) {
            warn(warnings, "skipping lemma for '" + form + "' in " + path + ": not a string");
            continue;
        }
        out[unicode::to_lower(form)] = unicode::to_lower(value.get<std::string>());
    }
    return true;
}

bool load_lemmas_xml(const std::string& path, LemmaDictionary& out,
                     std::vector<std::string>* warnings) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        warn(warnings, "cannot read XML lemma dictionary " + path + ": " + result.description());
        return false;
    }
    for (auto node : doc.child("mwetag").child("lemmas").children("item")) {
        std::string form = node.attribute("key").value();
        std::string lemma = node.attribute("lemma").value();
        if (form.empty() || lemma.empty()) {
            continue;
        }
        out[unicode::to_lower(form)] = unicode::to_lower(lemma);
    }
    return true;
}

} // namespace

ExpressionEntry make_entry(const std::string& surface, const std::string& lemma,
                           const std::string& pos, const std::string& type) {
    ExpressionEntry entry;
    entry.surface = surface;
    entry.lemma = lemma.empty() ? surface : lemma;
    entry.pos = pos.empty() ? "X" : pos;
    entry.type_label = type.empty() ? "fixed" : type;
    entry.type = parse_mwe_type(entry.type_label);
    return entry;
}

void ExpressionDictionary::insert(ExpressionEntry entry) {
    std::string key = entry.surface;
    entries_[key] = std::move(entry);
}

void ExpressionDictionary::insert(const std::string& surface, const std::string& lemma,
                                  const std::string& pos, const std::string& type) {
    insert(make_entry(surface, lemma, pos, type));
}

bool ExpressionDictionary::erase(const std::string& surface) {
    return entries_.erase(surface) > 0;
}

const ExpressionEntry* ExpressionDictionary::find(const std::string& surface) const {
    auto it = entries_.find(surface);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool load_expression_dictionary(const std::string& path, ExpressionDictionary& out,
                                std::vector<std::string>* warnings) {
    // Load into a scratch dictionary so a failure leaves `out` empty
    ExpressionDictionary loaded;
    bool ok = has_extension(path, "xml")
        ? load_expressions_xml(path, loaded, warnings)
        : load_expressions_json(path, loaded, warnings);
    out = ok ? std::move(loaded) : ExpressionDictionary{};
    return ok;
}

bool load_lemma_dictionary(const std::string& path, LemmaDictionary& out,
                           std::vector<std::string>* warnings) {
    LemmaDictionary loaded;
    bool ok = has_extension(path, "xml")
        ? load_lemmas_xml(path, loaded, warnings)
        : load_lemmas_json(path, loaded, warnings);
    out = ok ? std::move(loaded) : LemmaDictionary{};
    return ok;
}

ExpressionDictionary resolve_expression_source(const ExpressionSource& source,
                                               std::vector<std::string>* warnings) {
    if (const auto* dict = std::get_if<ExpressionDictionary>(&source)) {
        return *dict;
    }
    ExpressionDictionary result;
    if (const auto* path = std::get_if<std::string>(&source)) {
        load_expression_dictionary(*path, result, warnings);
    }
    return result;
}

LemmaDictionary resolve_lemma_source(const LemmaSource& source,
                                     std::vector<std::string>* warnings) {
    LemmaDictionary result;
    if (const auto* dict = std::get_if<LemmaDictionary>(&source)) {
        for (const auto& [form, lemma] : *dict) {
            result[unicode::to_lower(form)] = unicode::to_lower(lemma);
        }
    } else if (const auto* path = std::get_if<std::string>(&source)) {
        load_lemma_dictionary(*path, result, warnings);
    }
    return result;
}

bool save_expression_dictionary(const ExpressionDictionary& dictionary, const std::string& path) {
    nlohmann::json root = nlohmann::json::object();
    for (const auto& [surface, entry] : dictionary) {
        root[surface] = {
            {"lemma", entry.lemma},
            {"pos", entry.pos},
            {"type", entry.type_label}
        };
    }
    std::ofstream output(path);
    if (!output) {
        std::cerr << "[mwetag] Error: cannot write dictionary to " << path << "\n";
        return false;
    }
    output << root.dump(2) << "\n";
    return static_cast<bool>(output);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

DictionaryStatistics compute_statistics(const ExpressionDictionary& dictionary) {
    DictionaryStatistics stats;
    stats.total = dictionary.size();
    for (const auto& [surface, entry] : dictionary) {
        stats.length_distribution[split_words(surface).size()] += 1;
        stats.pos_distribution[entry.pos] += 1;
        stats.type_distribution[entry.type_label] += 1;
    }
    return stats;
}

} // namespace mwetag
