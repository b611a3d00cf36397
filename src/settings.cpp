#include "mwetag/settings.h"
#include "mwetag/language.h"

#include <pugixml.hpp>

#include <stdexcept>

namespace mwetag {

std::string RecognizerSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

int RecognizerSettings::get_int(const std::string& key, int fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        throw std::runtime_error("Option --" + key + " expects a number, got '" + it->second + "'");
    }
}

bool RecognizerSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

const LanguageConfig* RecognizerSettings::find_language(const std::string& language) const {
    std::string key = canonical_language(language);
    for (const auto& config : languages) {
        if (canonical_language(config.language) == key) {
            return &config;
        }
    }
    return nullptr;
}

namespace {

InputFormat parse_input_format(const std::string& value) {
    if (value == "json") return InputFormat::Json;
    if (value == "conllu" || value == "conll") return InputFormat::Conllu;
    if (value == "auto" || value.empty()) return InputFormat::Auto;
    throw std::runtime_error("Unknown input format: " + value);
}

OutputFormat parse_output_format(const std::string& value) {
    if (value == "json" || value.empty()) return OutputFormat::Json;
    if (value == "conllu" || value == "conll") return OutputFormat::Conllu;
    throw std::runtime_error("Unknown output format: " + value);
}

bool truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

void push_option(RecognizerSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "input") {
        settings.input = value;
    } else if (key == "output") {
        settings.output = value;
    } else if (key == "input_format") {
        settings.input_format = parse_input_format(value);
    } else if (key == "output_format") {
        settings.output_format = parse_output_format(value);
    } else if (key == "dump_dictionary") {
        settings.dump_dictionary = value;
    } else if (key == "stats") {
        settings.stats = truthy(value);
    } else if (key == "verbose") {
        settings.verbose = truthy(value);
    } else if (key == "debug") {
        // Debug output goes through the verbose channel
        settings.debug = truthy(value);
        settings.verbose = settings.verbose || settings.debug;
    }
}

LanguageConfig parse_language(const pugi::xml_node& node) {
    LanguageConfig config;
    if (node.attribute("lang")) config.language = node.attribute("lang").value();
    config.mwe_database = node.attribute("mwe_database").value();
    config.lemma_dict = node.attribute("lemma_dict").value();
    int max_length = node.attribute("max_length").as_int(static_cast<int>(config.max_length));
    config.max_length = max_length > 0 ? static_cast<std::size_t>(max_length) : 0;
    config.enabled = node.attribute("enabled").as_bool(true);
    return config;
}

} // namespace

RecognizerSettings parse_arguments(int argc, char** argv) {
    RecognizerSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    return settings;
}

RecognizerSettings load_settings(const RecognizerSettings& base) {
    RecognizerSettings combined = base;
    std::string settings_path = base.settings_file.empty() ? "./settings.xml" : base.settings_file;

    pugi::xml_document doc;
    if (!doc.load_file(settings_path.c_str())) {
        throw std::runtime_error("Failed to load settings file: " + settings_path);
    }

    pugi::xml_node root = doc.child("mwetag");
    if (!root) {
        throw std::runtime_error("Settings file has no <mwetag> root: " + settings_path);
    }

    // Root attributes are defaults; command-line options win
    for (const auto& attr : root.attributes()) {
        if (!combined.get(attr.name()).empty()) {
            continue;
        }
        push_option(combined, attr.name(), attr.value());
    }

    for (auto node : root.child("languages").children("item")) {
        LanguageConfig config = parse_language(node);
        if (combined.find_language(config.language)) {
            continue;
        }
        combined.languages.push_back(std::move(config));
    }

    return combined;
}

void apply_language_options(RecognizerSettings& settings) {
    const std::string mwe_database = settings.get("mwe_database");
    if (mwe_database.empty()) {
        return;
    }

    LanguageConfig config;
    config.language = settings.get("language", "portuguese");
    config.mwe_database = mwe_database;
    config.lemma_dict = settings.get("lemma_dict");
    int max_length = settings.get_int("max_length", static_cast<int>(config.max_length));
    config.max_length = max_length > 0 ? static_cast<std::size_t>(max_length) : 0;
    config.enabled = settings.get_bool("mwe_enabled", true);

    std::string key = canonical_language(config.language);
    for (auto& existing : settings.languages) {
        if (canonical_language(existing.language) == key) {
            existing = std::move(config);
            return;
        }
    }
    settings.languages.push_back(std::move(config));
}

} // namespace mwetag
