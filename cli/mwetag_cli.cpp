#include "mwetag/settings.h"
#include "mwetag/registry.h"
#include "mwetag/io_json.h"
#include "mwetag/io_conllu.h"
#include "mwetag/matcher.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

using namespace mwetag;

namespace {

void print_usage() {
    std::cerr << "Usage: mwetag --mwe_database=<file> [options]" << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --lemma_dict=<file>       Wordform to lemma overrides (JSON or XML)" << std::endl;
    std::cerr << "  --language=<lang>         Language of the input (default: portuguese)" << std::endl;
    std::cerr << "  --max_length=<n>          Longest expression in tokens (default: 10)" << std::endl;
    std::cerr << "  --input=<file>            Input file, - for stdin (default: -)" << std::endl;
    std::cerr << "  --output=<file>           Output file, - for stdout (default: -)" << std::endl;
    std::cerr << "  --input_format=<format>   json, conllu or auto (default: auto)" << std::endl;
    std::cerr << "  --output_format=<format>  json or conllu (default: json)" << std::endl;
    std::cerr << "  --settings=<file>         XML settings file" << std::endl;
    std::cerr << "  --stats                   Print dictionary statistics and exit" << std::endl;
    std::cerr << "  --dump_dictionary=<file>  Write the loaded dictionary as JSON and exit" << std::endl;
    std::cerr << "  --verbose                 Report loading and matching progress" << std::endl;
    std::cerr << "  --debug                   Also list the expressions found in each sentence" << std::endl;
}

std::string read_input(const std::string& input) {
    if (input == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream file(input);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + input);
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

InputFormat detect_format(const RecognizerSettings& settings, const std::string& content) {
    if (settings.input_format != InputFormat::Auto) {
        return settings.input_format;
    }
    const std::string& input = settings.input;
    if (input.find(".conllu") != std::string::npos || input.find(".conll") != std::string::npos) {
        return InputFormat::Conllu;
    }
    if (input.find(".json") != std::string::npos) {
        return InputFormat::Json;
    }
    std::size_t first = content.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && (content[first] == '{' || content[first] == '[')) {
        return InputFormat::Json;
    }
    return InputFormat::Conllu;
}

void write_text(const RecognizerSettings& settings, const std::string& text) {
    if (settings.output == "-" || settings.output.empty()) {
        std::cout << text;
        return;
    }
    std::ofstream file(settings.output);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + settings.output);
    }
    file << text;
}

// `source` is the parsed input when it was JSON; its fields are written back as they came
void write_output(const RecognizerSettings& settings, const Document& doc, const nlohmann::json* source) {
    if (settings.output_format == OutputFormat::Conllu) {
        if (settings.output == "-" || settings.output.empty()) {
            CoNLLUWriter::write(doc.sentences, std::cout);
        } else if (!CoNLLUWriter::write_file(doc.sentences, settings.output)) {
            throw std::runtime_error("Cannot write output file: " + settings.output);
        }
        return;
    }
    nlohmann::json out = source ? annotate_json_document(*source, doc) : document_to_json(doc);
    write_text(settings, out.dump(2) + "\n");
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        if (cli_settings.get_bool("help", false)) {
            print_usage();
            return 0;
        }

        RecognizerSettings settings;
        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }
        apply_language_options(settings);

        if (settings.languages.empty()) {
            std::cerr << "No MWE database specified (--mwe_database=... or --settings=...)" << std::endl;
            print_usage();
            return 1;
        }

        RecognizerRegistry registry = build_registry(settings);
        const std::string language = settings.get("language", settings.languages.front().language);
        auto recognizer = registry.get(language);
        if (!recognizer) {
            std::cerr << "No recognizer configured for language: " << language << std::endl;
            return 1;
        }
        if (!recognizer->enabled()) {
            std::cerr << "Warning: MWE dictionary for " << language
                      << " is empty, tokens are passed through unchanged" << std::endl;
        }

        if (settings.stats) {
            std::cout << statistics_to_json(recognizer->statistics()).dump(2) << std::endl;
            return 0;
        }

        if (!settings.dump_dictionary.empty()) {
            if (!save_expression_dictionary(recognizer->snapshot()->dictionary, settings.dump_dictionary)) {
                return 1;
            }
            return 0;
        }

        std::string content = read_input(settings.input);
        Document doc;
        nlohmann::json source;
        const bool json_input = detect_format(settings, content) == InputFormat::Json;
        if (json_input) {
            source = parse_json(content);
            doc = document_from_json(source);
        } else {
            doc.sentences = CoNLLUReader::load_string(content);
        }

        Document annotated = recognizer->recognize_document(doc);
        write_output(settings, annotated, json_input ? &source : nullptr);

        if (settings.verbose) {
            std::size_t found = 0;
            for (std::size_t i = 0; i < annotated.sentences.size(); ++i) {
                auto expressions = collect_expressions(annotated.sentences[i].tokens);
                found += expressions.size();
                if (settings.debug && !expressions.empty()) {
                    std::cerr << "[mwetag] sentence " << i + 1 << ": "
                              << expressions_to_json(expressions).dump() << std::endl;
                }
            }
            std::cerr << "[mwetag] " << annotated.sentences.size() << " sentences, "
                      << found << " expressions recognized" << std::endl;
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
