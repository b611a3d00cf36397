#include "mwetag/io_conllu.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace mwetag {

namespace {

const char* const kColumnKeys[] = {"upos", "xpos", "feats", "head", "deprel", "deps", "misc"};

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> columns;
    std::size_t start = 0;
    while (true) {
        std::size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            columns.push_back(line.substr(start));
            break;
        }
        columns.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return columns;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    std::size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

Token parse_token(const std::vector<std::string>& columns) {
    Token token;
    token.attrs["id"] = columns[0];
    token.text = columns[1];
    if (columns[2] != "_") {
        token.lemma = columns[2];
    }
    for (std::size_t c = 3; c < 10; ++c) {
        if (columns[c] != "_" && !columns[c].empty()) {
            token.attrs[kColumnKeys[c - 3]] = columns[c];
        }
    }
    return token;
}

void parse_comment(const std::string& line, Sentence& sentence) {
    std::string body = trim(line.substr(1));
    std::size_t eq = body.find('=');
    if (eq == std::string::npos) {
        std::string& comment = sentence.attrs["comment"];
        comment += comment.empty() ? body : "\n" + body;
        return;
    }
    std::string key = trim(body.substr(0, eq));
    std::string value = trim(body.substr(eq + 1));
    if (key == "sent_id") {
        sentence.id = value;
    } else if (key == "text") {
        sentence.text = value;
    } else if (key != "generator") {
        sentence.attrs[key] = value;
    }
}

std::string attr_or_blank(const Token& token, const char* key) {
    auto it = token.attrs.find(key);
    if (it == token.attrs.end() || it->second.empty()) {
        return "_";
    }
    return it->second;
}

void write_word(std::ostream& out, const std::string& id, const Token& token) {
    out << id << '\t'
        << (token.text.empty() ? "_" : token.text) << '\t'
        << (token.lemma.empty() ? "_" : token.lemma) << '\t'
        << attr_or_blank(token, "upos") << '\t'
        << attr_or_blank(token, "xpos") << '\t'
        << attr_or_blank(token, "feats") << '\t'
        << attr_or_blank(token, "head") << '\t'
        << attr_or_blank(token, "deprel") << '\t'
        << attr_or_blank(token, "deps") << '\t'
        << CoNLLUWriter::misc_with_annotation(token) << '\n';
}

} // namespace

std::vector<Sentence> CoNLLUReader::load_string(const std::string& content) {
    std::vector<Sentence> sentences;
    Sentence current;
    bool has_content = false;
    Token* open_mwt = nullptr;
    int mwt_last = 0;

    std::istringstream stream(content);
    std::string line;
    std::size_t line_no = 0;

    auto flush = [&]() {
        if (has_content) {
            sentences.push_back(std::move(current));
        }
        current = Sentence();
        has_content = false;
        open_mwt = nullptr;
        mwt_last = 0;
    };

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            flush();
            continue;
        }
        if (line[0] == '#') {
            parse_comment(line, current);
            has_content = true;
            continue;
        }

        std::vector<std::string> columns = split_tabs(line);
        if (columns.size() != 10) {
            throw std::runtime_error("CoNLL-U line " + std::to_string(line_no) + " has " +
                                     std::to_string(columns.size()) + " columns, expected 10");
        }
        const std::string& id = columns[0];
        has_content = true;

        if (id.find('.') != std::string::npos) {
            continue;  // empty node
        }

        std::size_t dash = id.find('-');
        if (dash != std::string::npos) {
            current.tokens.push_back(parse_token(columns));
            open_mwt = &current.tokens.back();
            try {
                mwt_last = std::stoi(id.substr(dash + 1));
            } catch (const std::exception&) {
                throw std::runtime_error("CoNLL-U line " + std::to_string(line_no) + ": bad range '" + id + "'");
            }
            continue;
        }

        int word_id = 0;
        try {
            word_id = std::stoi(id);
        } catch (const std::exception&) {
            throw std::runtime_error("CoNLL-U line " + std::to_string(line_no) + ": bad id '" + id + "'");
        }

        if (open_mwt && word_id <= mwt_last) {
            open_mwt->expanded.push_back(parse_token(columns));
            if (word_id == mwt_last) {
                open_mwt = nullptr;
            }
            continue;
        }
        open_mwt = nullptr;
        current.tokens.push_back(parse_token(columns));
    }
    flush();
    return sentences;
}

std::vector<Sentence> CoNLLUReader::load_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + file_path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

std::string CoNLLUWriter::misc_with_annotation(const Token& token) {
    std::vector<std::string> fields;
    auto it = token.attrs.find("misc");
    if (it != token.attrs.end() && !it->second.empty() && it->second != "_") {
        std::size_t start = 0;
        const std::string& misc = it->second;
        while (start <= misc.size()) {
            std::size_t bar = misc.find('|', start);
            std::string field = misc.substr(start, bar == std::string::npos ? std::string::npos : bar - start);
            if (!field.empty() && field.rfind("MWE", 0) != 0) {
                fields.push_back(field);
            }
            if (bar == std::string::npos) {
                break;
            }
            start = bar + 1;
        }
    }

    if (token.mwe) {
        const MweAnnotation& mwe = *token.mwe;
        fields.push_back("MWE=" + std::to_string(mwe.start) + "-" + std::to_string(mwe.end));
        fields.push_back("MWELemma=" + mwe.lemma);
        fields.push_back("MWEPos=" + mwe.pos);
        fields.push_back("MWEType=" + (mwe.type_label.empty() ? to_string(mwe.type) : mwe.type_label));
        fields.push_back("MWEPosition=" + std::to_string(mwe.position));
    }

    if (fields.empty()) {
        return "_";
    }
    std::string result;
    for (const auto& field : fields) {
        if (!result.empty()) {
            result += '|';
        }
        result += field;
    }
    return result;
}

void CoNLLUWriter::write(const std::vector<Sentence>& sentences, std::ostream& out,
                         const std::string& generator) {
    if (!generator.empty()) {
        out << "# generator = " << generator << "\n";
    }
    for (const auto& sentence : sentences) {
        if (!sentence.id.empty()) {
            out << "# sent_id = " << sentence.id << "\n";
        }
        if (!sentence.text.empty()) {
            out << "# text = " << sentence.text << "\n";
        }
        for (const auto& [key, value] : sentence.attrs) {
            if (key == "comment") {
                std::istringstream lines(value);
                std::string comment;
                while (std::getline(lines, comment)) {
                    out << "# " << comment << "\n";
                }
            } else {
                out << "# " << key << " = " << value << "\n";
            }
        }

        int word_id = 1;
        for (const auto& token : sentence.tokens) {
            if (token.expanded.empty()) {
                write_word(out, std::to_string(word_id++), token);
                continue;
            }
            int last = word_id + static_cast<int>(token.expanded.size()) - 1;
            out << word_id << '-' << last << '\t'
                << (token.text.empty() ? "_" : token.text)
                << "\t_\t_\t_\t_\t_\t_\t_\t"
                << misc_with_annotation(token) << '\n';
            for (const auto& word : token.expanded) {
                write_word(out, std::to_string(word_id++), word);
            }
        }
        out << "\n";
    }
}

bool CoNLLUWriter::write_file(const std::vector<Sentence>& sentences, const std::string& file_path,
                              const std::string& generator) {
    std::ofstream out(file_path);
    if (!out.is_open()) {
        return false;
    }
    write(sentences, out, generator);
    return static_cast<bool>(out);
}

} // namespace mwetag
