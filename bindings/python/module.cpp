#include "mwetag/recognizer.h"
#include "mwetag/matcher.h"
#include "mwetag/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {
using mwetag::unicode::sanitize_utf8;
}

using mwetag::ExpressionDictionary;
using mwetag::ExpressionSource;
using mwetag::LemmaDictionary;
using mwetag::LemmaSource;
using mwetag::MweRecognizer;
using mwetag::RecognizerOptions;
using mwetag::Sentence;
using mwetag::Token;

namespace {

std::string to_string_any(const py::handle& value) {
    if (value.is_none()) {
        return "";
    }
    return py::cast<std::string>(py::str(value));
}

// Only the fields matching looks at are read; the dicts themselves are kept for output
Token token_from_py(const py::handle& obj) {
    Token token;
    if (py::isinstance<py::str>(obj)) {
        token.text = py::cast<std::string>(obj);
        return token;
    }
    auto token_dict = py::cast<py::dict>(obj);
    if (token_dict.contains("text")) {
        token.text = to_string_any(token_dict["text"]);
    } else if (token_dict.contains("form")) {
        token.text = to_string_any(token_dict["form"]);
    }
    if (token_dict.contains("lemma")) {
        token.lemma = to_string_any(token_dict["lemma"]);
    }
    if (token_dict.contains("expanded") && !token_dict["expanded"].is_none()) {
        for (const auto& sub : py::cast<py::list>(token_dict["expanded"])) {
            token.expanded.push_back(token_from_py(sub));
        }
    }
    return token;
}

std::vector<Token> tokens_from_py(const py::list& tokens) {
    std::vector<Token> result;
    result.reserve(tokens.size());
    for (const auto& item : tokens) {
        result.push_back(token_from_py(item));
    }
    return result;
}

void set_annotation_fields(py::dict& out, const mwetag::MweAnnotation& mwe) {
    out["mwe_span"] = py::make_tuple(mwe.start, mwe.end);
    out["mwe_lemma"] = sanitize_utf8(mwe.lemma);
    out["mwe_pos"] = sanitize_utf8(mwe.pos);
    out["mwe_type"] = sanitize_utf8(mwe.type_label.empty() ? mwetag::to_string(mwe.type) : mwe.type_label);
    out["mwe_head"] = mwe.head;
    out["mwe_position"] = mwe.position;
}

py::list annotate_py_tokens(const py::list& original, const std::vector<Token>& annotated);

py::object annotate_py_token(const py::handle& original, const Token& token) {
    if (!token.mwe && !mwetag::has_annotations(token.expanded)) {
        return py::reinterpret_borrow<py::object>(original);
    }
    if (py::isinstance<py::str>(original)) {
        py::dict out;
        out["text"] = original;
        set_annotation_fields(out, *token.mwe);
        return std::move(out);
    }
    // Shallow copy: the caller's dict is never modified
    py::dict out = py::cast<py::dict>(original.attr("copy")());
    if (token.mwe) {
        set_annotation_fields(out, *token.mwe);
    }
    if (out.contains("expanded") && py::isinstance<py::list>(out["expanded"])) {
        out["expanded"] = annotate_py_tokens(py::cast<py::list>(out["expanded"]), token.expanded);
    }
    return std::move(out);
}

// `original` itself when nothing was recognized
py::list annotate_py_tokens(const py::list& original, const std::vector<Token>& annotated) {
    if (!mwetag::has_annotations(annotated)) {
        return original;
    }
    py::list out;
    std::size_t i = 0;
    for (const auto& item : original) {
        out.append(annotate_py_token(item, annotated.at(i++)));
    }
    return out;
}

ExpressionSource expressions_from_py(const py::object& source) {
    if (source.is_none()) {
        return {};
    }
    if (py::isinstance<py::str>(source)) {
        return py::cast<std::string>(source);
    }
    ExpressionDictionary dictionary;
    for (const auto& item : py::cast<py::dict>(source)) {
        std::string surface = py::cast<std::string>(item.first);
        auto info = py::cast<py::dict>(item.second);
        dictionary.insert(surface,
                          info.contains("lemma") ? to_string_any(info["lemma"]) : "",
                          info.contains("pos") ? to_string_any(info["pos"]) : "",
                          info.contains("type") ? to_string_any(info["type"]) : "");
    }
    return dictionary;
}

LemmaSource lemmas_from_py(const py::object& source) {
    if (source.is_none()) {
        return {};
    }
    if (py::isinstance<py::str>(source)) {
        return py::cast<std::string>(source);
    }
    return py::cast<LemmaDictionary>(source);
}

class PyMweRecognizer {
public:
    PyMweRecognizer(const std::string& language, const py::object& mwe_database,
                    const py::object& lemma_dict, std::size_t max_length, bool verbose) {
        RecognizerOptions options;
        options.max_length = max_length;
        options.verbose = verbose;
        recognizer_ = std::make_unique<MweRecognizer>(language, expressions_from_py(mwe_database),
                                                      lemmas_from_py(lemma_dict), options);
    }

    py::list recognize(const py::list& tokens) const {
        return annotate_py_tokens(tokens, recognizer_->recognize(tokens_from_py(tokens)));
    }

    // Also matches inside the "expanded" words of multiword tokens
    py::list recognize_sentence_tokens(const py::list& tokens) const {
        Sentence input;
        input.tokens = tokens_from_py(tokens);
        return annotate_py_tokens(tokens, recognizer_->recognize_sentence(input).tokens);
    }

    // Sentences are dicts with a "tokens" list (or bare token lists); sentences
    // without tokens are passed through as they are
    py::list recognize_document(const py::list& document) const {
        py::list out;
        for (const auto& item : document) {
            if (py::isinstance<py::list>(item)) {
                out.append(recognize_sentence_tokens(py::cast<py::list>(item)));
                continue;
            }
            auto sentence = py::cast<py::dict>(item);
            if (!sentence.contains("tokens")) {
                out.append(sentence);
                continue;
            }
            auto tokens = py::cast<py::list>(sentence["tokens"]);
            py::list annotated = recognize_sentence_tokens(tokens);
            if (annotated.is(tokens)) {
                out.append(sentence);
                continue;
            }
            py::dict copy = py::cast<py::dict>(sentence.attr("copy")());
            copy["tokens"] = annotated;
            out.append(copy);
        }
        return out;
    }

    py::list find_expressions(const py::list& tokens) const {
        py::list out;
        auto annotated = recognizer_->recognize(tokens_from_py(tokens));
        for (const auto& expr : mwetag::collect_expressions(annotated)) {
            py::dict d;
            d["span"] = py::make_tuple(expr.start, expr.end);
            d["text"] = sanitize_utf8(expr.text);
            d["lemma"] = sanitize_utf8(expr.lemma);
            d["pos"] = sanitize_utf8(expr.pos);
            d["type"] = sanitize_utf8(expr.type);
            d["tokens"] = expr.tokens;
            out.append(d);
        }
        return out;
    }

    void add(const std::string& surface, const py::object& lemma, const std::string& pos,
             const std::string& type) {
        recognizer_->add(surface, to_string_any(lemma), pos, type);
    }

    bool remove(const std::string& surface) { return recognizer_->remove(surface); }

    py::dict statistics() const {
        auto stats = recognizer_->statistics();
        py::dict out;
        out["total_mwes"] = stats.total;
        out["length_distribution"] = stats.length_distribution;
        out["pos_distribution"] = stats.pos_distribution;
        out["type_distribution"] = stats.type_distribution;
        return out;
    }

    bool enabled() const { return recognizer_->enabled(); }
    std::size_t size() const { return recognizer_->size(); }
    std::size_t lemma_dictionary_size() const { return recognizer_->lemma_dictionary_size(); }
    std::string language() const { return recognizer_->language(); }

private:
    std::unique_ptr<MweRecognizer> recognizer_;
};

} // namespace

PYBIND11_MODULE(mwetag_py, m) {
    m.doc() = "Python bindings for the mwetag multiword expression recognizer";

    py::class_<PyMweRecognizer>(m, "MweRecognizer")
        .def(py::init<const std::string&, const py::object&, const py::object&, std::size_t, bool>(),
             py::arg("language"), py::arg("mwe_database") = py::none(),
             py::arg("lemma_dict") = py::none(), py::arg("max_length") = 10,
             py::arg("verbose") = false)
        .def("recognize", &PyMweRecognizer::recognize, py::arg("tokens"),
             "Annotate a list of token dicts (or strings) with MWE fields")
        .def("recognize_document", &PyMweRecognizer::recognize_document, py::arg("document"),
             "Annotate every sentence dict of a document")
        .def("find_expressions", &PyMweRecognizer::find_expressions, py::arg("tokens"),
             "List the expressions recognized in a token list")
        .def("add", &PyMweRecognizer::add, py::arg("surface"), py::arg("lemma") = py::none(),
             py::arg("pos") = "X", py::arg("type") = "fixed")
        .def("remove", &PyMweRecognizer::remove, py::arg("surface"))
        .def("statistics", &PyMweRecognizer::statistics)
        .def_property_readonly("enabled", &PyMweRecognizer::enabled)
        .def_property_readonly("language", &PyMweRecognizer::language)
        .def("__len__", &PyMweRecognizer::size)
        .def_property_readonly("lemma_dictionary_size", &PyMweRecognizer::lemma_dictionary_size);
}
