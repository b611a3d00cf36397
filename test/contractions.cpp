#include <catch2/catch.hpp>

#include "mwetag/contractions.h"

#include <string>
#include <vector>

using mwetag::ContractionExpander;
using Words = std::vector<std::string>;

TEST_CASE("Portuguese contractions expand to preposition and article", "[contractions]") {
    CHECK(ContractionExpander::expand("da", "portuguese") == Words{"de", "a"});
    CHECK(ContractionExpander::expand("nos", "portuguese") == Words{"em", "os"});
    CHECK(ContractionExpander::expand("às", "portuguese") == Words{"a", "as"});
    CHECK(ContractionExpander::expand("pelas", "portuguese") == Words{"por", "as"});
    CHECK(ContractionExpander::expand("numa", "portuguese") == Words{"em", "uma"});
    CHECK(ContractionExpander::expand("duns", "pt") == Words{"de", "uns"});
}

TEST_CASE("Contraction lookup ignores case", "[contractions]") {
    CHECK(ContractionExpander::expand("Da", "portuguese") == Words{"de", "a"});
    CHECK(ContractionExpander::expand("À", "portuguese") == Words{"a", "a"});
    CHECK(ContractionExpander::is_contraction("NUM", "pt"));
}

TEST_CASE("Other words come back as they were", "[contractions]") {
    CHECK(ContractionExpander::expand("Casa", "portuguese") == Words{"Casa"});
    CHECK(ContractionExpander::expand("de", "portuguese") == Words{"de"});
    CHECK(ContractionExpander::expand("", "portuguese") == Words{""});
    CHECK_FALSE(ContractionExpander::is_contraction("casa", "portuguese"));
}

TEST_CASE("Only languages with a contraction table expand", "[contractions]") {
    CHECK(ContractionExpander::expand("da", "english") == Words{"da"});
    CHECK_FALSE(ContractionExpander::is_contraction("do", "english"));
}

TEST_CASE("expand_all flattens a word sequence", "[contractions]") {
    Words words = {"café", "da", "manhã"};
    CHECK(ContractionExpander::expand_all(words, "portuguese") == Words{"café", "de", "a", "manhã"});
    CHECK(ContractionExpander::expand_all(words, "english") == words);
    CHECK(ContractionExpander::expand_all({}, "portuguese").empty());
}
