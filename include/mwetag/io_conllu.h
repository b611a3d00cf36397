#pragma once

#include "types.h"

#include <ostream>
#include <string>
#include <vector>

namespace mwetag {

class CoNLLUReader {
public:
    // Multiword token ranges ("1-2") become one token whose `expanded` holds
    // the words. Empty nodes ("1.1") are skipped.
    static std::vector<Sentence> load_string(const std::string& content);
    static std::vector<Sentence> load_file(const std::string& file_path);
};

class CoNLLUWriter {
public:
    // MWE annotations go to the MISC column
    static void write(const std::vector<Sentence>& sentences, std::ostream& out,
                      const std::string& generator = "mwetag");
    static bool write_file(const std::vector<Sentence>& sentences, const std::string& file_path,
                           const std::string& generator = "mwetag");

    static std::string misc_with_annotation(const Token& token);
};

} // namespace mwetag
