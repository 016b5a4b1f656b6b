#pragma once
#include "core/Types.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace labelsearch {

// A rejected input line. The rest of the file still loads.
struct ParseIssue {
    size_t line = 0;  // 1-based
    std::string reason;
};

template <typename T>
struct LoadResult {
    std::string source;
    std::vector<T> records;
    std::vector<ParseIssue> issues;
};

struct TextLine {
    size_t line = 0;
    std::string text;
};

// text<TAB>level1##level2...
LoadResult<Example> parse_corpus(std::istream& in, const std::string& source = "<stream>");
// one label path per line; the entry text is the levels joined by a space
LoadResult<Example> parse_labels(std::istream& in, const std::string& source = "<stream>");
// query<TAB>positive (a positive containing ## is read as a label path)
LoadResult<TrainPair> parse_train_pairs(std::istream& in, const std::string& source = "<stream>");
// one text per line
LoadResult<TextLine> parse_texts(std::istream& in, const std::string& source = "<stream>");

// File wrappers; throw std::runtime_error when the file cannot be opened.
// Evaluation pairs share the corpus format.
LoadResult<Example> load_corpus_file(const std::string& path);
LoadResult<Example> load_label_file(const std::string& path);
LoadResult<Example> load_eval_file(const std::string& path);
LoadResult<TrainPair> load_train_pairs_file(const std::string& path);
LoadResult<TextLine> load_text_file(const std::string& path);

// "<source>:<line>: <reason>" per issue
template <typename T>
void print_issues(const LoadResult<T>& r, std::ostream& os) {
    for (const auto& is : r.issues) os << r.source << ":" << is.line << ": " << is.reason << "\n";
}

}  // namespace labelsearch
