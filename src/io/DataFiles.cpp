#include "io/DataFiles.hpp"
#include "core/LabelPath.hpp"
#include "emb/BasicTokenizer.hpp"

#include <fstream>
#include <stdexcept>

namespace labelsearch {

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find('\t', start);
        fields.push_back(line.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return fields;
}

static bool contains_separator(const std::string& s) {
    return s.find(labels::kSeparator) != std::string::npos;
}

// Calls fn(line_no, line) for each well-formed UTF-8 line; fn returns an
// empty string on success or the reason the line was rejected.
template <typename T, typename Fn>
static LoadResult<T> read_lines(std::istream& in, const std::string& source, Fn fn) {
    LoadResult<T> r;
    r.source = source;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string reason;
        if (line.empty()) reason = "empty line";
        else if (!tokenize::is_valid_utf8(line)) reason = "invalid UTF-8";
        else reason = fn(line_no, line, r.records);
        if (!reason.empty()) r.issues.push_back({line_no, std::move(reason)});
    }
    return r;
}

static std::string parse_text_and_label(const std::string& line, Example& ex) {
    auto fields = split_tabs(line);
    if (fields.size() != 2) {
        return "expected 2 tab-separated fields, got " + std::to_string(fields.size());
    }
    if (fields[0].empty()) return "empty text";
    if (contains_separator(fields[0])) return std::string("text contains reserved separator '") + labels::kSeparator + "'";

    try {
        ex.label_path = labels::parse(fields[1]);
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    ex.text = std::move(fields[0]);
    return "";
}

LoadResult<Example> parse_corpus(std::istream& in, const std::string& source) {
    return read_lines<Example>(in, source, [](size_t, const std::string& line, std::vector<Example>& out) {
        Example ex;
        std::string reason = parse_text_and_label(line, ex);
        if (reason.empty()) out.push_back(std::move(ex));
        return reason;
    });
}

LoadResult<Example> parse_labels(std::istream& in, const std::string& source) {
    return read_lines<Example>(in, source, [](size_t, const std::string& line, std::vector<Example>& out) {
        if (line.find('\t') != std::string::npos) return std::string("tab in label line");

        Example ex;
        try {
            ex.label_path = labels::parse(line);
        } catch (const std::invalid_argument& e) {
            return std::string(e.what());
        }
        ex.text = labels::render_text(ex.label_path);
        out.push_back(std::move(ex));
        return std::string();
    });
}

LoadResult<TrainPair> parse_train_pairs(std::istream& in, const std::string& source) {
    return read_lines<TrainPair>(in, source, [](size_t, const std::string& line, std::vector<TrainPair>& out) {
        auto fields = split_tabs(line);
        if (fields.size() != 2) {
            return "expected 2 tab-separated fields, got " + std::to_string(fields.size());
        }
        if (fields[0].empty()) return std::string("empty query text");
        if (fields[1].empty()) return std::string("empty positive");
        if (contains_separator(fields[0])) {
            return std::string("query text contains reserved separator '") + labels::kSeparator + "'";
        }

        TrainPair p;
        p.query_text = std::move(fields[0]);
        if (contains_separator(fields[1])) {
            try {
                p.positive_text = labels::render_text(labels::parse(fields[1]));
            } catch (const std::invalid_argument& e) {
                return std::string(e.what());
            }
        } else {
            p.positive_text = std::move(fields[1]);
        }
        out.push_back(std::move(p));
        return std::string();
    });
}

LoadResult<TextLine> parse_texts(std::istream& in, const std::string& source) {
    return read_lines<TextLine>(in, source, [](size_t line_no, const std::string& line, std::vector<TextLine>& out) {
        if (line.find('\t') != std::string::npos) return std::string("tab in input text");
        out.push_back({line_no, line});
        return std::string();
    });
}

static std::ifstream open_or_throw(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open: " + path);
    return in;
}

LoadResult<Example> load_corpus_file(const std::string& path) {
    auto in = open_or_throw(path);
    return parse_corpus(in, path);
}

LoadResult<Example> load_label_file(const std::string& path) {
    auto in = open_or_throw(path);
    return parse_labels(in, path);
}

LoadResult<Example> load_eval_file(const std::string& path) {
    auto in = open_or_throw(path);
    return parse_corpus(in, path);
}

LoadResult<TrainPair> load_train_pairs_file(const std::string& path) {
    auto in = open_or_throw(path);
    return parse_train_pairs(in, path);
}

LoadResult<TextLine> load_text_file(const std::string& path) {
    auto in = open_or_throw(path);
    return parse_texts(in, path);
}

}  // namespace labelsearch
