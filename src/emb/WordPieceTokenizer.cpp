#include "emb/WordPieceTokenizer.hpp"
#include "emb/BasicTokenizer.hpp"

#include <fstream>

namespace labelsearch {

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    return !m_id_to_tok.empty() && cls_id() >= 0 && sep_id() >= 0 && unk_id() >= 0;
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& token) const {
    if (token.empty()) return {"[UNK]"};

    // byte offsets of every code point start, plus the end
    std::vector<size_t> bounds;
    for (size_t i = 0; i < token.size(); ) {
        bounds.push_back(i);
        tokenize::next_codepoint(token, i);
    }
    bounds.push_back(token.size());

    std::vector<std::string> pieces;
    size_t s = 0;  // index into bounds

    while (s + 1 < bounds.size()) {
        size_t e = bounds.size() - 1;
        std::string best;

        while (e > s) {
            std::string sub = token.substr(bounds[s], bounds[e] - bounds[s]);
            if (s > 0) sub = "##" + sub;

            if (m_tok_to_id.find(sub) != m_tok_to_id.end()) {
                best = sub;
                break;
            }
            --e;
        }

        if (best.empty()) return {"[UNK]"};
        pieces.push_back(best);
        s = e;
    }

    return pieces;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    int64_t cls = cls_id(), sep = sep_id(), unk = unk_id();

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(cls);

    auto basic = tokenize::basic_tokenize(text);
    for (const auto& t : basic) {
        auto pieces = wordpiece(t);
        for (const auto& p : pieces) {
            if (ids.size() + 1 >= max_len) break; // keep room for [SEP]
            ids.push_back(id_or(unk, p));
        }
        if (ids.size() + 1 >= max_len) break;
    }

    ids.push_back(sep);
    return ids;
}

}  // namespace labelsearch
