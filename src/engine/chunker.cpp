#include "chunker.hpp"
#include "tessera/errors.hpp"
#include <algorithm>
#include <cctype>

namespace tessera::engine {

    namespace {

        enum class CharClass { Letter, Digit, Space, Punct };

        CharClass classify(unsigned char c) {
            // UTF-8 lead and continuation bytes stay inside letter runs so multi-byte
            // characters are never split across tokens.
            if (c >= 0x80 || std::isalpha(c)) return CharClass::Letter;
            if (std::isdigit(c)) return CharClass::Digit;
            if (std::isspace(c)) return CharClass::Space;
            return CharClass::Punct;
        }

        size_t run_end(const std::string& text, size_t pos, CharClass cls) {
            while (pos < text.size() && classify(static_cast<unsigned char>(text[pos])) == cls) ++pos;
            return pos;
        }

        bool attaches_space(const std::string& text, size_t pos) {
            if (pos >= text.size()) return false;
            auto cls = classify(static_cast<unsigned char>(text[pos]));
            return cls == CharClass::Letter || cls == CharClass::Punct;
        }

    }

    void Chunker::validate(size_t max_tokens, size_t overlap_tokens) {
        if (max_tokens == 0) {
            throw ConfigurationError("chunk size must be positive");
        }
        if (overlap_tokens >= max_tokens) {
            throw ConfigurationError("chunk overlap (" + std::to_string(overlap_tokens) +
                                     ") must be smaller than chunk size (" + std::to_string(max_tokens) + ")");
        }
    }

    std::vector<TokenSpan> Chunker::tokenize(const std::string& text) {
        std::vector<TokenSpan> spans;
        size_t pos = 0;

        while (pos < text.size()) {
            size_t start = pos;
            auto cls = classify(static_cast<unsigned char>(text[pos]));

            if (text[pos] == ' ' && attaches_space(text, pos + 1)) {
                auto next = classify(static_cast<unsigned char>(text[pos + 1]));
                pos = run_end(text, pos + 1, next);
            } else if (cls == CharClass::Digit) {
                size_t limit = std::min(text.size(), pos + 3);
                while (pos < limit && classify(static_cast<unsigned char>(text[pos])) == CharClass::Digit) ++pos;
            } else if (cls == CharClass::Space) {
                pos = run_end(text, pos, CharClass::Space);
                // Leave a trailing ' ' to prefix the following word
                if (pos - start > 1 && text[pos - 1] == ' ' && attaches_space(text, pos)) --pos;
            } else {
                pos = run_end(text, pos, cls);
            }

            spans.push_back({start, pos});
        }
        return spans;
    }

    size_t Chunker::count_tokens(const std::string& text) {
        return tokenize(text).size();
    }

    std::vector<std::string> Chunker::chunk(const std::string& text, size_t max_tokens, size_t overlap_tokens) {
        validate(max_tokens, overlap_tokens);

        std::vector<std::string> chunks;
        auto spans = tokenize(text);
        if (spans.empty()) return chunks;

        const size_t step = max_tokens - overlap_tokens;
        size_t start = 0;
        while (start < spans.size()) {
            size_t end = std::min(start + max_tokens, spans.size());

            size_t from = spans[start].begin;
            size_t to = spans[end - 1].end;
            chunks.push_back(text.substr(from, to - from));

            if (end == spans.size()) break;
            start += step;
        }

        return chunks;
    }

}
