#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include "tessera/errors.hpp"

namespace tessera::engine {

    /**
     * @brief BERT-style WordPiece tokenizer feeding the ONNX embedder.
     *
     * Only used to produce model input ids; chunk boundaries come from
     * Chunker::tokenize, which is lossless.
     */
    class WordPieceTokenizer {
    public:
        static constexpr int64_t kCls = 101;
        static constexpr int64_t kSep = 102;
        static constexpr int64_t kUnk = 100;

        explicit WordPieceTokenizer(const std::string& vocab_path) {
            load_vocab(vocab_path);
        }

        std::vector<int64_t> encode(const std::string& text, size_t max_length = 512) const {
            std::vector<int64_t> ids;
            ids.push_back(kCls);

            for (const auto& word : split_words(to_lower(text))) {
                // Max WordPiece length check to avoid stalls
                if (word.length() > 100) {
                    ids.push_back(kUnk);
                } else {
                    append_word(word, ids);
                }
                if (ids.size() >= max_length - 1) break; // Reserve 1 for [SEP]
            }

            if (ids.size() >= max_length) {
                ids.resize(max_length - 1);
            }
            ids.push_back(kSep);
            return ids;
        }

        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;

        void load_vocab(const std::string& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw ModelUnavailableError("failed to load WordPiece vocab: " + path);
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab[line] = id++;
            }
            if (m_vocab.empty()) {
                throw ModelUnavailableError("WordPiece vocab is empty: " + path);
            }
        }

        void append_word(const std::string& word, std::vector<int64_t>& ids) const {
            std::vector<int64_t> sub_tokens;
            size_t start = 0;

            while (start < word.length()) {
                size_t end = word.length();
                int64_t cur = -1;

                while (start < end) {
                    std::string substr = word.substr(start, end - start);
                    if (start > 0) substr = "##" + substr;

                    auto it = m_vocab.find(substr);
                    if (it != m_vocab.end()) {
                        cur = it->second;
                        break;
                    }
                    end--;
                }

                if (cur == -1) {
                    ids.push_back(kUnk);
                    return;
                }
                sub_tokens.push_back(cur);
                start = end;
            }
            ids.insert(ids.end(), sub_tokens.begin(), sub_tokens.end());
        }

        // Whitespace split; punctuation becomes its own word as BERT's basic tokenizer does.
        static std::vector<std::string> split_words(const std::string& text) {
            std::vector<std::string> words;
            std::string current;
            for (unsigned char c : text) {
                if (std::isspace(c)) {
                    if (!current.empty()) words.push_back(std::move(current));
                    current.clear();
                } else if (c < 0x80 && std::ispunct(c)) {
                    if (!current.empty()) words.push_back(std::move(current));
                    current.clear();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current.push_back(static_cast<char>(c));
                }
            }
            if (!current.empty()) words.push_back(std::move(current));
            return words;
        }

        static std::string to_lower(const std::string& s) {
            std::string data = s;
            std::transform(data.begin(), data.end(), data.begin(),
                [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return data;
        }
    };

}
