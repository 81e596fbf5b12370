#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace tessera::engine {

    /**
     * @brief Byte range of one token inside the source text.
     */
    struct TokenSpan {
        size_t begin;
        size_t end;
    };

    class Chunker {
    public:
        /**
         * @brief Splits text into windows of max_tokens tokens, consecutive
         * windows sharing overlap_tokens tokens.
         * @throws ConfigurationError if max_tokens == 0 or overlap_tokens >= max_tokens.
         * @return Ordered chunk texts. Empty text yields no chunks.
         */
        static std::vector<std::string> chunk(const std::string& text, size_t max_tokens, size_t overlap_tokens);

        /**
         * @brief Deterministic, lossless pre-tokenization.
         *
         * A token is a letter run (with one leading space), up to three
         * digits, a punctuation run (with one leading space) or a
         * whitespace run. Spans are contiguous and cover the whole input.
         */
        static std::vector<TokenSpan> tokenize(const std::string& text);

        static size_t count_tokens(const std::string& text);

        static void validate(size_t max_tokens, size_t overlap_tokens);
    };

}
