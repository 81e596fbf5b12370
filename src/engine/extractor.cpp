#include "extractor.hpp"
#include "tessera/errors.hpp"

namespace tessera::engine {

    namespace {

        bool valid_utf8(const std::string& s) {
            size_t i = 0;
            while (i < s.size()) {
                auto c = static_cast<unsigned char>(s[i]);
                size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
                if (len == 0 || i + len > s.size()) return false;
                for (size_t k = 1; k < len; ++k) {
                    if ((static_cast<unsigned char>(s[i + k]) >> 6) != 0x2) return false;
                }
                i += len;
            }
            return true;
        }

    }

    bool is_allowed_upload_extension(const std::string& extension) {
        return extension == ".pdf" || extension == ".txt" || extension == ".md";
    }

    std::string PlainTextExtractor::extract_text(const std::string& file_bytes, const std::string& extension) {
        if (extension != ".txt" && extension != ".md") {
            throw ExtractionError("no text extractor configured for " + extension + " files");
        }

        std::string text = file_bytes;
        if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            text.erase(0, 3);
        }
        if (!valid_utf8(text)) {
            throw ExtractionError("file is not valid UTF-8 text");
        }
        return text;
    }

    std::unique_ptr<TextExtractor> create_plain_text_extractor() {
        return std::make_unique<PlainTextExtractor>();
    }

}
