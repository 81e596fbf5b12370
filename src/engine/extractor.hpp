#pragma once

#include <string>
#include <memory>

namespace tessera::engine {

    /**
     * @brief Turns uploaded file bytes into plain text.
     */
    class TextExtractor {
    public:
        virtual ~TextExtractor() = default;

        /**
         * @param extension Lower-case, with the dot (".txt").
         * @throws ExtractionError when the bytes cannot be turned into text.
         */
        virtual std::string extract_text(const std::string& file_bytes, const std::string& extension) = 0;
    };

    /**
     * @brief Handles .txt and .md (UTF-8, BOM stripped).
     */
    class PlainTextExtractor : public TextExtractor {
    public:
        std::string extract_text(const std::string& file_bytes, const std::string& extension) override;
    };

    /**
     * @brief Plain text plus .pdf through Poppler, one line break after each page.
     */
    class DocumentExtractor : public TextExtractor {
    public:
        std::string extract_text(const std::string& file_bytes, const std::string& extension) override;

    private:
        PlainTextExtractor m_plain;
    };

    bool is_allowed_upload_extension(const std::string& extension);

    // False when built without Poppler; .pdf uploads then fail with ExtractionError.
    bool pdf_extraction_available();

    std::unique_ptr<TextExtractor> create_plain_text_extractor();
    std::unique_ptr<TextExtractor> create_document_extractor();

}
