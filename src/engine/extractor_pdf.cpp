#include "extractor.hpp"
#include "tessera/errors.hpp"
#include <limits>
#include <memory>

#ifdef TESSERA_WITH_POPPLER
#include <poppler-document.h>
#include <poppler-page.h>
#endif

namespace tessera::engine {

    namespace {

        std::string extract_pdf(const std::string& file_bytes) {
#ifdef TESSERA_WITH_POPPLER
            if (file_bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
                throw ExtractionError("PDF too large");
            }
            std::unique_ptr<poppler::document> doc(
                poppler::document::load_from_raw_data(file_bytes.data(), static_cast<int>(file_bytes.size())));
            if (!doc) throw ExtractionError("file is not a readable PDF");
            if (doc->is_locked()) throw ExtractionError("PDF is password protected");

            std::string text;
            for (int i = 0; i < doc->pages(); ++i) {
                std::unique_ptr<poppler::page> page(doc->create_page(i));
                if (!page) continue;
                auto bytes = page->text().to_utf8();
                text.append(bytes.begin(), bytes.end());
                text.push_back('\n');
            }
            return text;
#else
            (void)file_bytes;
            throw ExtractionError("PDF extraction is not available in this build");
#endif
        }

    }

    bool pdf_extraction_available() {
#ifdef TESSERA_WITH_POPPLER
        return true;
#else
        return false;
#endif
    }

    std::string DocumentExtractor::extract_text(const std::string& file_bytes, const std::string& extension) {
        if (extension == ".pdf") return extract_pdf(file_bytes);
        return m_plain.extract_text(file_bytes, extension);
    }

    std::unique_ptr<TextExtractor> create_document_extractor() {
        return std::make_unique<DocumentExtractor>();
    }

}
