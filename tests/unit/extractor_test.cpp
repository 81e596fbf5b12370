#include <gtest/gtest.h>
#include "engine/extractor.hpp"
#include "tessera/errors.hpp"
#include <cstdio>
#include <string>
#include <vector>

using namespace tessera::engine;

namespace {

    // Single-page PDF drawing `line` in Helvetica, with a correct xref table.
    std::string one_page_pdf(const std::string& line) {
        std::string stream = "BT /F1 24 Tf 72 720 Td (" + line + ") Tj ET";
        std::vector<std::string> objects = {
            "<< /Type /Catalog /Pages 2 0 R >>",
            "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
            "/Resources << /Font << /F1 5 0 R >> >> >>",
            "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "\nendstream",
            "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"
        };

        std::string pdf = "%PDF-1.4\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < objects.size(); ++i) {
            offsets.push_back(pdf.size());
            pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
        }

        size_t xref = pdf.size();
        pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
        for (auto offset : offsets) {
            char entry[21];
            std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
            pdf += entry;
        }
        pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
        pdf += "startxref\n" + std::to_string(xref) + "\n%EOF\n";
        return pdf;
    }

}

TEST(ExtractorTest, AllowsOnlyDocumentExtensions) {
    EXPECT_TRUE(is_allowed_upload_extension(".pdf"));
    EXPECT_TRUE(is_allowed_upload_extension(".txt"));
    EXPECT_TRUE(is_allowed_upload_extension(".md"));
    EXPECT_FALSE(is_allowed_upload_extension(".docx"));
    EXPECT_FALSE(is_allowed_upload_extension("txt"));
}

TEST(ExtractorTest, PlainTextPassesThroughWithoutBom) {
    auto extractor = create_plain_text_extractor();
    EXPECT_EQ(extractor->extract_text("# Title\nbody", ".md"), "# Title\nbody");
    EXPECT_EQ(extractor->extract_text("\xEF\xBB\xBFhello", ".txt"), "hello");
    EXPECT_EQ(extractor->extract_text("caf\xC3\xA9", ".txt"), "caf\xC3\xA9");
}

TEST(ExtractorTest, RejectsBinaryAndUnsupportedFormats) {
    PlainTextExtractor extractor;
    EXPECT_THROW(extractor.extract_text("\xFF\xFE\x00\x41", ".txt"), tessera::ExtractionError);
    EXPECT_THROW(extractor.extract_text("caf\xC3", ".md"), tessera::ExtractionError);
    EXPECT_THROW(extractor.extract_text("%PDF-1.7", ".pdf"), tessera::ExtractionError);
}

TEST(ExtractorTest, DocumentExtractorReadsPdfText) {
    if (!pdf_extraction_available()) GTEST_SKIP() << "built without Poppler";

    auto extractor = create_document_extractor();
    auto text = extractor->extract_text(one_page_pdf("Quarterly revenue grew"), ".pdf");
    EXPECT_NE(text.find("Quarterly revenue grew"), std::string::npos) << text;
}

TEST(ExtractorTest, DocumentExtractorRejectsBrokenPdf) {
    auto extractor = create_document_extractor();
    EXPECT_THROW(extractor->extract_text("not a pdf at all", ".pdf"), tessera::ExtractionError);
}

TEST(ExtractorTest, DocumentExtractorStillHandlesPlainText) {
    DocumentExtractor extractor;
    EXPECT_EQ(extractor.extract_text("\xEF\xBB\xBFnotes", ".md"), "notes");
    EXPECT_THROW(extractor.extract_text("x", ".docx"), tessera::ExtractionError);
}
