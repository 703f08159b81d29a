// extract_test.cc - Unit tests for extractors and the extension registry

#include "test_helper.h"
#include "../src/extract.h"
#include "../src/mmap.h"

#include <memory>
#include <string>
#include <vector>

using namespace simscan;

// Produces a fixed word list for any path
class FixedExtractor : public Extractor {
public:
    explicit FixedExtractor(TokenSeq words) : words_(std::move(words)) {}
    bool extract(const std::string&, TokenSeq& out, std::string&) const override {
        out.insert(out.end(), words_.begin(), words_.end());
        return true;
    }
    const char* format_name() const override { return "fixed"; }

private:
    TokenSeq words_;
};

//=============================================================================
// Path helpers
//=============================================================================

TEST(path_parts) {
    ASSERT_EQ(base_name("dir/sub/report.v2.PDF"), std::string("report.v2.PDF"));
    ASSERT_EQ(stem("dir/sub/report.v2.PDF"), std::string("report.v2"));
    ASSERT_EQ(extension("dir/sub/report.v2.PDF"), std::string("pdf"));
    ASSERT_EQ(extension("README"), std::string(""));
    ASSERT_EQ(stem(".hidden"), std::string(".hidden"));
    ASSERT_EQ(join_path("out/", "a.html"), std::string("out/a.html"));
    ASSERT_EQ(join_path("out", "a.html"), std::string("out/a.html"));
}

TEST(make_directories_nested) {
    std::string root = test::scratch_dir("mkdirs");
    std::string nested = root + "/a/b/c";
    ASSERT_TRUE(make_directories(nested));
    ASSERT_TRUE(is_directory(nested));
    ASSERT_TRUE(make_directories(nested));
    test::remove_tree(root);
}

//=============================================================================
// Shell helpers
//=============================================================================

TEST(shell_quote_single_quotes) {
    ASSERT_EQ(shell_quote("plain name.pdf"), std::string("'plain name.pdf'"));
    ASSERT_EQ(shell_quote("it's"), std::string("'it'\\''s'"));
}

TEST(capture_command_output_and_status) {
    std::string out;
    ASSERT_TRUE(capture_command("printf 'a b'", out));
    ASSERT_EQ(out, std::string("a b"));
    ASSERT_FALSE(capture_command("exit 3", out));
}

//=============================================================================
// Text
//=============================================================================

TEST(text_extractor_reads_words) {
    std::string dir = test::scratch_dir("text");
    std::string path = dir + "/essay.txt";
    test::write_file(path, "It was the best\nof times,\tit was");

    TextExtractor ex;
    TokenSeq out;
    std::string error;
    ASSERT_TRUE(ex.extract(path, out, error));
    ASSERT_EQ(out.size(), 8u);
    ASSERT_EQ(out[5], std::string("times,"));
    test::remove_tree(dir);
}

TEST(text_extractor_missing_file) {
    TextExtractor ex;
    TokenSeq out;
    std::string error;
    ASSERT_FALSE(ex.extract("/nonexistent/simscan/missing.txt", out, error));
    ASSERT_FALSE(error.empty());
}

//=============================================================================
// XML documents
//=============================================================================

TEST(xml_words_docx_paragraphs) {
    std::string xml =
        "<?xml version=\"1.0\"?>"
        "<w:document xmlns:w=\"urn:w\"><w:body>"
        "<w:p><w:r><w:t>Hel</w:t></w:r><w:r><w:t>lo</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>brave</w:t><w:tab/><w:t>new</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>world</w:t><w:br/><w:t>&amp;</w:t></w:r></w:p>"
        "</w:body></w:document>";
    TokenSeq out;
    std::string error;
    ASSERT_TRUE(xml_words(xml.data(), xml.size(), out, error));
    ASSERT_EQ(out.size(), 5u);
    ASSERT_EQ(out[0], std::string("Hello"));
    ASSERT_EQ(out[1], std::string("brave"));
    ASSERT_EQ(out[2], std::string("new"));
    ASSERT_EQ(out[4], std::string("&"));
}

TEST(xml_words_odt_spaces) {
    std::string xml =
        "<office:document-content xmlns:office=\"urn:o\" xmlns:text=\"urn:t\">"
        "<office:body><office:text>"
        "<text:h>Title</text:h>"
        "<text:p>one<text:s/>two<text:line-break/>three</text:p>"
        "</office:text></office:body></office:document-content>";
    TokenSeq out;
    std::string error;
    ASSERT_TRUE(xml_words(xml.data(), xml.size(), out, error));
    ASSERT_EQ(out.size(), 4u);
    ASSERT_EQ(out[0], std::string("Title"));
    ASSERT_EQ(out[3], std::string("three"));
}

TEST(xml_words_malformed) {
    std::string xml = "<w:p><w:t>broken</w:p>";
    TokenSeq out;
    std::string error;
    ASSERT_FALSE(xml_words(xml.data(), xml.size(), out, error));
    ASSERT_FALSE(error.empty());
}

TEST(office_extractor_rejects_non_zip) {
    std::string dir = test::scratch_dir("office");
    std::string path = dir + "/fake.docx";
    test::write_file(path, "this is not a zip archive");

    OfficeXmlExtractor ex("word/document.xml", "docx");
    TokenSeq out;
    std::string error;
    ASSERT_FALSE(ex.extract(path, out, error));
    ASSERT_FALSE(error.empty());
    test::remove_tree(dir);
}

TEST(pdf_extractor_command_failure) {
    PdfExtractor ex("false");
    TokenSeq out;
    std::string error;
    ASSERT_FALSE(ex.extract("/nonexistent/simscan/a.pdf", out, error));
    ASSERT_EQ(error, std::string("false failed"));
}

//=============================================================================
// Registry
//=============================================================================

TEST(registry_defaults) {
    ExtractorRegistry reg = ExtractorRegistry::with_defaults();
    std::vector<std::string> exts = reg.extensions();
    ASSERT_EQ(exts.size(), 4u);
    ASSERT_EQ(exts[0], std::string("docx"));
    ASSERT_EQ(exts[3], std::string("txt"));
    ASSERT_TRUE(reg.supports("a/b/Paper.PDF"));
    ASSERT_TRUE(reg.supports("notes.odt"));
    ASSERT_FALSE(reg.supports("image.png"));
    ASSERT_FALSE(reg.supports("Makefile"));
    ASSERT_EQ(std::string(reg.find("docx")->format_name()), std::string("docx"));
    ASSERT_TRUE(reg.find("rtf") == nullptr);
}

TEST(registry_extract_names_by_stem) {
    std::string dir = test::scratch_dir("registry");
    std::string path = dir + "/chapter.one.txt";
    test::write_file(path, "call me ishmael");

    ExtractorRegistry reg = ExtractorRegistry::with_defaults();
    Document doc;
    std::string error;
    ASSERT_EQ(reg.extract(path, doc, error), RunError::NONE);
    ASSERT_EQ(doc.name, std::string("chapter.one"));
    ASSERT_EQ(doc.tokens.size(), 3u);
    test::remove_tree(dir);
}

TEST(registry_extract_failures) {
    std::string dir = test::scratch_dir("registry_fail");
    test::write_file(dir + "/empty.txt", "  \n ");
    test::write_file(dir + "/slides.rtf", "words here");

    ExtractorRegistry reg = ExtractorRegistry::with_defaults();
    Document doc;
    std::string error;
    ASSERT_EQ(reg.extract(dir + "/empty.txt", doc, error), RunError::UNSUPPORTED_FORMAT);
    ASSERT_FALSE(error.empty());
    ASSERT_EQ(reg.extract(dir + "/slides.rtf", doc, error), RunError::UNSUPPORTED_FORMAT);
    ASSERT_EQ(reg.extract(dir + "/missing.txt", doc, error), RunError::UNSUPPORTED_FORMAT);
    test::remove_tree(dir);
}

TEST(registry_custom_extractor) {
    ExtractorRegistry reg;
    reg.add("md", std::make_unique<FixedExtractor>(TokenSeq{"x", "y"}));
    Document doc;
    std::string error;
    ASSERT_EQ(reg.extract("/anywhere/readme.md", doc, error), RunError::NONE);
    ASSERT_EQ(doc.name, std::string("readme"));
    ASSERT_EQ(doc.tokens.size(), 2u);
    ASSERT_FALSE(reg.supports("a.txt"));
}

int main() {
    std::cout << "=== Extract Unit Tests ===\n";

    // Tests are auto-run by static initializers

    return test::print_summary();
}
