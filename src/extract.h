// extract.h - Format-specific text extraction, registered by file extension
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_EXTRACT_H
#define SIMSCAN_EXTRACT_H

#include "errors.h"
#include "token.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace simscan {

//=============================================================================
// Extractor Interface
//=============================================================================

class Extractor {
public:
    virtual ~Extractor() = default;

    // Append the file's words to out. Returns false if the file could not be
    // read or converted; error then holds a one-line reason.
    virtual bool extract(const std::string& path, TokenSeq& out, std::string& error) const = 0;

    virtual const char* format_name() const = 0;
};

// Plain text, read through a memory mapping
class TextExtractor : public Extractor {
public:
    bool extract(const std::string& path, TokenSeq& out, std::string& error) const override;
    const char* format_name() const override { return "text"; }
};

// PDF via the poppler-utils pdftotext command
class PdfExtractor : public Extractor {
public:
    explicit PdfExtractor(std::string command = "pdftotext") : command_(std::move(command)) {}
    bool extract(const std::string& path, TokenSeq& out, std::string& error) const override;
    const char* format_name() const override { return "pdf"; }

private:
    std::string command_;
};

// Zipped XML word-processor documents (docx: word/document.xml,
// odt: content.xml). The member is unpacked with unzip and parsed with pugixml.
class OfficeXmlExtractor : public Extractor {
public:
    OfficeXmlExtractor(std::string member, const char* format)
        : member_(std::move(member)), format_(format) {}
    bool extract(const std::string& path, TokenSeq& out, std::string& error) const override;
    const char* format_name() const override { return format_; }

private:
    std::string member_;
    const char* format_;
};

// Words of an XML document's character data. Paragraph, tab and line-break
// elements separate words; inline runs do not. Returns false on parse error.
bool xml_words(const char* data, size_t size, TokenSeq& out, std::string& error);

// Run a shell command and capture stdout. Returns false on spawn failure or
// non-zero exit status.
bool capture_command(const std::string& command, std::string& output);

// Single-quote for /bin/sh
std::string shell_quote(const std::string& arg);

//=============================================================================
// Extractor Registry
//=============================================================================

class ExtractorRegistry {
public:
    // txt, pdf, docx, odt
    static ExtractorRegistry with_defaults();

    void add(const std::string& ext, std::unique_ptr<Extractor> extractor);

    const Extractor* find(const std::string& ext) const;

    bool supports(const std::string& path) const;

    std::vector<std::string> extensions() const;

    // Build a Document named after the file stem. UNSUPPORTED_FORMAT for an
    // unknown extension, a failed conversion, or a file with no words.
    RunError extract(const std::string& path, Document& doc, std::string& error) const;

private:
    std::map<std::string, std::unique_ptr<Extractor>> extractors_;
};

} // namespace simscan

#endif // SIMSCAN_EXTRACT_H
