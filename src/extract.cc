// extract.cc - Text, PDF and office-document extractors
// PDF and zipped documents are converted by external tools through popen

#include "extract.h"
#include "mmap.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <pugixml.hpp>
#include <sys/wait.h>

namespace simscan {

//=============================================================================
// Shell helpers
//=============================================================================

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

bool capture_command(const std::string& command, std::string& output) {
    output.clear();
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) return false;

    char buf[64 * 1024];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }

    int status = pclose(pipe);
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

//=============================================================================
// Plain text
//=============================================================================

bool TextExtractor::extract(const std::string& path, TokenSeq& out, std::string& error) const {
    MappedFile mf;
    if (!mf.open_read(path.c_str())) {
        error = std::string("cannot open: ") + strerror(errno);
        return false;
    }
    if (mf.size > 0) tokenize_words(mf.data, mf.size, out);
    return true;
}

//=============================================================================
// PDF
//=============================================================================

bool PdfExtractor::extract(const std::string& path, TokenSeq& out, std::string& error) const {
    std::string text;
    std::string cmd = command_ + " -q -enc UTF-8 " + shell_quote(path) + " - 2>/dev/null";
    if (!capture_command(cmd, text)) {
        error = command_ + " failed";
        return false;
    }
    tokenize_words(text.data(), text.size(), out);
    return true;
}

//=============================================================================
// Zipped XML documents
//=============================================================================

static bool is_word_break(const char* name) {
    static const char* const BREAKS[] = {
        "w:p", "w:tab", "w:br", "w:cr",
        "text:p", "text:h", "text:tab", "text:s", "text:line-break",
    };
    for (const char* b : BREAKS) {
        if (strcmp(name, b) == 0) return true;
    }
    return false;
}

struct TextCollector : pugi::xml_tree_walker {
    std::string text;

    bool for_each(pugi::xml_node& node) override {
        switch (node.type()) {
            case pugi::node_element:
                if (is_word_break(node.name())) text += ' ';
                break;
            case pugi::node_pcdata:
            case pugi::node_cdata:
                text += node.value();
                break;
            default:
                break;
        }
        return true;
    }
};

bool xml_words(const char* data, size_t size, TokenSeq& out, std::string& error) {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(data, size);
    if (!parsed) {
        error = std::string("xml parse error: ") + parsed.description();
        return false;
    }

    TextCollector collector;
    doc.traverse(collector);
    tokenize_words(collector.text.data(), collector.text.size(), out);
    return true;
}

bool OfficeXmlExtractor::extract(const std::string& path, TokenSeq& out, std::string& error) const {
    std::string xml;
    std::string cmd = "unzip -p " + shell_quote(path) + " " + shell_quote(member_) + " 2>/dev/null";
    if (!capture_command(cmd, xml)) {
        error = "cannot unpack " + member_;
        return false;
    }
    return xml_words(xml.data(), xml.size(), out, error);
}

//=============================================================================
// Registry
//=============================================================================

ExtractorRegistry ExtractorRegistry::with_defaults() {
    ExtractorRegistry reg;
    reg.add("txt", std::make_unique<TextExtractor>());
    reg.add("pdf", std::make_unique<PdfExtractor>());
    reg.add("docx", std::make_unique<OfficeXmlExtractor>("word/document.xml", "docx"));
    reg.add("odt", std::make_unique<OfficeXmlExtractor>("content.xml", "odt"));
    return reg;
}

void ExtractorRegistry::add(const std::string& ext, std::unique_ptr<Extractor> extractor) {
    extractors_[ext] = std::move(extractor);
}

const Extractor* ExtractorRegistry::find(const std::string& ext) const {
    auto it = extractors_.find(ext);
    return it == extractors_.end() ? nullptr : it->second.get();
}

bool ExtractorRegistry::supports(const std::string& path) const {
    return find(extension(path)) != nullptr;
}

std::vector<std::string> ExtractorRegistry::extensions() const {
    std::vector<std::string> out;
    for (const auto& [ext, _] : extractors_) out.push_back(ext);
    return out;
}

RunError ExtractorRegistry::extract(const std::string& path, Document& doc, std::string& error) const {
    const Extractor* ex = find(extension(path));
    if (!ex) {
        error = "unsupported extension";
        return RunError::UNSUPPORTED_FORMAT;
    }

    doc.name = stem(path);
    doc.tokens.clear();
    if (!ex->extract(path, doc.tokens, error)) {
        return RunError::UNSUPPORTED_FORMAT;
    }
    if (doc.tokens.empty()) {
        error = std::string("no text extracted (") + ex->format_name() + ")";
        return RunError::UNSUPPORTED_FORMAT;
    }
    return RunError::NONE;
}

} // namespace simscan
