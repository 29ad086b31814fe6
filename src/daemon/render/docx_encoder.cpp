#include "docx_encoder.hpp"

#include "txt_encoder.hpp"
#include "zip_writer.hpp"

#include <string_view>

namespace {

constexpr std::string_view kContentTypes =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(<Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>)"
    R"(</Types>)";

constexpr std::string_view kPackageRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kDocumentRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kStyles =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:style w:type="paragraph" w:default="1" w:styleId="Normal"><w:name w:val="Normal"/>)"
    R"(<w:rPr><w:sz w:val="22"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Title"><w:name w:val="Title"/>)"
    R"(<w:basedOn w:val="Normal"/><w:next w:val="Normal"/>)"
    R"(<w:pPr><w:spacing w:after="240"/></w:pPr><w:rPr><w:b/><w:sz w:val="48"/></w:rPr></w:style>)"
    R"(</w:styles>)";

void append_run(std::string& xml, const std::string& text, bool italic = false) {
    xml += "<w:r>";
    if (italic) xml += "<w:rPr><w:i/></w:rPr>";
    xml += "<w:t xml:space=\"preserve\">";
    xml += xml_escape(text);
    xml += "</w:t></w:r>";
}

} // namespace

DocxEncoder::DocxEncoder(std::string title) : title_(std::move(title)) {}

std::expected<void, std::string> DocxEncoder::encode(const std::string& text,
                                                     const std::string& timestamp,
                                                     const std::filesystem::path& out) {
    auto archive = zip::write({
        {"[Content_Types].xml", std::string(kContentTypes)},
        {"_rels/.rels", std::string(kPackageRels)},
        {"word/_rels/document.xml.rels", std::string(kDocumentRels)},
        {"word/styles.xml", std::string(kStyles)},
        {"word/document.xml", build_document_xml(title_, text, timestamp)},
    });
    return write_file(out, archive.data(), archive.size());
}

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                // XML 1.0 forbids most C0 controls.
                if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' && c != '\r') {
                    break;
                }
                out += c;
        }
    }
    return out;
}

std::string build_document_xml(const std::string& title, const std::string& text,
                               const std::string& timestamp) {
    std::string xml =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)";

    xml += R"(<w:p><w:pPr><w:pStyle w:val="Title"/></w:pPr>)";
    append_run(xml, title);
    xml += "</w:p>";

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        xml += "<w:p>";
        if (!line.empty()) append_run(xml, line);
        xml += "</w:p>";
        start = end + 1;
    }

    xml += "<w:p><w:r><w:br/></w:r>";
    append_run(xml, "— Generated: " + timestamp, true);
    xml += "</w:p>";

    xml += "</w:body></w:document>";
    return xml;
}
