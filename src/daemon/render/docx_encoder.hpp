#pragma once

#include "encoder.hpp"

#include <string>

// Office Open XML word-processing document: title heading, one paragraph per
// line of text, then a "Generated" footer line.
class DocxEncoder : public DocumentEncoder {
public:
    explicit DocxEncoder(std::string title);

    std::expected<void, std::string> encode(const std::string& text,
                                            const std::string& timestamp,
                                            const std::filesystem::path& out) override;

private:
    std::string title_;
};

std::string xml_escape(const std::string& text);

// word/document.xml for the given content.
std::string build_document_xml(const std::string& title, const std::string& text,
                               const std::string& timestamp);
