#pragma once

#include <expected>
#include <filesystem>
#include <string>

// Writes a transcript to a file in one document format. The timestamp is the
// preformatted generation time shown in the document footer, if any.
class DocumentEncoder {
public:
    virtual ~DocumentEncoder() = default;
    virtual std::expected<void, std::string> encode(const std::string& text,
                                                    const std::string& timestamp,
                                                    const std::filesystem::path& out) = 0;
};
