#pragma once

#include "encoder.hpp"

// Raw UTF-8 text, nothing added.
class TxtEncoder : public DocumentEncoder {
public:
    std::expected<void, std::string> encode(const std::string& text,
                                            const std::string& timestamp,
                                            const std::filesystem::path& out) override;
};

// Shared by the file-writing encoders.
std::expected<void, std::string> write_file(const std::filesystem::path& out,
                                            const void* data, size_t size);
