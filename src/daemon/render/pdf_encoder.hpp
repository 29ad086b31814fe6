#pragma once

#include "config.hpp"
#include "encoder.hpp"
#include "scratch/scratch_file.hpp"

#include <string>
#include <vector>

// Renders an HTML page through wkhtmltopdf. The HTML intermediate lives in a
// scratch file for the duration of the call.
class PdfEncoder : public DocumentEncoder {
public:
    PdfEncoder(Config::Render config, ScratchTracker& scratch);

    std::expected<void, std::string> encode(const std::string& text,
                                            const std::string& timestamp,
                                            const std::filesystem::path& out) override;

private:
    std::expected<void, std::string> run(const std::vector<std::string>& args);

    Config::Render config_;
    ScratchTracker& scratch_;
};

std::string html_escape(const std::string& text);

std::string build_html(const std::string& title, const std::string& text,
                       const std::string& timestamp);
