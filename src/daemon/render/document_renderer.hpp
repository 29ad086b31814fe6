#pragma once

#include "encoder.hpp"
#include "scratch/scratch_file.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class OutputFormat { Inline, Txt, Docx, Pdf };

// Longest single outbound message, in code points.
inline constexpr size_t kMaxMessageChars = 4096;

// Maps a format-choice signal ("fmt_msg", "fmt_txt", "fmt_docx", "fmt_pdf").
std::optional<OutputFormat> format_from_signal(std::string_view signal);
std::string_view format_name(OutputFormat format);

// Inline delivery: consecutive pieces of at most kMaxMessageChars code points.
std::vector<std::string> split_for_messages(const std::string& text);

// Footer timestamp, local time, "YYYY-MM-DD HH:MM".
std::string format_timestamp(std::chrono::system_clock::time_point tp);

struct RenderedDocument {
    ScratchFile file;          // owned by the caller from here on
    std::string display_name;  // attachment name shown to the user
};

class DocumentRenderer {
public:
    DocumentRenderer(ScratchTracker& scratch,
                     std::unique_ptr<DocumentEncoder> txt,
                     std::unique_ptr<DocumentEncoder> docx,
                     std::unique_ptr<DocumentEncoder> pdf);

    DocumentRenderer(const DocumentRenderer&) = delete;
    DocumentRenderer& operator=(const DocumentRenderer&) = delete;

    // Renders to a fresh scratch file. Inline is not a document format and
    // is refused. On failure nothing is left behind.
    std::expected<RenderedDocument, std::string>
        render(const std::string& text, OutputFormat format, const std::string& timestamp);

private:
    ScratchTracker& scratch_;
    std::unique_ptr<DocumentEncoder> txt_;
    std::unique_ptr<DocumentEncoder> docx_;
    std::unique_ptr<DocumentEncoder> pdf_;
};
