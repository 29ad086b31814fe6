#include "document_renderer.hpp"

#include "utf8.hpp"

#include <ctime>
#include <exception>

std::optional<OutputFormat> format_from_signal(std::string_view signal) {
    if (signal == "fmt_msg") return OutputFormat::Inline;
    if (signal == "fmt_txt") return OutputFormat::Txt;
    if (signal == "fmt_docx") return OutputFormat::Docx;
    if (signal == "fmt_pdf") return OutputFormat::Pdf;
    return std::nullopt;
}

std::string_view format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Inline: return "inline";
        case OutputFormat::Txt: return "txt";
        case OutputFormat::Docx: return "docx";
        case OutputFormat::Pdf: return "pdf";
    }
    return "unknown";
}

std::vector<std::string> split_for_messages(const std::string& text) {
    return utf8::split(text, kMaxMessageChars);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return std::string(buf, n);
}

DocumentRenderer::DocumentRenderer(ScratchTracker& scratch,
                                   std::unique_ptr<DocumentEncoder> txt,
                                   std::unique_ptr<DocumentEncoder> docx,
                                   std::unique_ptr<DocumentEncoder> pdf)
    : scratch_(scratch), txt_(std::move(txt)), docx_(std::move(docx)), pdf_(std::move(pdf)) {}

std::expected<RenderedDocument, std::string>
DocumentRenderer::render(const std::string& text, OutputFormat format,
                         const std::string& timestamp) {
    DocumentEncoder* encoder = nullptr;
    std::string suffix;
    switch (format) {
        case OutputFormat::Txt: encoder = txt_.get(); suffix = ".txt"; break;
        case OutputFormat::Docx: encoder = docx_.get(); suffix = ".docx"; break;
        case OutputFormat::Pdf: encoder = pdf_.get(); suffix = ".pdf"; break;
        case OutputFormat::Inline: break;
    }
    if (!encoder) {
        return std::unexpected("no document encoder for format " + std::string(format_name(format)));
    }

    auto file = scratch_.create(suffix);
    if (!file) {
        return std::unexpected(file.error());
    }

    std::expected<void, std::string> res;
    try {
        res = encoder->encode(text, timestamp, file->path());
    } catch (const std::exception& e) {
        res = std::unexpected(std::string(e.what()));
    }
    if (!res) {
        return std::unexpected(res.error());
    }

    return RenderedDocument{
        .file = std::move(*file),
        .display_name = "transcript" + suffix,
    };
}
