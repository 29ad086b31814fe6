#include <catch2/catch_test_macros.hpp>

#include "render/document_renderer.hpp"
#include "render/docx_encoder.hpp"
#include "render/pdf_encoder.hpp"
#include "render/txt_encoder.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& tag = "render") {
        path = std::filesystem::temp_directory_path() /
               ("vs_test_" + tag + "_" + std::to_string(getpid()));
        std::filesystem::create_directories(path);
    }

    ~TmpDir() { std::filesystem::remove_all(path); }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

class ThrowingEncoder : public DocumentEncoder {
public:
    std::expected<void, std::string> encode(const std::string&, const std::string&,
                                            const std::filesystem::path&) override {
        throw std::runtime_error("encoder exploded");
    }
};

class FailingEncoder : public DocumentEncoder {
public:
    std::expected<void, std::string> encode(const std::string&, const std::string&,
                                            const std::filesystem::path&) override {
        return std::unexpected("disk full");
    }
};

Config::Render missing_pdf_tool() {
    Config::Render cfg;
    cfg.wkhtmltopdf = "/nonexistent/vs-wkhtmltopdf";
    cfg.timeout = 5;
    return cfg;
}

// Executable shell script standing in for wkhtmltopdf.
Config::Render script_pdf_tool(const std::filesystem::path& path, const std::string& body,
                               int timeout = 5) {
    {
        std::ofstream f(path, std::ios::binary);
        f << "#!/bin/sh\n" << body;
    }
    namespace fs = std::filesystem;
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec);
    Config::Render cfg;
    cfg.wkhtmltopdf = path.string();
    cfg.timeout = timeout;
    return cfg;
}

// Last two arguments are the HTML input and the output path.
constexpr const char* kCopyHtmlScript =
    "n=$#\n"
    "eval \"html=\\${$((n - 1))}\"\n"
    "eval \"out=\\${$n}\"\n"
    "cp \"$html\" \"$out\"\n";

} // namespace

TEST_CASE("Format signals", "[render]") {
    REQUIRE(format_from_signal("fmt_msg") == OutputFormat::Inline);
    REQUIRE(format_from_signal("fmt_txt") == OutputFormat::Txt);
    REQUIRE(format_from_signal("fmt_docx") == OutputFormat::Docx);
    REQUIRE(format_from_signal("fmt_pdf") == OutputFormat::Pdf);
    REQUIRE_FALSE(format_from_signal("fmt_rtf"));
    REQUIRE_FALSE(format_from_signal("corr_yes"));
    REQUIRE(format_name(OutputFormat::Docx) == "docx");
}

TEST_CASE("Timestamp format", "[render]") {
    auto ts = format_timestamp(std::chrono::system_clock::now());
    REQUIRE(ts.size() == 16);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[7] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[13] == ':');
}

TEST_CASE("DocumentRenderer", "[render]") {
    TmpDir dir;
    ScratchTracker scratch(dir.path);
    REQUIRE(scratch.init());

    DocumentRenderer renderer(scratch,
                              std::make_unique<TxtEncoder>(),
                              std::make_unique<DocxEncoder>("Audio transcript"),
                              std::make_unique<PdfEncoder>(missing_pdf_tool(), scratch));

    SECTION("TxtIsExactText") {
        auto doc = renderer.render("hello world", OutputFormat::Txt, "2024-01-01 10:00");
        REQUIRE(doc);
        REQUIRE(doc->display_name == "transcript.txt");
        REQUIRE(read_file(doc->file.path()) == "hello world");
    }

    SECTION("TxtKeepsUnicode") {
        auto doc = renderer.render("Привет, мир! 😀", OutputFormat::Txt, "ts");
        REQUIRE(doc);
        REQUIRE(read_file(doc->file.path()) == "Привет, мир! 😀");
    }

    SECTION("DocxIsZipWithTitleAndText") {
        auto doc = renderer.render("first line\nsecond & last", OutputFormat::Docx, "2024-01-01 10:00");
        REQUIRE(doc);
        REQUIRE(doc->display_name == "transcript.docx");

        auto bytes = read_file(doc->file.path());
        REQUIRE(bytes.starts_with("PK\x03\x04"));
        // Entries are stored uncompressed, so the XML is visible in the archive
        REQUIRE(bytes.find("word/document.xml") != std::string::npos);
        REQUIRE(bytes.find("[Content_Types].xml") != std::string::npos);
        REQUIRE(bytes.find("Audio transcript") != std::string::npos);
        REQUIRE(bytes.find("first line") != std::string::npos);
        REQUIRE(bytes.find("second &amp; last") != std::string::npos);
        REQUIRE(bytes.find("Generated: 2024-01-01 10:00") != std::string::npos);
    }

    SECTION("DocxIsDeterministic") {
        auto a = renderer.render("same text", OutputFormat::Docx, "2024-01-01 10:00");
        auto b = renderer.render("same text", OutputFormat::Docx, "2024-01-01 10:00");
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(a->file.path() != b->file.path());
        REQUIRE(read_file(a->file.path()) == read_file(b->file.path()));
    }

    SECTION("InlineRefused") {
        auto doc = renderer.render("text", OutputFormat::Inline, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(scratch.created_count() == 0);
    }

    SECTION("PdfWithoutToolFailsCleanly") {
        auto doc = renderer.render("text", OutputFormat::Pdf, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error().find("wkhtmltopdf") != std::string::npos);
        // Neither the HTML intermediate nor the output survive
        REQUIRE(scratch.live_count() == 0);
        REQUIRE(std::filesystem::is_empty(dir.path));
    }

    SECTION("ReleasedDocumentIsRemoved") {
        auto doc = renderer.render("bye", OutputFormat::Txt, "ts");
        REQUIRE(doc);
        auto path = doc->file.path();
        REQUIRE(doc->file.release());
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(scratch.live_count() == 0);
    }
}

TEST_CASE("PdfEncoder runs the converter", "[render][pdf]") {
    TmpDir dir;
    TmpDir tools("pdftool");
    ScratchTracker scratch(dir.path);
    REQUIRE(scratch.init());

    SECTION("OutputDelivered") {
        DocumentRenderer renderer(scratch, nullptr, nullptr,
                                  std::make_unique<PdfEncoder>(
                                      script_pdf_tool(tools.path / "copy.sh", kCopyHtmlScript),
                                      scratch));
        auto doc = renderer.render("fish & chips", OutputFormat::Pdf, "2024-01-01 10:00");
        REQUIRE(doc);
        REQUIRE(doc->display_name == "transcript.pdf");

        auto content = read_file(doc->file.path());
        REQUIRE(content.find("fish &amp; chips") != std::string::npos);
        REQUIRE(content.find("Generated: 2024-01-01 10:00") != std::string::npos);

        // The HTML intermediate is gone already; only the document is live
        REQUIRE(scratch.created_count() == 2);
        REQUIRE(scratch.live_count() == 1);

        REQUIRE(doc->file.release());
        REQUIRE(scratch.live_count() == 0);
        REQUIRE(std::filesystem::is_empty(dir.path));
    }

    SECTION("EmptyOutputIsError") {
        DocumentRenderer renderer(scratch, nullptr, nullptr,
                                  std::make_unique<PdfEncoder>(
                                      script_pdf_tool(tools.path / "noop.sh", "exit 0\n"),
                                      scratch));
        auto doc = renderer.render("text", OutputFormat::Pdf, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "wkhtmltopdf produced no output");
        REQUIRE(scratch.live_count() == 0);
        REQUIRE(std::filesystem::is_empty(dir.path));
    }

    SECTION("NonZeroExitIsError") {
        DocumentRenderer renderer(scratch, nullptr, nullptr,
                                  std::make_unique<PdfEncoder>(
                                      script_pdf_tool(tools.path / "fail.sh", "exit 3\n"),
                                      scratch));
        auto doc = renderer.render("text", OutputFormat::Pdf, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "wkhtmltopdf exited with code 3");
        REQUIRE(scratch.live_count() == 0);
    }

    SECTION("HungConverterIsKilled") {
        DocumentRenderer renderer(scratch, nullptr, nullptr,
                                  std::make_unique<PdfEncoder>(
                                      script_pdf_tool(tools.path / "hang.sh", "exec sleep 10\n", 1),
                                      scratch));
        auto started = std::chrono::steady_clock::now();
        auto doc = renderer.render("text", OutputFormat::Pdf, "ts");
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "wkhtmltopdf timed out");
        REQUIRE(elapsed < std::chrono::seconds(5));
        REQUIRE(scratch.live_count() == 0);
        REQUIRE(std::filesystem::is_empty(dir.path));

        // The killed child has been reaped
        errno = 0;
        REQUIRE(waitpid(-1, nullptr, WNOHANG) == -1);
        REQUIRE(errno == ECHILD);
    }
}

TEST_CASE("DocumentRenderer encoder failures", "[render]") {
    TmpDir dir;
    ScratchTracker scratch(dir.path);
    REQUIRE(scratch.init());

    DocumentRenderer renderer(scratch,
                              std::make_unique<FailingEncoder>(),
                              std::make_unique<ThrowingEncoder>(),
                              nullptr);

    SECTION("ErrorLeavesNoFile") {
        auto doc = renderer.render("text", OutputFormat::Txt, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "disk full");
        REQUIRE(scratch.live_count() == 0);
        REQUIRE(scratch.released_count() == 1);
    }

    SECTION("ExceptionBecomesError") {
        auto doc = renderer.render("text", OutputFormat::Docx, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "encoder exploded");
        REQUIRE(scratch.live_count() == 0);
    }

    SECTION("MissingEncoderIsError") {
        auto doc = renderer.render("text", OutputFormat::Pdf, "ts");
        REQUIRE_FALSE(doc);
        REQUIRE(scratch.created_count() == 0);
    }
}

TEST_CASE("Markup escaping", "[render]") {
    REQUIRE(html_escape("<b>\"A&B\"</b>") == "&lt;b&gt;&quot;A&amp;B&quot;&lt;/b&gt;");
    REQUIRE(xml_escape("a<b>&'c'") == "a&lt;b&gt;&amp;&apos;c&apos;");
    // Control characters XML cannot carry are dropped
    REQUIRE(xml_escape(std::string("a\x01" "b\tc")) == "ab\tc");

    auto html = build_html("Title & Co", "line <1>", "2024-01-01 10:00");
    REQUIRE(html.find("<h1>Title &amp; Co</h1>") != std::string::npos);
    REQUIRE(html.find("line &lt;1&gt;") != std::string::npos);
    REQUIRE(html.find("Generated: 2024-01-01 10:00") != std::string::npos);

    auto xml = build_document_xml("T", "one\ntwo", "ts");
    REQUIRE(xml.find("<w:pStyle w:val=\"Title\"/>") != std::string::npos);
    REQUIRE(xml.find(">one</w:t>") != std::string::npos);
    REQUIRE(xml.find(">two</w:t>") != std::string::npos);
}
