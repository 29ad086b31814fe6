#include "pdf_encoder.hpp"

#include "txt_encoder.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

PdfEncoder::PdfEncoder(Config::Render config, ScratchTracker& scratch)
    : config_(std::move(config)), scratch_(scratch) {}

std::expected<void, std::string> PdfEncoder::encode(const std::string& text,
                                                    const std::string& timestamp,
                                                    const std::filesystem::path& out) {
    auto html_file = scratch_.create(".html");
    if (!html_file) {
        return std::unexpected(html_file.error());
    }

    auto html = build_html(config_.title, text, timestamp);
    auto written = write_file(html_file->path(), html.data(), html.size());
    if (!written) return written;

    auto res = run({
        config_.wkhtmltopdf,
        "--quiet",
        "--encoding", "UTF-8",
        "--page-size", "A4",
        "--margin-top", "0.75in",
        "--margin-right", "0.75in",
        "--margin-bottom", "0.75in",
        "--margin-left", "0.75in",
        html_file->path().string(),
        out.string(),
    });
    if (!res) return res;

    std::error_code ec;
    if (std::filesystem::file_size(out, ec) == 0 || ec) {
        return std::unexpected("wkhtmltopdf produced no output");
    }
    return {};
}

std::expected<void, std::string> PdfEncoder::run(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: silence stdout, keep stderr for diagnostics
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.timeout);
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return std::unexpected("wkhtmltopdf timed out");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected("wkhtmltopdf killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected("wkhtmltopdf exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    return {};
}

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string build_html(const std::string& title, const std::string& text,
                       const std::string& timestamp) {
    std::string html;
    html += "<html>\n<head><meta charset=\"UTF-8\"></head>\n<body>\n";
    html += "<h1>" + html_escape(title) + "</h1>\n";
    html += "<pre style=\"white-space: pre-wrap; font-family: Arial, sans-serif;\">";
    html += html_escape(text);
    html += "</pre>\n";
    html += "<p><i>— Generated: " + html_escape(timestamp) + "</i></p>\n";
    html += "</body>\n</html>\n";
    return html;
}
