#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("telegram")) {
            auto& t = j["telegram"];
            if (t.contains("token")) cfg.telegram.token = t["token"].get<std::string>();
            if (t.contains("api_url")) cfg.telegram.api_url = t["api_url"].get<std::string>();
            if (t.contains("poll_timeout")) cfg.telegram.poll_timeout = t["poll_timeout"].get<uint32_t>();
            if (t.contains("request_timeout")) cfg.telegram.request_timeout = t["request_timeout"].get<uint32_t>();
            if (t.contains("max_download_bytes"))
                cfg.telegram.max_download_bytes = t["max_download_bytes"].get<uint64_t>();
        }

        if (j.contains("transcriber")) {
            auto& b = j["transcriber"];
            if (b.contains("url")) cfg.transcriber.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.transcriber.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) cfg.transcriber.language = b["language"].get<std::string>();
            if (b.contains("beam_size")) cfg.transcriber.beam_size = b["beam_size"].get<uint32_t>();
            if (b.contains("timeout")) cfg.transcriber.timeout = b["timeout"].get<uint32_t>();
        }

        if (j.contains("correction")) {
            auto& c = j["correction"];
            if (c.contains("url")) cfg.correction.url = c["url"].get<std::string>();
            if (c.contains("timeout")) cfg.correction.timeout = c["timeout"].get<uint32_t>();
            if (c.contains("languages")) {
                cfg.correction.languages = c["languages"].get<std::map<std::string, std::string>>();
            }
        }

        if (j.contains("render")) {
            auto& r = j["render"];
            if (r.contains("wkhtmltopdf")) cfg.render.wkhtmltopdf = r["wkhtmltopdf"].get<std::string>();
            if (r.contains("title")) cfg.render.title = r["title"].get<std::string>();
            if (r.contains("timeout")) cfg.render.timeout = r["timeout"].get<uint32_t>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("idle_timeout")) cfg.session.idle_timeout = s["idle_timeout"].get<uint32_t>();
            if (s.contains("reap_interval")) cfg.session.reap_interval = s["reap_interval"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("scratch_dir")) cfg.storage.scratch_dir = s["scratch_dir"].get<std::string>();
            if (s.contains("history")) cfg.storage.history = s["history"].get<bool>();
        }

        if (j.contains("workers")) {
            cfg.workers = j["workers"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.workers == 0) cfg.workers = 1;
    if (cfg.session.reap_interval == 0) cfg.session.reap_interval = 60;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_environment() {
    const char* token = std::getenv("BOT_TOKEN");
    if (token && *token) telegram.token = token;
}
