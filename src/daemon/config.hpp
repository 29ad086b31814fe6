#pragma once

#include <cstdint>
#include <map>
#include <string>

struct Config {
    struct Telegram {
        std::string token;
        std::string api_url = "https://api.telegram.org";
        uint32_t poll_timeout = 30;    // seconds, getUpdates long poll
        uint32_t request_timeout = 60; // seconds, every other call
        uint64_t max_download_bytes = 20 * 1024 * 1024;
    } telegram;

    struct Transcriber {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language;                    // empty: auto-detect
        uint32_t beam_size = 5;
        uint32_t timeout = 120;
    } transcriber;

    struct Correction {
        std::string url = "http://localhost:8081";
        uint32_t timeout = 30;
        // Detected language code -> LanguageTool language code.
        std::map<std::string, std::string> languages;
    } correction;

    struct Render {
        std::string wkhtmltopdf = "wkhtmltopdf";
        std::string title = "Audio transcript";
        uint32_t timeout = 60;
    } render;

    struct Session {
        uint32_t idle_timeout = 900; // seconds, 0 disables expiry
        uint32_t reap_interval = 60;
    } session;

    struct Storage {
        std::string scratch_dir; // empty: platform::scratch_dir()
        bool history = true;
    } storage;

    uint32_t workers = 4;

    static Config load(const std::string& path);
    static Config load_default();

    // BOT_TOKEN from the environment wins over the config file.
    void apply_environment();
};
