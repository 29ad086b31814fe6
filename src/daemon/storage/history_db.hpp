#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    int64_t chat_id = 0;
    std::string language;
    bool corrected = false;
    std::string format;
    std::string text;
    double audio_duration = 0.0;
    double processing_time = 0.0;
};

// Delivered transcripts. id and timestamp are assigned on insert.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int64_t chat_id, int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
