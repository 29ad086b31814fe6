#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

class ScratchTracker;

// Exclusive owner of one scratch artifact on disk. The file is removed by
// release() or, failing that, by the destructor. Move-only.
class ScratchFile {
public:
    ScratchFile() = default;
    ~ScratchFile();

    ScratchFile(ScratchFile&& other) noexcept;
    ScratchFile& operator=(ScratchFile&& other) noexcept;

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    bool valid() const { return tracker_ != nullptr; }
    const std::filesystem::path& path() const { return path_; }

    // Removes the file and ends ownership. Returns false if there was nothing
    // left to release.
    bool release();

private:
    friend class ScratchTracker;
    ScratchFile(ScratchTracker* tracker, std::filesystem::path path);

    ScratchTracker* tracker_ = nullptr;
    std::filesystem::path path_;
};

// Creates scratch artifacts in one directory and keeps count of what is still
// alive. Safe to use from worker threads.
class ScratchTracker {
public:
    explicit ScratchTracker(std::filesystem::path dir);

    ScratchTracker(const ScratchTracker&) = delete;
    ScratchTracker& operator=(const ScratchTracker&) = delete;

    // Creates the directory and removes artifacts a previous run left behind.
    bool init();

    std::expected<ScratchFile, std::string> create(const std::string& suffix);

    const std::filesystem::path& dir() const { return dir_; }
    size_t live_count() const;
    size_t created_count() const;
    size_t released_count() const;

private:
    friend class ScratchFile;
    void on_release(const std::filesystem::path& path);

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
    std::set<std::string> live_;
    size_t created_ = 0;
    size_t released_ = 0;
};
