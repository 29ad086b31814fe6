#include "scratch_file.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPrefix = "vs-";

} // namespace

ScratchFile::ScratchFile(ScratchTracker* tracker, fs::path path)
    : tracker_(tracker), path_(std::move(path)) {}

ScratchFile::~ScratchFile() {
    release();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept
    : tracker_(other.tracker_), path_(std::move(other.path_)) {
    other.tracker_ = nullptr;
    other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
    if (this != &other) {
        release();
        tracker_ = other.tracker_;
        path_ = std::move(other.path_);
        other.tracker_ = nullptr;
        other.path_.clear();
    }
    return *this;
}

bool ScratchFile::release() {
    if (!tracker_) return false;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "scratch: failed to remove {}: {}", path_.string(), ec.message());
    }

    tracker_->on_release(path_);
    tracker_ = nullptr;
    path_.clear();
    return true;
}

ScratchTracker::ScratchTracker(fs::path dir) : dir_(std::move(dir)) {}

bool ScratchTracker::init() {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        std::println(stderr, "scratch: cannot create {}: {}", dir_.string(), ec.message());
        return false;
    }

    // Leftovers from a run that died before cleanup.
    for (auto& entry : fs::directory_iterator(dir_, ec)) {
        auto name = entry.path().filename().string();
        if (!name.starts_with(kPrefix)) continue;
        std::error_code rm_ec;
        fs::remove(entry.path(), rm_ec);
        if (rm_ec) {
            std::println(stderr, "scratch: failed to sweep {}: {}", name, rm_ec.message());
        }
    }
    if (ec) {
        std::println(stderr, "scratch: cannot list {}: {}", dir_.string(), ec.message());
        return false;
    }
    return true;
}

std::expected<ScratchFile, std::string> ScratchTracker::create(const std::string& suffix) {
    std::string pattern = (dir_ / kPrefix).string() + "XXXXXX" + suffix;
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');

    int fd = ::mkstemps(tmpl.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(std::string("cannot create scratch file: ") + std::strerror(errno));
    }
    ::close(fd);

    fs::path path(tmpl.data());
    {
        std::lock_guard lock(mutex_);
        live_.insert(path.string());
        ++created_;
    }
    return ScratchFile(this, std::move(path));
}

size_t ScratchTracker::live_count() const {
    std::lock_guard lock(mutex_);
    return live_.size();
}

size_t ScratchTracker::created_count() const {
    std::lock_guard lock(mutex_);
    return created_;
}

size_t ScratchTracker::released_count() const {
    std::lock_guard lock(mutex_);
    return released_;
}

void ScratchTracker::on_release(const fs::path& path) {
    std::lock_guard lock(mutex_);
    live_.erase(path.string());
    ++released_;
}
