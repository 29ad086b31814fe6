#pragma once

#include "corrector.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Hands out one Corrector per language. A corrector is created the first time
// its language is requested and stays pinned to it; calls for the same
// language are serialized, calls for different languages run in parallel.
class CorrectorPool {
public:
    using Factory = std::function<std::unique_ptr<Corrector>()>;

    explicit CorrectorPool(Factory factory);

    CorrectorPool(const CorrectorPool&) = delete;
    CorrectorPool& operator=(const CorrectorPool&) = delete;

    // Never throws; every engine fault comes back as an error string.
    std::expected<std::string, std::string> correct(const std::string& text,
                                                    const std::string& language);

    size_t instance_count() const;

private:
    struct Slot {
        std::mutex mutex;
        std::unique_ptr<Corrector> corrector;
    };

    std::expected<Slot*, std::string> slot_for(const std::string& language);

    Factory factory_;
    mutable std::mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};
