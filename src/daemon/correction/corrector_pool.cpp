#include "corrector_pool.hpp"

#include <exception>

CorrectorPool::CorrectorPool(Factory factory) : factory_(std::move(factory)) {}

std::expected<std::string, std::string>
CorrectorPool::correct(const std::string& text, const std::string& language) {
    auto slot = slot_for(language);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    std::lock_guard lock((*slot)->mutex);
    try {
        auto& corrector = *(*slot)->corrector;
        if (corrector.language() != language) {
            corrector.set_language(language);
        }
        return corrector.correct(text);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("correction failed: ") + e.what());
    }
}

size_t CorrectorPool::instance_count() const {
    std::lock_guard lock(slots_mutex_);
    return slots_.size();
}

std::expected<CorrectorPool::Slot*, std::string>
CorrectorPool::slot_for(const std::string& language) {
    std::lock_guard lock(slots_mutex_);
    auto it = slots_.find(language);
    if (it != slots_.end()) return it->second.get();

    auto slot = std::make_unique<Slot>();
    try {
        slot->corrector = factory_();
    } catch (const std::exception& e) {
        return std::unexpected(std::string("cannot create corrector: ") + e.what());
    }
    if (!slot->corrector) {
        return std::unexpected("cannot create corrector for language " + language);
    }
    slot->corrector->set_language(language);

    auto* raw = slot.get();
    slots_.emplace(language, std::move(slot));
    return raw;
}
