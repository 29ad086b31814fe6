#pragma once

#include <expected>
#include <string>

// A grammar/style checker targeted at one language at a time. Instances are
// not thread-safe; CorrectorPool keeps them apart.
class Corrector {
public:
    virtual ~Corrector() = default;

    virtual void set_language(const std::string& language) = 0;
    virtual const std::string& language() const = 0;

    virtual std::expected<std::string, std::string> correct(const std::string& text) = 0;
};
