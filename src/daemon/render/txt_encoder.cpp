#include "txt_encoder.hpp"

#include <fstream>

std::expected<void, std::string> TxtEncoder::encode(const std::string& text,
                                                    const std::string& /*timestamp*/,
                                                    const std::filesystem::path& out) {
    return write_file(out, text.data(), text.size());
}

std::expected<void, std::string> write_file(const std::filesystem::path& out,
                                            const void* data, size_t size) {
    std::ofstream f(out, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + out.string() + " for writing");
    }
    f.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    f.close();
    if (!f) {
        return std::unexpected("failed to write " + out.string());
    }
    return {};
}
