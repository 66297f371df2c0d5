#include "persist/json_cursor.hpp"

#include <fstream>

namespace persist {

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace persist
