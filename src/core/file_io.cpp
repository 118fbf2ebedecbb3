#include <svgrsx/core/file_io.h>

#include <fstream>
#include <sstream>

namespace svgrsx::core {

bool read_text_file(const std::filesystem::path& path,
                    std::string& out_text,
                    std::string& err) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        err = "Unable to open file: " + path.string();
        return false;
    }

    std::ostringstream stream;
    stream << file.rdbuf();
    if (!file.good() && !file.eof()) {
        err = "Failed to read file: " + path.string();
        return false;
    }

    out_text = stream.str();
    return true;
}

bool write_text_file(const std::filesystem::path& path,
                     std::string_view text,
                     std::string& err) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        err = "Unable to open file for writing: " + path.string();
        return false;
    }

    output.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!output.good()) {
        err = "Failed to write file: " + path.string();
        return false;
    }
    return true;
}

}  // namespace svgrsx::core
