#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace svgrsx::core {

bool read_text_file(const std::filesystem::path& path,
                    std::string& out_text,
                    std::string& err);

bool write_text_file(const std::filesystem::path& path,
                     std::string_view text,
                     std::string& err);

}  // namespace svgrsx::core
