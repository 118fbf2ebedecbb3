#ifndef SVGRSX_CORE_CONFIG_H
#define SVGRSX_CORE_CONFIG_H

#include <cstddef>

namespace svgrsx::core::config {

inline constexpr const char kProgramName[] = "svgrsx";
inline constexpr const char kVersionString[] = "svgrsx 0.1.0";

inline constexpr const char kDefaultCompilerProgram[] = "typst";
inline constexpr const char kDefaultWorkDirectory[] = "./temp";
inline constexpr const char kIntermediateExtension[] = ".svg";

inline constexpr std::size_t kDefaultIndentWidth = 4;
inline constexpr std::size_t kMaxIndentWidth = 16;

}  // namespace svgrsx::core::config

#endif  // SVGRSX_CORE_CONFIG_H
