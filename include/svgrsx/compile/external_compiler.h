#pragma once
#include <svgrsx/core/config.h>
#include <svgrsx/core/error.h>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace svgrsx::compile {

struct CompileResult {
    bool ok = false;
    std::filesystem::path svg_path;
    // Combined stdout and stderr of the compiler process.
    std::string captured_output;
    int exit_code = 0;
    std::optional<core::ConvertError> error;
};

// Runs "<program> compile <input> <output>" and waits for it. The call
// blocks; callers that need a timeout or retry wrap it themselves.
class ExternalCompiler {
public:
    explicit ExternalCompiler(std::string program = core::config::kDefaultCompilerProgram);

    CompileResult compile(const std::filesystem::path& input,
                          const std::filesystem::path& output) const;

    std::string command_line(const std::filesystem::path& input,
                             const std::filesystem::path& output) const;

    const std::string& program() const { return program_; }

private:
    std::string program_;
};

// Single-quotes an argument for /bin/sh.
std::string quote_shell_argument(std::string_view arg);

} // namespace svgrsx::compile
