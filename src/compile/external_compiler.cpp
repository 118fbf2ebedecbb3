#include <svgrsx/compile/external_compiler.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <utility>

namespace svgrsx::compile {

namespace {

// /bin/sh reports a missing program with this status.
constexpr int kCommandNotFound = 127;

CompileResult failure(CompileResult result, std::string message) {
    result.ok = false;
    auto error = core::ConvertError::at(core::ErrorKind::ExternalCompileFailed,
                                        core::SourcePosition{}, std::move(message),
                                        result.captured_output);
    error.exit_code = result.exit_code;
    result.error = std::move(error);
    return result;
}

} // namespace

std::string quote_shell_argument(std::string_view arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

ExternalCompiler::ExternalCompiler(std::string program) : program_(std::move(program)) {}

std::string ExternalCompiler::command_line(const std::filesystem::path& input,
                                           const std::filesystem::path& output) const {
    return quote_shell_argument(program_) + " compile " +
           quote_shell_argument(input.string()) + " " +
           quote_shell_argument(output.string()) + " 2>&1";
}

CompileResult ExternalCompiler::compile(const std::filesystem::path& input,
                                        const std::filesystem::path& output) const {
    CompileResult result;
    result.svg_path = output;

    if (program_.empty()) {
        return failure(std::move(result), "no compiler program configured");
    }

    const auto parent = output.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return failure(std::move(result),
                           "cannot create output directory " + parent.string() + ": " + ec.message());
        }
    }

    const std::string command = command_line(input, output);
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return failure(std::move(result),
                       "failed to start " + program_ + ": " + std::strerror(errno));
    }

    char buffer[4096];
    size_t bytes_read;
    while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.captured_output.append(buffer, bytes_read);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return failure(std::move(result),
                       "failed to wait for " + program_ + ": " + std::strerror(errno));
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exit_code == kCommandNotFound) {
        return failure(std::move(result), "compiler program '" + program_ + "' was not found");
    }
    if (result.exit_code != 0) {
        return failure(std::move(result),
                       program_ + " exited with status " + std::to_string(result.exit_code));
    }

    std::error_code ec;
    if (!std::filesystem::exists(output, ec)) {
        return failure(std::move(result),
                       program_ + " succeeded but produced no file at " + output.string());
    }

    result.ok = true;
    return result;
}

} // namespace svgrsx::compile
