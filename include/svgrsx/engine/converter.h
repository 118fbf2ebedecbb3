#pragma once

#include <svgrsx/core/config.h>
#include <svgrsx/core/diagnostics.h>
#include <svgrsx/core/error.h>
#include <svgrsx/emit/rsx_emitter.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace svgrsx::engine {

enum class Stage {
    Idle,
    Compiling,
    Reading,
    Parsing,
    Rendering,
    Complete,
    Error,
};

const char* stage_name(Stage stage);

struct ConverterOptions {
    emit::EmitOptions emit;
    std::string compiler_program = core::config::kDefaultCompilerProgram;
    std::filesystem::path work_directory = core::config::kDefaultWorkDirectory;
};

struct ConvertResult {
    bool ok = false;
    std::string output;
    std::optional<core::ConvertError> error;
    // Stage that produced the error; Complete on success.
    Stage stage = Stage::Idle;
    std::size_t element_count = 0;
};

// Runs one conversion at a time: optional external compile, read, parse,
// render. Each call starts from a clean state: the previous call's
// diagnostics are discarded, while the severity filter and observers stay.
// A call owns everything it builds, so separate Converter instances can run
// on separate threads.
class Converter {
public:
    explicit Converter(ConverterOptions options = {});

    ConvertResult convert_svg(std::string_view svg);

    ConvertResult convert_svg_file(const std::filesystem::path& path);

    // Compiles a Typst document to SVG under the work directory first.
    ConvertResult convert_document(const std::filesystem::path& path);

    // Where convert_document puts the intermediate SVG for this input.
    std::filesystem::path intermediate_path(const std::filesystem::path& input) const;

    const ConverterOptions& options() const { return options_; }
    Stage current_stage() const { return stage_; }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    ConverterOptions options_;
    core::DiagnosticEmitter diagnostics_;
    Stage stage_ = Stage::Idle;

    void begin_conversion();
    void transition_to(Stage stage, const std::string& detail = {});
    ConvertResult fail(core::ConvertError error);
    ConvertResult parse_and_render(std::string_view svg);
};

}  // namespace svgrsx::engine
