#include <svgrsx/engine/converter.h>

#include <svgrsx/compile/external_compiler.h>
#include <svgrsx/core/file_io.h>
#include <svgrsx/xml/tree_builder.h>

#include <utility>

namespace svgrsx::engine {

namespace {

constexpr const char kModule[] = "engine";

}  // namespace

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Idle:      return "idle";
        case Stage::Compiling: return "compile";
        case Stage::Reading:   return "read";
        case Stage::Parsing:   return "parse";
        case Stage::Rendering: return "render";
        case Stage::Complete:  return "complete";
        case Stage::Error:     return "error";
    }
    return "unknown";
}

Converter::Converter(ConverterOptions options) : options_(std::move(options)) {}

void Converter::transition_to(Stage stage, const std::string& detail) {
    stage_ = stage;
    std::string message = std::string("Stage transition: ") + stage_name(stage);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    diagnostics_.debug(kModule, stage_name(stage), message);
}

void Converter::begin_conversion() {
    diagnostics_.clear();
    transition_to(Stage::Idle);
}

ConvertResult Converter::fail(core::ConvertError error) {
    ConvertResult result;
    result.ok = false;
    result.stage = stage_;
    diagnostics_.error(kModule, stage_name(stage_), core::format_error(error));
    result.error = std::move(error);
    stage_ = Stage::Error;
    return result;
}

ConvertResult Converter::parse_and_render(std::string_view svg) {
    transition_to(Stage::Parsing, std::to_string(svg.size()) + " bytes");
    xml::ParseResult parsed = xml::parse(svg);
    if (!parsed.ok()) {
        return fail(std::move(*parsed.error));
    }

    ConvertResult result;
    result.element_count = parsed.root->element_count();
    diagnostics_.info("xml", stage_name(stage_),
                      "Parsed <" + parsed.root->tag_name + "> with " +
                          std::to_string(result.element_count) + " elements");

    transition_to(Stage::Rendering);
    emit::RsxEmitter emitter(options_.emit);
    result.output = emitter.render(*parsed.root);
    diagnostics_.info("emit", stage_name(stage_),
                      "Rendered " + std::to_string(result.output.size()) + " bytes");

    transition_to(Stage::Complete);
    result.ok = true;
    result.stage = Stage::Complete;
    return result;
}

ConvertResult Converter::convert_svg(std::string_view svg) {
    begin_conversion();
    return parse_and_render(svg);
}

ConvertResult Converter::convert_svg_file(const std::filesystem::path& path) {
    begin_conversion();
    transition_to(Stage::Reading, path.string());

    std::string text;
    std::string err;
    if (!core::read_text_file(path, text, err)) {
        return fail(core::ConvertError::at(core::ErrorKind::ReadFailed, core::SourcePosition{},
                                           err, path.string()));
    }
    return parse_and_render(text);
}

std::filesystem::path Converter::intermediate_path(const std::filesystem::path& input) const {
    std::filesystem::path name = input.stem();
    name += core::config::kIntermediateExtension;
    return options_.work_directory / name;
}

ConvertResult Converter::convert_document(const std::filesystem::path& path) {
    begin_conversion();

    const std::filesystem::path svg_path = intermediate_path(path);
    transition_to(Stage::Compiling, path.string() + " -> " + svg_path.string());

    compile::ExternalCompiler compiler(options_.compiler_program);
    compile::CompileResult compiled = compiler.compile(path, svg_path);
    if (!compiled.captured_output.empty()) {
        diagnostics_.debug("compile", stage_name(stage_), compiled.captured_output);
    }
    if (!compiled.ok) {
        return fail(std::move(*compiled.error));
    }

    transition_to(Stage::Reading, svg_path.string());
    std::string text;
    std::string err;
    if (!core::read_text_file(svg_path, text, err)) {
        return fail(core::ConvertError::at(core::ErrorKind::ReadFailed, core::SourcePosition{},
                                           err, svg_path.string()));
    }
    return parse_and_render(text);
}

}  // namespace svgrsx::engine
