#include <svgrsx/core/config.h>
#include <svgrsx/core/diagnostics.h>
#include <svgrsx/core/error.h>
#include <svgrsx/core/file_io.h>
#include <svgrsx/engine/converter.h>

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_usage(std::ostream& stream) {
    stream << "usage: " << svgrsx::core::config::kProgramName
           << " [options] <input> [output]\n"
           << "  --typst               compile <input> with the external compiler first\n"
           << "  --compiler=PROGRAM    external compiler program (default: "
           << svgrsx::core::config::kDefaultCompilerProgram << ")\n"
           << "  --work-dir=DIR        directory for the intermediate SVG (default: "
           << svgrsx::core::config::kDefaultWorkDirectory << ")\n"
           << "  --indent=N            indent width (default: "
           << svgrsx::core::config::kDefaultIndentWidth << ")\n"
           << "  --compact             single-line output\n"
           << "  --trim-whitespace     drop whitespace-only text nodes\n"
           << "  -v, --verbose         print diagnostics to stderr\n"
           << "  -h, --help            show this help\n"
           << "  -V, --version         show version\n";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_indent(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }

    std::size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end ||
        parsed > svgrsx::core::config::kMaxIndentWidth) {
        return false;
    }

    value = parsed;
    return true;
}

struct CliOptions {
    svgrsx::engine::ConverterOptions converter;
    std::string input;
    std::string output;
    bool typst = false;
    bool verbose = false;
};

enum class ParseOutcome { Run, Help, Version, Invalid };

ParseOutcome parse_arguments(int argc, char** argv, CliOptions& options) {
    std::vector<std::string_view> positional_args;
    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
        if (argument == "-h" || argument == "--help") {
            return ParseOutcome::Help;
        }
        if (argument == "-V" || argument == "--version") {
            return ParseOutcome::Version;
        }
        if (argument == "-v" || argument == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (argument == "--typst") {
            options.typst = true;
            continue;
        }
        if (argument == "--compact") {
            options.converter.emit.compact = true;
            continue;
        }
        if (argument == "--trim-whitespace") {
            options.converter.emit.skip_whitespace_text = true;
            continue;
        }
        if (starts_with(argument, "--compiler=")) {
            options.converter.compiler_program =
                std::string(argument.substr(std::string_view("--compiler=").size()));
            if (options.converter.compiler_program.empty()) {
                std::cerr << "Invalid --compiler: program name is empty\n";
                return ParseOutcome::Invalid;
            }
            continue;
        }
        if (starts_with(argument, "--work-dir=")) {
            const std::string_view dir = argument.substr(std::string_view("--work-dir=").size());
            if (dir.empty()) {
                std::cerr << "Invalid --work-dir: directory is empty\n";
                return ParseOutcome::Invalid;
            }
            options.converter.work_directory = std::string(dir);
            continue;
        }
        if (starts_with(argument, "--indent=")) {
            const std::string_view value = argument.substr(std::string_view("--indent=").size());
            if (!parse_indent(value, options.converter.emit.indent_width)) {
                std::cerr << "Invalid --indent: '" << value << "' (expected 0-"
                          << svgrsx::core::config::kMaxIndentWidth << ")\n";
                return ParseOutcome::Invalid;
            }
            continue;
        }
        if (starts_with(argument, "-") && argument.size() > 1) {
            std::cerr << "Unknown option: " << argument << "\n";
            return ParseOutcome::Invalid;
        }
        positional_args.push_back(argument);
    }

    if (positional_args.empty() || positional_args.size() > 2) {
        return ParseOutcome::Invalid;
    }
    options.input = std::string(positional_args[0]);
    if (positional_args.size() == 2) {
        options.output = std::string(positional_args[1]);
    }
    return ParseOutcome::Run;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    switch (parse_arguments(argc, argv, options)) {
        case ParseOutcome::Help:
            print_usage(std::cout);
            return 0;
        case ParseOutcome::Version:
            std::cout << svgrsx::core::config::kVersionString << "\n";
            return 0;
        case ParseOutcome::Invalid:
            print_usage(std::cerr);
            return 1;
        case ParseOutcome::Run:
            break;
    }

    svgrsx::engine::Converter converter(options.converter);
    if (options.verbose) {
        converter.diagnostics().set_min_severity(svgrsx::core::Severity::Debug);
        converter.diagnostics().add_observer([](const svgrsx::core::DiagnosticEvent& event) {
            std::cerr << svgrsx::core::format_diagnostic(event) << "\n";
        });
    }

    const svgrsx::engine::ConvertResult result =
        options.typst ? converter.convert_document(options.input)
                      : converter.convert_svg_file(options.input);

    if (!result.ok) {
        std::cerr << "error: " << svgrsx::engine::stage_name(result.stage) << ": "
                  << svgrsx::core::format_error(*result.error) << "\n";
        return 1;
    }

    if (options.output.empty()) {
        std::cout << result.output << "\n";
        return 0;
    }

    std::string err;
    if (!svgrsx::core::write_text_file(options.output, result.output + "\n", err)) {
        std::cerr << "error: write: " << err << "\n";
        return 1;
    }
    return 0;
}
