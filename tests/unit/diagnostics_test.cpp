#include <svgrsx/core/diagnostics.h>
#include <svgrsx/core/error.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace svgrsx::core;

TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Debug), "debug");
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(Diagnostics, EmitRecordsAllFields) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Error, "xml", "parse", "unexpected end of input");
    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "xml");
    EXPECT_EQ(e.stage, "parse");
    EXPECT_EQ(e.message, "unexpected end of input");
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(Diagnostics, FormatDiagnostic) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "emit";
    event.stage = "render";
    event.message = "whitespace dropped";
    EXPECT_EQ(format_diagnostic(event), "[warning] emit/render: whitespace dropped");

    event.stage.clear();
    EXPECT_EQ(format_diagnostic(event), "[warning] emit: whitespace dropped");
}

TEST(Diagnostics, MinSeverityFilters) {
    DiagnosticEmitter emitter;
    EXPECT_EQ(emitter.min_severity(), Severity::Info);
    emitter.debug("engine", "idle", "hidden");
    EXPECT_EQ(emitter.size(), 0u);

    emitter.set_min_severity(Severity::Debug);
    emitter.debug("engine", "idle", "shown");
    EXPECT_EQ(emitter.size(), 1u);

    emitter.set_min_severity(Severity::Error);
    emitter.warning("engine", "parse", "hidden");
    emitter.error("engine", "parse", "shown");
    EXPECT_EQ(emitter.size(), 2u);
}

TEST(Diagnostics, ObserversSeeEveryAcceptedEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.info("engine", "parse", "one");
    emitter.debug("engine", "parse", "filtered");
    emitter.warning("engine", "parse", "two");
    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two"}));
}

TEST(Diagnostics, QueriesBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.info("xml", "parse", "a");
    emitter.error("engine", "parse", "b");
    emitter.info("emit", "render", "c");
    EXPECT_EQ(emitter.events_by_severity(Severity::Info).size(), 2u);
    ASSERT_EQ(emitter.events_by_module("engine").size(), 1u);
    EXPECT_EQ(emitter.events_by_module("engine")[0].message, "b");

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(ErrorFormat, KindNamesAreStable) {
    EXPECT_STREQ(error_kind_name(ErrorKind::ExternalCompileFailed), "external-compile-failed");
    EXPECT_STREQ(error_kind_name(ErrorKind::MalformedXml), "malformed-xml");
    EXPECT_STREQ(error_kind_name(ErrorKind::MismatchedTag), "mismatched-tag");
    EXPECT_STREQ(error_kind_name(ErrorKind::UnclosedElement), "unclosed-element");
    EXPECT_STREQ(error_kind_name(ErrorKind::NoRootElement), "no-root-element");
    EXPECT_STREQ(error_kind_name(ErrorKind::MultipleRootElements), "multiple-root-elements");
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidEntity), "invalid-entity");
}

TEST(ErrorFormat, IncludesPositionWhenKnown) {
    auto error = ConvertError::at(ErrorKind::MismatchedTag, SourcePosition{8, 1, 9},
                                  "expected </a> but found </b>", "b");
    EXPECT_EQ(format_error(error), "mismatched-tag at 1:9: expected </a> but found </b>");

    auto read = ConvertError::at(ErrorKind::ReadFailed, SourcePosition{},
                                 "Unable to open file: x.svg", "x.svg");
    EXPECT_EQ(format_error(read), "read-failed: Unable to open file: x.svg");
}

TEST(ErrorFormat, CompileFailureAppendsCapturedOutput) {
    auto error = ConvertError::at(ErrorKind::ExternalCompileFailed, SourcePosition{},
                                  "typst exited with status 1", "error: unknown variable: x");
    error.exit_code = 1;
    EXPECT_EQ(format_error(error),
              "external-compile-failed: typst exited with status 1\n"
              "error: unknown variable: x");
}
