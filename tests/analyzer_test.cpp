#include <gtest/gtest.h>
#include "posixc/analyzer.hpp"
#include "test_util.hpp"
#include <string>

using namespace posixc;
using posixc_test::compile_source;
using posixc_test::dump;
using posixc_test::find_code;
using posixc_test::has_code;
using posixc_test::make_temp_dir;
using posixc_test::test_config;
using posixc_test::write_temp_file;

namespace {

const char* const kScript = "#!/bin/sh\nmain() {\n    :\n}\nmain \"$@\"\n";

// Stand-in analyzer: prints body on stdout, exits with status.
AnalyzerConfig fake_analyzer(const std::string& body, int status){
    const std::string dir = make_temp_dir();
    const std::string text = "#!/bin/sh\n" + body + "exit " + std::to_string(status) + "\n";
    AnalyzerConfig cfg;
    cfg.enabled = true;
    cfg.program = write_temp_file(dir, "fake-analyzer", text, true);
    cfg.timeout_seconds = 10;
    return cfg;
}

} // namespace

TEST(AnalyzerOutput, ParsesGccFormat){
    auto fs = parse_analyzer_output(
        "/tmp/a:b.sh:12:3: error: Couldn't parse this [SC1000]\n"
        "garbage line\n"
        "f.sh:4:1: warning: no code here\n");
    ASSERT_EQ(fs.size(), 2u);
    EXPECT_EQ(fs[0].line, 12);
    EXPECT_EQ(fs[0].col, 3);
    EXPECT_EQ(fs[0].severity, "error");
    EXPECT_EQ(fs[0].message, "Couldn't parse this");
    EXPECT_EQ(fs[0].code, "SC1000");
    EXPECT_EQ(fs[1].code, "");
    EXPECT_EQ(fs[1].message, "no code here");
    EXPECT_TRUE(parse_analyzer_output("").empty());
}

TEST(Analyzer, DisabledIsANoOp){
    AnalyzerConfig cfg;
    cfg.enabled = false;
    cfg.program = "posixc-no-such-analyzer";
    auto r = run_analyzer(cfg, kScript);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.diagnostics.empty());
}

TEST(Analyzer, CleanRunPasses){
    auto r = run_analyzer(fake_analyzer("", 0), kScript);
    EXPECT_TRUE(r.ok) << dump(r.diagnostics);
}

TEST(Analyzer, FindingsBecomeE0405){
    auto cfg = fake_analyzer("printf '%s\\n' \"$4:3:5: warning: Double quote to prevent globbing. [SC2086]\"\n", 1);
    auto r = run_analyzer(cfg, kScript);
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.diagnostics.size(), 1u) << dump(r.diagnostics);
    const auto& d = r.diagnostics[0];
    EXPECT_EQ(d.code, "E0405");
    EXPECT_EQ(d.kind, DiagnosticKind::ValidationFailure);
    EXPECT_EQ(d.span.line, 3);
    EXPECT_EQ(d.span.col, 5);
    EXPECT_EQ(d.message, "warning: Double quote to prevent globbing. [SC2086]");
}

TEST(Analyzer, ReceivesShellcheckArguments){
    auto cfg = fake_analyzer(
        "[ \"$1\" = --shell=sh ] && [ \"$2\" = --format=gcc ] && [ \"$3\" = --severity=style ] && [ -f \"$4\" ] || "
        "printf '%s\\n' \"x:1:1: error: bad arguments $* [SC0000]\"\n", 0);
    cfg.severity = "style";
    auto r = run_analyzer(cfg, kScript);
    EXPECT_TRUE(r.ok) << dump(r.diagnostics);
}

TEST(Analyzer, NonZeroExitWithoutFindings){
    auto r = run_analyzer(fake_analyzer("", 3), kScript);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(has_code(r.diagnostics, "E0405")) << dump(r.diagnostics);
}

TEST(Analyzer, MissingProgramIsE0406){
    AnalyzerConfig cfg;
    cfg.enabled = true;
    cfg.program = "posixc-no-such-analyzer";
    auto r = run_analyzer(cfg, kScript);
    EXPECT_FALSE(r.ok);
    const auto* d = find_code(r.diagnostics, "E0406");
    ASSERT_NE(d, nullptr) << dump(r.diagnostics);
    EXPECT_NE(d->message.find("posixc-no-such-analyzer"), std::string::npos);

    cfg.program = "/nonexistent/posixc/analyzer";
    EXPECT_TRUE(has_code(run_analyzer(cfg, kScript).diagnostics, "E0406"));
}

TEST(Analyzer, TimeoutIsE0406){
    auto cfg = fake_analyzer("sleep 5\n", 0);
    cfg.timeout_seconds = 1;
    auto r = run_analyzer(cfg, kScript);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(has_code(r.diagnostics, "E0406")) << dump(r.diagnostics);
}

TEST(Analyzer, PipelineRejectsOnFindings){
    auto cfg = test_config();
    cfg.analyzer = fake_analyzer("printf '%s\\n' \"$4:1:1: warning: flagged [SC2000]\"\n", 1);
    auto r = compile_source("fn main() { println!(\"hi\"); }", cfg);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    EXPECT_TRUE(has_code(r.diagnostics, "E0405")) << dump(r.diagnostics);
}

TEST(Analyzer, PipelineAcceptsCleanRun){
    auto cfg = test_config();
    cfg.analyzer = fake_analyzer("", 0);
    auto r = compile_source("fn main() { println!(\"hi\"); }", cfg);
    EXPECT_TRUE(r.success) << dump(r.diagnostics);
}
