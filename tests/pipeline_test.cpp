#include <gtest/gtest.h>
#include "posixc/digest.hpp"
#include "posixc/validator.hpp"
#include "test_util.hpp"
#include <string>

using namespace posixc;
using posixc_test::compile_source;
using posixc_test::dump;
using posixc_test::find_code;
using posixc_test::has_code;
using posixc_test::test_config;

namespace {

const char* const kProgram = R"(
fn greet(name: &str) -> String { format!("hello {}", name) }
fn main() {
    let who = env_var_or("USER", "world");
    for i in 1..=2 { println!("{} #{}", greet(&who), i); }
}
)";

} // namespace

TEST(Digest, KnownVectors){
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Pipeline, SuccessfulCompileCarriesArtifacts){
    auto r = compile_source(kProgram);
    ASSERT_TRUE(r.success) << dump(r.diagnostics);
    EXPECT_FALSE(r.script.empty());
    EXPECT_EQ(r.digest, sha256_hex(r.script));
    EXPECT_EQ(r.digest.size(), 64u);
    ASSERT_TRUE(r.ir);
    EXPECT_EQ(r.metrics.function_count, 2u);
    EXPECT_NE(r.script.find("# Source: test.rs (sha256:" + sha256_hex(kProgram) + ")\n"), std::string::npos);
    EXPECT_TRUE(validate_text(r.script).ok);
    EXPECT_TRUE(validate_ir(r.ir).ok);
}

TEST(Pipeline, OutputIsDeterministic){
    auto a = compile_source(kProgram);
    auto b = compile_source(kProgram);
    ASSERT_TRUE(a.success && b.success);
    EXPECT_EQ(a.script, b.script);
    EXPECT_EQ(a.digest, b.digest);
    EXPECT_TRUE(ir_equal(a.ir, b.ir));
}

TEST(Pipeline, DeterminismCheckCanBeDisabled){
    auto cfg = test_config();
    cfg.verify_determinism = false;
    auto r = compile_source(kProgram, cfg);
    EXPECT_TRUE(r.success) << dump(r.diagnostics);
    EXPECT_EQ(r.script, compile_source(kProgram).script);
}

TEST(Pipeline, ParseFailureProducesNoOutput){
    auto r = compile_source("fn main( {");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    EXPECT_TRUE(r.digest.empty());
    EXPECT_FALSE(r.ir);
    ASSERT_FALSE(r.diagnostics.empty());
    EXPECT_EQ(r.diagnostics[0].kind, DiagnosticKind::ParseError);
}

TEST(Pipeline, LoweringFailureProducesNoOutput){
    auto r = compile_source("fn main() { println!(\"{}\", undefined_name); }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    ASSERT_FALSE(r.diagnostics.empty());
    EXPECT_EQ(r.diagnostics.back().kind, DiagnosticKind::LoweringError);
}

TEST(Pipeline, MaxDiagnosticsBoundsParseErrors){
    std::string src;
    for(int i = 0; i < 10; ++i) src += "trait T" + std::to_string(i) + " {}\n";
    src += "fn main() {}\n";
    auto cfg = test_config();
    cfg.max_diagnostics = 3;
    auto r = compile_source(src, cfg);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.diagnostics.size(), 4u) << dump(r.diagnostics);
}

TEST(Pipeline, WarningsPassOutsideStrictMode){
    const char* src = "fn unused() {}\nfn main() {}\n";
    auto r = compile_source(src);
    EXPECT_TRUE(r.success) << dump(r.diagnostics);
    const auto* w = find_code(r.diagnostics, "W0002");
    ASSERT_NE(w, nullptr) << dump(r.diagnostics);
    EXPECT_EQ(w->severity, Severity::Warning);
    EXPECT_EQ(r.script.find("unused() {"), std::string::npos) << r.script;
}

TEST(Pipeline, StrictModeRejectsWarnings){
    auto cfg = test_config();
    cfg.strict_mode = true;
    auto r = compile_source("fn unused() {}\nfn main() {}\n", cfg);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    EXPECT_TRUE(has_code(r.diagnostics, "W0002")) << dump(r.diagnostics);
    EXPECT_TRUE(has_code(r.diagnostics, "E0412")) << dump(r.diagnostics);

    auto clean = compile_source("fn main() { println!(\"ok\"); }", cfg);
    EXPECT_TRUE(clean.success) << dump(clean.diagnostics);
}

TEST(Pipeline, DeadCodeEliminationCanBeDisabled){
    auto cfg = test_config();
    cfg.enable_dead_code_elimination = false;
    auto r = compile_source("fn unused() { println!(\"u\"); }\nfn main() {}\n", cfg);
    ASSERT_TRUE(r.success) << dump(r.diagnostics);
    EXPECT_NE(r.script.find("unused() {\n    printf '%s\\n' u\n}\n"), std::string::npos) << r.script;
}

TEST(Pipeline, InliningRemovesSmallHelpers){
    auto cfg = test_config();
    cfg.enable_inlining = true;
    auto r = compile_source("fn hello() { println!(\"hi\"); }\nfn main() { hello(); hello(); }\n", cfg);
    ASSERT_TRUE(r.success) << dump(r.diagnostics);
    EXPECT_EQ(r.script.find("hello() {"), std::string::npos) << r.script;
    EXPECT_NE(r.script.find("main() {\n    printf '%s\\n' hi\n    printf '%s\\n' hi\n}\n"), std::string::npos) << r.script;

    auto ran = posixc_test::run_script(r.script);
    EXPECT_EQ(ran.out, "hi\nhi\n");
}
