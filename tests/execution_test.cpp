#include <gtest/gtest.h>
#include "test_env.hpp"
#include "test_util.hpp"
#include <string>

using posixc_test::compile_ok;
using posixc_test::have_program;
using posixc_test::make_temp_dir;
using posixc_test::run_script;

namespace {

// Source-level string literal for arbitrary text.
std::string rust_literal(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        if(c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::string run_ok(const std::string& src, const std::string& args = ""){
    auto script = compile_ok(src);
    auto run = run_script(script, "sh", args);
    EXPECT_EQ(run.status, 0) << script;
    return run.out;
}

} // namespace

class InjectionImmunity : public ::testing::TestWithParam<const char*> {};

TEST_P(InjectionImmunity, LiteralsReachOutputUnchanged){
    const std::string payload = GetParam();
    const std::string lit = rust_literal(payload);
    const std::string src =
        "fn show(v: &str) { println!(\"{}\", v); }\n"
        "fn main() {\n"
        "    let v = " + lit + ";\n"
        "    println!(\"{}\", v);\n"
        "    println!(" + rust_literal("{}") + ", " + lit + ");\n"
        "    show(v);\n"
        "    let t = string_replace(v, \"@@\", \"@@\");\n"
        "    println!(\"{}\", t);\n"
        "    let w = env_var_or(\"POSIXC_TEST_SURELY_UNSET\", v);\n"
        "    println!(\"{}\", w);\n"
        "    let e = exec(\"printf\", \"%s\", " + lit + ");\n"
        "    println!(\"{}\", e);\n"
        "}\n";
    auto script = compile_ok(src);
    auto run = run_script(script);
    EXPECT_EQ(run.status, 0) << script;
    std::string expected;
    for(int i = 0; i < 6; ++i) expected += payload + "\n";
    EXPECT_EQ(run.out, expected) << script;
    if(have_program("bash")){
        auto under_bash = run_script(script, "bash");
        EXPECT_EQ(under_bash.status, 0) << script;
        EXPECT_EQ(under_bash.out, expected) << script;
    }
}

INSTANTIATE_TEST_SUITE_P(Payloads, InjectionImmunity, ::testing::Values(
    "; touch /tmp/posixc-pwned",
    "`id`",
    "$(id)",
    "a | cat",
    "true && echo pwned",
    "it's 'quoted'",
    "\"double\" \\ back",
    "${HOME}",
    "* ?",
    "-n",
    "%s %d",
    "} { ) (",
    "$((1+1))"
));

TEST(Execution, QuotedEnvironmentDefaultAcrossShells){
    unset_env("POSIXC_TEST_SURELY_UNSET");
    auto script = compile_ok(R"(
fn main() {
    println!("{}", env_var_or("POSIXC_TEST_SURELY_UNSET", "it's"));
    println!("{}", env_var_or("POSIXC_TEST_SURELY_UNSET", "a}b \"c\" $d"));
}
)");
    for(const char* shell : {"sh", "bash", "dash"}){
        if(!have_program(shell)) continue;
        auto run = run_script(script, shell);
        EXPECT_EQ(run.status, 0) << shell << "\n" << script;
        EXPECT_EQ(run.out, "it's\na}b \"c\" $d\n") << shell;
    }
}

TEST(Execution, BindingsDoNotOverwriteEachOther){
    ScopedEnv cfg("POSIXC_T_NAME", "from-env");
    auto out = run_ok(R"(
fn helper(x: &str) { let y = "helper"; println!("{} {}", x, y); }
fn main() {
    let x = "outer";
    let y = "kept";
    if arg_count() > 0 { let x = "inner"; println!("{}", x); }
    for i in 0..2 { let x = i; let y = x + 1; }
    helper("arg");
    let n = arg_count();
    match n { 0 => println!("none"), x if x > 5 => println!("many {}", x), _ => println!("some") }
    let a_0 = "user";
    let a = [1, 2];
    let POSIXC_T_NAME = "local";
    println!("{} {} {} {} {}", x, y, a_0, a[0], POSIXC_T_NAME);
    println!("{}", env("POSIXC_T_NAME"));
}
)", "one");
    EXPECT_EQ(out, "inner\narg helper\nsome\nouter kept user 1 local\nfrom-env\n");
}

class RuntimeInput : public ::testing::TestWithParam<const char*> {};

// Text read at run time stays text in every shell.
TEST_P(RuntimeInput, IsNeverEvaluated){
    const std::string payload = GetParam();
    ScopedEnv input("POSIXC_T_INPUT", payload);
    auto script = compile_ok(R"(
fn show(s: &str) -> String { format!("<{}>", s) }
fn main() {
    let v = env("POSIXC_T_INPUT");
    println!("{}", show(&v));
    match v.as_str() { "a" => println!("a"), other => println!("{}", other) }
    if v == "0" { println!("zero"); }
    println!("{}", v.len());
    println!("{}", arg(1));
}
)");
    const std::string expected = "<" + payload + ">\n" + payload + "\n" + std::to_string(payload.size()) + "\n" + "x\n";
    for(const char* shell : {"sh", "bash"}){
        if(!have_program(shell)) continue;
        auto run = run_script(script, shell, "x", true);
        EXPECT_EQ(run.status, 0) << shell;
        EXPECT_EQ(run.out, expected) << shell << "\n" << script;
    }
}

INSTANTIATE_TEST_SUITE_P(Payloads, RuntimeInput, ::testing::Values(
    "PWD[$(echo INJECTED >&2)]",
    "a[`echo INJECTED >&2`]",
    "$(echo INJECTED)",
    "1+1",
    "x; echo INJECTED"
));

TEST(Execution, RuntimeTextCannotReachArithmetic){
    ScopedEnv input("POSIXC_T_NUM", "PWD[$(echo INJECTED >&2)]");
    auto r = posixc_test::compile_source(R"(
fn add_one(n: i32) -> i32 { n + 1 }
fn main() { println!("{}", add_one(env("POSIXC_T_NUM"))); }
)");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    EXPECT_TRUE(posixc_test::has_code(r.diagnostics, "E0222")) << posixc_test::dump(r.diagnostics);
}

TEST(Execution, RangeLoopUnderDash){
    if(!have_program("dash")) GTEST_SKIP() << "dash not installed";
    auto script = compile_ok("fn main() { for i in 0..5 { println!(\"{}\", i); } }");
    auto run = run_script(script, "dash");
    EXPECT_EQ(run.status, 0);
    EXPECT_EQ(run.out, "0\n1\n2\n3\n4\n");
}

TEST(Execution, ArithmeticMatchesTruncatingDivision){
    auto out = run_ok(R"(
fn main() {
    let a = 7;
    let b = -2;
    println!("{} {} {}", a / b, a % b, (a + 1) * 3);
}
)");
    EXPECT_EQ(out, "-3 1 24\n");
}

TEST(Execution, FunctionValuesAndLoops){
    auto out = run_ok(R"(
fn add(a: i32, b: i32) -> i32 { a + b }
fn main() {
    let mut i = 0;
    let mut total = 0;
    while i < 5 {
        total += i;
        i += 1;
    }
    println!("{}", add(total, 5));
}
)");
    EXPECT_EQ(out, "15\n");
}

TEST(Execution, ArgumentsAreIterated){
    auto out = run_ok(R"(
fn main() {
    println!("{}", arg_count());
    for a in args() { println!("[{}]", a); }
    println!("{}", arg(1));
}
)", "x 'y z'");
    EXPECT_EQ(out, "2\n[x]\n[y z]\nx\n");
}

TEST(Execution, MatchOnStrings){
    ScopedEnv mode("POSIXC_T_MODE", "c");
    auto out = run_ok(R"(
fn main() {
    let m = env_var_or("POSIXC_T_MODE", "a");
    match m.as_str() {
        "a" => println!("A"),
        "b" | "c" => println!("BC"),
        _ => println!("other"),
    }
}
)");
    EXPECT_EQ(out, "BC\n");
}

TEST(Execution, IfExpressionValue){
    auto out = run_ok(R"(
fn main() {
    let n = arg_count();
    let s = if n > 0 { "some" } else { "none" };
    println!("{}", s);
}
)");
    EXPECT_EQ(out, "none\n");
}

TEST(Execution, StringHelpers){
    auto out = run_ok(R"(
fn main() {
    let s = "Hello World";
    println!("{}", s.len());
    println!("{}", s.to_uppercase());
    println!("{}", s.replace("o", "0"));
    println!("{}", s.contains("World"));
    println!("{}", string_trim("  padded  "));
    println!("{}", s.starts_with("Hello"));
}
)");
    EXPECT_EQ(out, "11\nHELLO WORLD\nHell0 W0rld\ntrue\npadded\ntrue\n");
}

TEST(Execution, TrimTreatsValueAsOneString){
    ScopedEnv v("POSIXC_T_TRIM", " \t first line  \n  second line \n\n");
    auto out = run_ok(R"(
fn main() {
    let t = string_trim(env("POSIXC_T_TRIM"));
    println!("[{}]", t);
    println!("[{}]", string_trim("   "));
    println!("[{}]", string_trim("*  ?"));
}
)");
    EXPECT_EQ(out, "[first line  \n  second line]\n[]\n[*  ?]\n");
}

TEST(Execution, FileHelpers){
    const std::string dir = make_temp_dir();
    ScopedEnv d("POSIXC_T_DIR", dir);
    auto out = run_ok(R"(
fn main() {
    let d = env("POSIXC_T_DIR");
    let sub = format!("{}/sub", d);
    let f = format!("{}/x.txt", sub);
    fs_mkdir(sub);
    fs_write_file(f, "data");
    println!("{}", fs_is_dir(sub));
    println!("{}", fs_exists(f));
    println!("{}", fs_read_file(f));
    fs_remove(f);
    println!("{}", fs_is_file(f));
}
)");
    EXPECT_EQ(out, "true\ntrue\ndata\nfalse\n");
}

TEST(Execution, ExitStatusAndStderr){
    auto script = compile_ok(R"(
fn main() {
    eprintln!("failing");
    std::process::exit(3);
}
)");
    auto quiet = run_script(script);
    EXPECT_EQ(quiet.status, 3);
    EXPECT_EQ(quiet.out, "");
    auto merged = run_script(script, "sh", "", true);
    EXPECT_EQ(merged.out, "failing\n");
}

TEST(Execution, RequireStopsOnMissingCommand){
    auto present = compile_ok("fn main() { require(\"sh\"); println!(\"ok\"); }");
    EXPECT_EQ(run_script(present).out, "ok\n");
    auto missing = compile_ok("fn main() { require(\"posixc-definitely-missing\"); println!(\"ok\"); }");
    auto run = run_script(missing);
    EXPECT_EQ(run.status, 127);
    EXPECT_EQ(run.out, "");
}

TEST(Execution, ExternalCommandOutputIsCaptured){
    auto out = run_ok(R"(fn main() { let o = exec("printf", "%s", "abc"); println!("[{}]", o); })");
    EXPECT_EQ(out, "[abc]\n");
}
