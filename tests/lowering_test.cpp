#include <gtest/gtest.h>
#include "rustlite/lower.hpp"
#include "parser/parser.hpp"
#include "posixc/shell_ir.hpp"
#include "test_util.hpp"
#include <string>

using namespace posixc;
using namespace posixc_test;

static bool contains(const std::string& haystack, const std::string& needle){
    return haystack.find(needle) != std::string::npos;
}

// ---- ranges

TEST(LoweringRange, ExclusiveEndIsFolded){
    std::string s = compile_ok("fn main() { for i in 0..3 { println!(\"{}\", i); } }");
    EXPECT_TRUE(contains(s, "seq 0 2")) << s;
    EXPECT_FALSE(contains(s, "seq 0 3")) << s;
}

TEST(LoweringRange, InclusiveEndIsKept){
    std::string s = compile_ok("fn main() { for i in 0..=3 { println!(\"{}\", i); } }");
    EXPECT_TRUE(contains(s, "seq 0 3")) << s;
}

TEST(LoweringRange, EmptyAndSingleElementRanges){
    EXPECT_TRUE(contains(compile_ok("fn main() { for i in 0..0 { println!(\"{}\", i); } }"), "seq 0 -1"));
    EXPECT_TRUE(contains(compile_ok("fn main() { for i in 1..2 { println!(\"{}\", i); } }"), "seq 1 1"));
}

TEST(LoweringRange, DynamicEndSubtractsOne){
    std::string s = compile_ok(R"(
        fn main() {
            let n = arg_count();
            for i in 0..n { println!("{}", i); }
        }
    )");
    EXPECT_TRUE(contains(s, "seq 0 \"$((${n} - 1))\"")) << s;
}

TEST(LoweringRange, RangeOutsideForIsRejected){
    auto r = compile_source("fn main() { let r = 0..3; }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(has_code(r.diagnostics, "E0220")) << dump(r.diagnostics);
}

// ---- environment

TEST(LoweringEnv, HomeIsQuotedExpansion){
    std::string s = compile_ok("fn main() { let home = env(\"HOME\"); }");
    EXPECT_TRUE(contains(s, "home=\"${HOME}\"")) << s;
}

TEST(LoweringEnv, DefaultUsesParameterExpansion){
    std::string s = compile_ok(R"(fn main() { let p = env_var_or("PREFIX", "/usr/local"); println!("{}", p); })");
    EXPECT_TRUE(contains(s, "\"${PREFIX:-/usr/local}\"")) << s;
}

TEST(LoweringEnv, InvalidNameFailsAndWritesNothing){
    const std::string dir = make_temp_dir();
    const std::string out = dir + "/out.sh";
    auto r = rustlite::compile_to_file("fn main() { let x = env(\"'; rm -rf /; #\"); }", test_config(), out);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    const Diagnostic* d = find_code(r.diagnostics, "E0201");
    ASSERT_NE(d, nullptr) << dump(r.diagnostics);
    EXPECT_EQ(d->kind, DiagnosticKind::LoweringError);
    EXPECT_TRUE(contains(d->message, "'; rm -rf /; #")) << d->message;
    EXPECT_FALSE(d->hint.empty());
    EXPECT_FALSE(file_exists(out));
}

TEST(LoweringEnv, NonLiteralNameIsRejected){
    auto r = compile_source("fn main() { let n = \"HOME\"; let h = env(n); }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(has_code(r.diagnostics, "E0202")) << dump(r.diagnostics);
}

// ---- values and calls

TEST(LoweringCalls, ValueFunctionIsCapturedInArithmetic){
    std::string s = compile_ok(R"(
        fn two() -> i32 { 2 }
        fn main() { let x = two() + 1; println!("{}", x); }
    )");
    EXPECT_TRUE(contains(s, "x=$(($(two) + 1))")) << s;
    EXPECT_TRUE(contains(s, "two() {\n    printf '%s\\n' 2\n}")) << s;
}

TEST(LoweringCalls, ParametersBindFromPositionals){
    std::string s = compile_ok(R"(
        fn greet(name: &str) { println!("hello {}", name); }
        fn main() { greet("world"); }
    )");
    EXPECT_TRUE(contains(s, "greet() {\n    greet_name=\"${1}\"\n")) << s;
    EXPECT_TRUE(contains(s, "\"hello ${greet_name}\"")) << s;
    EXPECT_TRUE(contains(s, "greet world\n")) << s;
}

TEST(LoweringCalls, StatementCallToValueFunctionDiscardsOutput){
    std::string s = compile_ok(R"(
        fn noisy() -> i32 { 7 }
        fn main() { noisy(); }
    )");
    EXPECT_TRUE(contains(s, "noisy >/dev/null")) << s;
}

TEST(LoweringCalls, ExitTakesNumericStatus){
    std::string s = compile_ok("fn main() { std::process::exit(3); }");
    EXPECT_TRUE(contains(s, "exit 3")) << s;
}

TEST(LoweringCalls, StringMethodsUseRuntimeHelpers){
    std::string s = compile_ok(R"(
        fn main() {
            let s = env_var_or("NAME", "  x  ");
            let t = s.trim();
            if t.starts_with("x") { println!("{}", t.to_uppercase()); }
        }
    )");
    EXPECT_TRUE(contains(s, "posixc_string_trim() {")) << s;
    EXPECT_TRUE(contains(s, "posixc_string_starts_with() {")) << s;
    EXPECT_TRUE(contains(s, "posixc_string_to_upper() {")) << s;
    EXPECT_FALSE(contains(s, "posixc_fs_copy() {")) << s;
}

TEST(LoweringCalls, StringEqualityIsTextual){
    std::string s = compile_ok(R"(
        fn main() {
            let a = env_var_or("MODE", "dev");
            if a == "prod" { println!("p"); }
        }
    )");
    EXPECT_TRUE(contains(s, "if [ \"${a}\" = prod ]; then")) << s;
}

TEST(LoweringCalls, IntegerComparisonIsNumeric){
    std::string s = compile_ok(R"(
        fn main() {
            let n = arg_count();
            while n < 3 { println!("{}", n); break; }
        }
    )");
    EXPECT_TRUE(contains(s, "while [ \"${n}\" -lt 3 ]; do")) << s;
}

// ---- arrays

TEST(LoweringArrays, VecIsFlattened){
    std::string s = compile_ok(R"(
        fn main() {
            let a = vec![10, 20];
            println!("{} {}", a[1], a.len());
            for x in a { println!("{}", x); }
        }
    )");
    EXPECT_TRUE(contains(s, "a_0=10")) << s;
    EXPECT_TRUE(contains(s, "a_1=20")) << s;
    EXPECT_TRUE(contains(s, "\"${a_1} 2\"")) << s;
    EXPECT_TRUE(contains(s, "for x in \"${a_0}\" \"${a_1}\"; do")) << s;
}

TEST(LoweringArrays, ArgsIterationUsesAllPositionals){
    std::string s = compile_ok("fn main() { for a in args() { println!(\"{}\", a); } }");
    EXPECT_TRUE(contains(s, "for a in \"$@\"; do")) << s;
}

// ---- match

TEST(LoweringMatch, LiteralArmsBecomeCase){
    std::vector<Diagnostic> diags;
    auto ir = lower_source(R"(
        fn main() {
            let m = env_var_or("MODE", "a");
            match m.as_str() {
                "a" | "b" => println!("ab"),
                _ => println!("other"),
            }
        }
    )", &diags);
    ASSERT_TRUE(ir) << dump(diags);
    const std::string dumped = to_sexpr(ir);
    EXPECT_TRUE(contains(dumped, "(case (var m) [\"a\" \"b\"")) << dumped;
    EXPECT_TRUE(contains(dumped, "[_ (echo")) << dumped;
}

TEST(LoweringMatch, GuardsAndRangesBecomeIfChain){
    std::string s = compile_ok(R"(
        fn main() {
            let n = arg_count();
            match n {
                0 => println!("none"),
                1..=3 => println!("few"),
                x if x > 10 => println!("many {}", x),
                _ => println!("some"),
            }
        }
    )");
    EXPECT_TRUE(contains(s, "if [ \"${n}\" -eq 0 ]; then")) << s;
    EXPECT_TRUE(contains(s, "elif [ \"${n}\" -ge 1 ] && [ \"${n}\" -le 3 ]; then")) << s;
    EXPECT_TRUE(contains(s, "x=\"${n}\"")) << s;
    EXPECT_FALSE(contains(s, "case ")) << s;
}

TEST(LoweringMatch, ValueMatchAssignsTarget){
    std::string s = compile_ok(R"(
        fn main() {
            let n = arg_count();
            let word = match n { 0 => "zero", _ => "many" };
            println!("{}", word);
        }
    )");
    EXPECT_TRUE(contains(s, "word=zero")) << s;
    EXPECT_TRUE(contains(s, "word=many")) << s;
}

TEST(LoweringMatch, PatternKindMismatch){
    auto r = compile_source("fn main() { match 1 { \"a\" => {}, _ => {} } }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(has_code(r.diagnostics, "E0219")) << dump(r.diagnostics);
}

// ---- purity and warnings

TEST(LoweringPurity, SameProgramLowersToEqualIr){
    const std::string src = R"(
        fn label(n: i32) -> String {
            match n { 0 => "zero".to_string(), x if x < 0 => format!("neg {}", x), _ => format!("pos {}", n) }
        }
        fn main() {
            let a = vec!["x", "y"];
            for i in 0..arg_count() { println!("{} {}", label(i), a[0]); }
            match arg_count() + 1 { 1 => {}, _ => println!("args") }
        }
    )";
    auto first = lower_source(src);
    auto second = lower_source(src);
    ASSERT_TRUE(first && second);
    EXPECT_TRUE(ir_equal(first, second));
    EXPECT_EQ(to_sexpr(first), to_sexpr(second));
}

TEST(LoweringPurity, UnoptimizedArithmeticKeepsOperands){
    auto ir = lower_source("fn main() { let x = 1 + 2; }");
    ASSERT_TRUE(ir);
    EXPECT_TRUE(contains(to_sexpr(ir), "(assign x (arith + \"1\" \"2\"))")) << to_sexpr(ir);
}

TEST(LoweringWarnings, UnusedFunctionWarns){
    std::vector<Diagnostic> diags;
    auto ir = lower_source("fn unused() {}\nfn main() {}", &diags);
    ASSERT_TRUE(ir);
    const Diagnostic* w = find_code(diags, "W0002");
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->severity, Severity::Warning);
    EXPECT_EQ(w->span.line, 1);
}

TEST(LoweringWarnings, MainIsEmittedLast){
    auto ir = lower_source("fn main() { helper(); }\nfn helper() {}");
    ASSERT_TRUE(ir);
    const auto& seq = std::get<ir::Seq>(ir->v);
    ASSERT_EQ(seq.items.size(), 2u);
    EXPECT_EQ(std::get<ir::FunctionDef>(seq.items.back()->v).name, "main");
}

// ---- error table

struct LoweringCase { const char* source; const char* code; };

class LoweringErrors : public ::testing::TestWithParam<LoweringCase> {};

TEST_P(LoweringErrors, ReportsCode){
    const auto& c = GetParam();
    auto r = compile_source(c.source);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.script.empty());
    const Diagnostic* d = find_code(r.diagnostics, c.code);
    ASSERT_NE(d, nullptr) << c.source << "\n" << dump(r.diagnostics);
    EXPECT_EQ(d->kind, DiagnosticKind::LoweringError);
}

INSTANTIATE_TEST_SUITE_P(Codes, LoweringErrors, ::testing::Values(
    LoweringCase{"fn helper() {}", "E0203"},
    LoweringCase{"fn a() { b(); }\nfn b() { a(); }\nfn main() { a(); }", "E0204"},
    LoweringCase{"fn f(n: i32) { f(n); }\nfn main() { f(1); }", "E0204"},
    LoweringCase{"fn main() { missing(); }", "E0205"},
    LoweringCase{"fn f(a: i32) {}\nfn main() { f(1, 2); }", "E0206"},
    LoweringCase{"fn main() { let h = env(); }", "E0206"},
    LoweringCase{"fn main() { println!(\"{} {}\", 1); }", "E0207"},
    LoweringCase{"fn main() { println!(\"{:x}\", 1); }", "E0207"},
    LoweringCase{"fn main() { println!(\"{}\", 1, 2); }", "E0207"},
    LoweringCase{"fn main() { let x = \"a\" * 2; }", "E0208"},
    LoweringCase{"fn main() { let a = [1, 2]; let i = 0; let x = a[i]; }", "E0209"},
    LoweringCase{"fn main() { let a = [1, 2]; let x = a[2]; }", "E0210"},
    LoweringCase{"fn main() { let x = arg(0); }", "E0210"},
    LoweringCase{"fn main() { exec(\"eval\", \"ls\"); }", "E0211"},
    LoweringCase{"fn main() { exec(\"sh\", \"-c\", \"ls\"); }", "E0211"},
    LoweringCase{"fn main() { let p = \"ls\"; exec(p); }", "E0211"},
    LoweringCase{"fn main() { let b = \"a\" < \"b\"; }", "E0212"},
    LoweringCase{"fn main() { let a = [1, 2]; let b = a; }", "E0213"},
    LoweringCase{"fn main() { println!(\"{}\", nope); }", "E0214"},
    LoweringCase{"fn main() { x = 1; }", "E0214"},
    LoweringCase{"fn f() {}\nfn f() {}\nfn main() {}", "E0215"},
    LoweringCase{"fn main(x: i32) {}", "E0216"},
    LoweringCase{"fn main() -> i32 { 0 }", "E0216"},
    LoweringCase{"fn main() { let s = \"x\"; println!(s); }", "E0217"},
    LoweringCase{"fn main() { for c in \"abc\" { } }", "E0218"},
    LoweringCase{"fn f() {}\nfn main() { let x = f(); }", "E0221"},
    LoweringCase{"fn main() { let x = exit_code() + if true { 1 } else { 2 }; }", "E0221"},
    LoweringCase{"fn f(n: i32) { println!(\"{}\", n + 1); }\nfn main() { f(env(\"X\")); }", "E0222"},
    LoweringCase{"fn f(n: i32) -> i32 { n + 1 }\nfn main() { let v = f(arg(1)); println!(\"{}\", v); }", "E0222"},
    LoweringCase{"fn f(b: bool) {}\nfn main() { f(\"yes\"); }", "E0222"},
    LoweringCase{"fn f() -> i32 { env(\"X\") }\nfn main() { let v = f(); }", "E0222"},
    LoweringCase{"fn f() -> i32 { return arg(1); }\nfn main() { let v = f(); }", "E0222"},
    LoweringCase{"fn main() { let n: i32 = env(\"X\"); }", "E0222"},
    LoweringCase{"fn main() { let mut n = 0; n = arg(1); }", "E0222"},
    LoweringCase{"fn main() { let x = if arg_count() > 0 { 1 } else { \"a\" }; }", "E0222"},
    LoweringCase{"fn main() { let a = [1, \"x\"]; }", "E0222"},
    LoweringCase{"fn main() { let a = vec![]; for x in a { let y = x + 1; } }", "E0208"},
    LoweringCase{"fn f() -> i32 { println!(\"x\"); 1 }\nfn main() { let v = f(); }", "E0223"},
    LoweringCase{"fn p() { println!(\"x\"); }\nfn f() -> bool { p(); true }\nfn main() { let v = f(); }", "E0223"},
    LoweringCase{"fn f() -> String { exec(\"ls\"); \"x\".to_string() }\nfn main() { let v = f(); }", "E0223"}
));

// ---- kinds

TEST(LoweringKinds, StderrAndDiscardedCallsKeepReturnValuesClean){
    std::string s = compile_ok(R"(
        fn inner() -> i32 { 4 }
        fn quiet() { eprintln!("log"); }
        fn f() -> i32 { eprintln!("working"); quiet(); inner(); 1 }
        fn main() { println!("{}", f() + 1); }
    )");
    EXPECT_TRUE(contains(s, "inner >/dev/null")) << s;
}

TEST(LoweringKinds, MismatchNamesTheParameter){
    auto r = compile_source("fn twice(count: i32) -> i32 { count * 2 }\nfn main() { println!(\"{}\", twice(arg(1))); }");
    ASSERT_FALSE(r.success);
    const Diagnostic* d = find_code(r.diagnostics, "E0222");
    ASSERT_NE(d, nullptr) << dump(r.diagnostics);
    EXPECT_TRUE(contains(d->message, "parameter 'count' of 'twice'")) << d->message;
    EXPECT_TRUE(contains(d->message, "expects integer but the value is string")) << d->message;
}

// ---- shell names

TEST(LoweringNames, ShadowedLetGetsItsOwnVariable){
    std::string s = compile_ok(R"(
        fn main() {
            let x = "outer";
            if arg_count() > 0 { let x = "inner"; println!("{}", x); }
            println!("{}", x);
        }
    )");
    EXPECT_TRUE(contains(s, "    x=outer\n")) << s;
    EXPECT_TRUE(contains(s, "x_1=inner\n")) << s;
    EXPECT_TRUE(contains(s, "\"${x_1}\"")) << s;
}

TEST(LoweringNames, LocalsArePrefixedWithTheirFunction){
    std::string s = compile_ok(R"(
        fn helper(x: &str) { let y = x; println!("{}", y); }
        fn main() { let x = "main"; let y = "also"; helper(x); println!("{} {}", x, y); }
    )");
    EXPECT_TRUE(contains(s, "helper() {\n    helper_x=\"${1}\"\n    helper_y=\"${helper_x}\"\n")) << s;
    EXPECT_TRUE(contains(s, "    x=main\n")) << s;
    EXPECT_TRUE(contains(s, "    y=also\n")) << s;
}

TEST(LoweringNames, GeneratedNamesAvoidUserNames){
    std::string s = compile_ok(R"(
        fn main() {
            let a_0 = "user";
            let a = [1, 2];
            println!("{} {}", a_0, a[0]);
        }
    )");
    EXPECT_TRUE(contains(s, "    a_0=user\n")) << s;
    EXPECT_TRUE(contains(s, "    a_0_1=1\n")) << s;
    EXPECT_TRUE(contains(s, "\"${a_0} ${a_0_1}\"")) << s;
}

TEST(LoweringNames, EnvironmentNamesAreNotReused){
    std::string s = compile_ok(R"(
        fn main() { let CONFIG_DIR = "local"; println!("{} {}", CONFIG_DIR, env("CONFIG_DIR")); }
    )");
    EXPECT_TRUE(contains(s, "    CONFIG_DIR_1=local\n")) << s;
    EXPECT_TRUE(contains(s, "\"${CONFIG_DIR_1} ${CONFIG_DIR}\"")) << s;
}

