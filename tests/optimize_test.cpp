#include <gtest/gtest.h>
#include "posixc/optimize.hpp"
#include "test_util.hpp"
#include <climits>
#include <string>

using namespace posixc;
using posixc_test::compile_ok;
using posixc_test::test_config;

namespace {

IrPtr program(std::vector<IrPtr> functions){ return make_seq(std::move(functions)); }

const ir::FunctionDef* function_named(const IrPtr& prog, const std::string& name){
    for(const auto& item : std::get<ir::Seq>(prog->v).items){
        const auto* f = std::get_if<ir::FunctionDef>(&item->v);
        if(f && f->name == name) return f;
    }
    return nullptr;
}

size_t function_count(const IrPtr& prog){ return std::get<ir::Seq>(prog->v).items.size(); }

IrPtr lit_arith(ArithOp op, long long a, long long b){
    return make_function("main", {}, make_echo(make_arith(op, make_literal(std::to_string(a)), make_literal(std::to_string(b)))));
}

} // namespace

TEST(ConstantFolding, Arithmetic){
    auto v = fold_value(make_arith(ArithOp::Add, make_literal("2"), make_literal("3")));
    ASSERT_TRUE(integer_value(*v));
    EXPECT_EQ(*integer_value(*v), 5);

    auto nested = fold_value(make_arith(ArithOp::Mul, make_arith(ArithOp::Add, make_literal("1"), make_literal("2")), make_var("x")));
    EXPECT_TRUE(ir_equal(nested, make_arith(ArithOp::Mul, make_literal("3"), make_var("x")))) << to_sexpr(nested);

    EXPECT_EQ(*integer_value(*fold_value(make_arith(ArithOp::Div, make_literal("-7"), make_literal("2")))), -3);
    EXPECT_EQ(*integer_value(*fold_value(make_arith(ArithOp::Mod, make_literal("-7"), make_literal("2")))), -1);
    EXPECT_EQ(*integer_value(*fold_value(make_arith(ArithOp::Shl, make_literal("1"), make_literal("10")))), 1024);
}

TEST(ConstantFolding, UndefinedArithmeticIsLeftForTheShell){
    const auto max = std::to_string(LLONG_MAX);
    const auto min = std::to_string(LLONG_MIN);
    for(const auto& v : {
            make_arith(ArithOp::Add, make_literal(max), make_literal("1")),
            make_arith(ArithOp::Mul, make_literal(max), make_literal("2")),
            make_arith(ArithOp::Div, make_literal("1"), make_literal("0")),
            make_arith(ArithOp::Mod, make_literal("1"), make_literal("0")),
            make_arith(ArithOp::Div, make_literal(min), make_literal("-1")),
            make_arith(ArithOp::Shl, make_literal("1"), make_literal("63")),
        }){
        auto f = fold_value(v);
        EXPECT_TRUE(std::holds_alternative<val::Arithmetic>(f->v)) << to_sexpr(v);
    }
}

TEST(ConstantFolding, ComparisonsAndLogic){
    auto t = fold_value(make_compare(CmpOp::NumLt, make_literal("1"), make_literal("2")));
    EXPECT_EQ(bool_value(*t), std::optional<bool>(true));
    auto one = fold_value(make_compare(CmpOp::NumLt, make_literal("1"), make_literal("2")), true);
    EXPECT_EQ(integer_value(*one), std::optional<long long>(1));
    auto ne = fold_value(make_compare(CmpOp::StrEq, make_literal("a"), make_literal("b")));
    EXPECT_EQ(bool_value(*ne), std::optional<bool>(false));

    EXPECT_TRUE(ir_equal(fold_value(make_logical(LogicOp::And, make_literal("true"), make_var("x"))), make_var("x")));
    EXPECT_EQ(bool_value(*fold_value(make_logical(LogicOp::Or, make_literal("true"), make_var("x")))), std::optional<bool>(true));
    EXPECT_EQ(bool_value(*fold_value(make_logical(LogicOp::Not, make_literal("false")))), std::optional<bool>(true));

    auto open = make_compare(CmpOp::NumEq, make_var("a"), make_literal("1"));
    EXPECT_TRUE(ir_equal(fold_value(open), open));
}

TEST(ConstantFolding, ConcatMergesAdjacentLiterals){
    auto v = fold_value(make_concat({make_literal("a"), make_literal(""), make_literal("b"), make_var("x"),
                                     make_literal("c"), make_literal("d")}));
    EXPECT_TRUE(ir_equal(v, make_concat({make_literal("ab"), make_var("x"), make_literal("cd")}))) << to_sexpr(v);
    auto all = fold_value(make_concat({make_literal("a"), make_literal("b")}));
    EXPECT_TRUE(ir_equal(all, make_literal("ab")));
}

TEST(ConstantFolding, IsIdempotentAndCounts){
    auto prog = program({lit_arith(ArithOp::Add, 40, 2)});
    OptimizeStats stats;
    auto once = fold_constants(prog, &stats);
    EXPECT_EQ(stats.folded, 1u);
    EXPECT_TRUE(ir_equal(fold_constants(once), once));
    EXPECT_TRUE(ir_equal(once, program({make_function("main", {}, make_echo(make_literal("42")))})));
}

TEST(DeadCode, ConstantBranchesAndTerminators){
    auto body = make_seq({
        make_if(make_literal("true"), make_echo(make_literal("a")), make_echo(make_literal("b"))),
        make_while(make_literal("false"), make_echo(make_literal("loop"))),
        make_for_each("x", {}, make_echo(make_var("x"))),
        make_return(),
        make_echo(make_literal("after")),
    });
    OptimizeStats stats;
    auto out = eliminate_dead_code(program({make_function("main", {}, body)}), &stats);
    auto expected = program({make_function("main", {}, make_seq({make_echo(make_literal("a")), make_return()}))});
    EXPECT_TRUE(ir_equal(out, expected)) << to_sexpr(out);
    EXPECT_EQ(stats.removed_statements, 4u);
}

TEST(DeadCode, CaseArmsAfterWildcard){
    std::vector<ir::CaseArm> arms{
        {{"a"}, false, make_echo(make_literal("1"))},
        {{}, true, make_echo(make_literal("2"))},
        {{"b"}, false, make_echo(make_literal("3"))},
    };
    auto out = eliminate_dead_code(program({make_function("main", {}, make_case(make_var("m"), arms))}));
    const auto& c = std::get<ir::Case>(function_named(out, "main")->body->v);
    ASSERT_EQ(c.arms.size(), 2u);
    EXPECT_TRUE(c.arms[1].wildcard);
}

TEST(DeadCode, UnreachableFunctionsAreRemoved){
    auto leaf = make_function("leaf", {}, make_echo(make_literal("leaf")));
    auto mid = make_function("mid", {}, make_echo(make_command_subst(make_call(CallKind::User, "leaf", {}))));
    auto unused = make_function("unused", {}, make_call(CallKind::User, "leaf", {}));
    auto main = make_function("main", {}, make_call(CallKind::User, "mid", {}));
    OptimizeStats stats;
    auto out = eliminate_dead_code(program({leaf, mid, unused, main}), &stats);
    EXPECT_EQ(stats.removed_functions, 1u);
    EXPECT_EQ(function_count(out), 3u);
    EXPECT_EQ(function_named(out, "unused"), nullptr);
    EXPECT_NE(function_named(out, "leaf"), nullptr);
}

TEST(Inlining, LiteralArgumentsAreBound){
    auto greet = make_function("greet", {"who"}, make_echo(make_var("who")));
    auto main = make_function("main", {}, make_call(CallKind::User, "greet", {make_literal("x")}));
    OptimizeStats stats;
    auto out = inline_calls(program({greet, main}), 10, &stats);
    EXPECT_EQ(stats.inlined_calls, 1u);
    auto expected_main = make_function("main", {}, make_seq({make_assign("who", make_literal("x")), make_echo(make_var("who"))}));
    EXPECT_TRUE(ir_equal(make_function("main", {}, function_named(out, "main")->body), expected_main)) << to_sexpr(out);
}

TEST(Inlining, CandidatesAreRestricted){
    auto with_return = make_function("early", {}, make_seq({make_echo(make_literal("e")), make_return()}));
    auto plain = make_function("plain", {"a"}, make_echo(make_var("a")));
    auto main = make_function("main", {}, make_seq({
        make_call(CallKind::User, "early", {}),
        make_call(CallKind::User, "plain", {make_var("v")}),
        make_call(CallKind::User, "plain", {make_literal("1")}, true),
    }));
    OptimizeStats stats;
    auto prog = program({with_return, plain, main});
    auto out = inline_calls(prog, 10, &stats);
    EXPECT_EQ(stats.inlined_calls, 0u);
    EXPECT_TRUE(ir_equal(out, prog));
}

TEST(Inlining, BranchThresholdBoundsGrowth){
    auto branchy = make_function("branchy", {}, make_seq({
        make_if(make_var("a"), make_echo(make_literal("1"))),
        make_if(make_var("b"), make_echo(make_literal("2"))),
        make_if(make_var("c"), make_echo(make_literal("3"))),
    }));
    auto main = make_function("main", {}, make_call(CallKind::User, "branchy", {}));
    OptimizeStats small, large;
    inline_calls(program({branchy, main}), 2, &small);
    inline_calls(program({branchy, main}), 3, &large);
    EXPECT_EQ(small.inlined_calls, 0u);
    EXPECT_EQ(large.inlined_calls, 1u);
}

TEST(Optimize, DisabledPassesLeaveTreeUnchanged){
    auto prog = program({
        make_function("unused", {}, make_echo(make_literal("u"))),
        lit_arith(ArithOp::Add, 1, 2),
    });
    Config cfg = test_config();
    cfg.enable_constant_folding = false;
    cfg.enable_dead_code_elimination = false;
    cfg.enable_inlining = false;
    EXPECT_TRUE(ir_equal(optimize(prog, cfg), prog));
}

TEST(Optimize, InlinedFunctionsBecomeUnreachable){
    auto hello = make_function("hello", {}, make_echo(make_literal("hi")));
    auto main = make_function("main", {}, make_call(CallKind::User, "hello", {}));
    Config cfg = test_config();
    cfg.enable_inlining = true;
    OptimizeStats stats;
    auto out = optimize(program({hello, main}), cfg, &stats);
    EXPECT_EQ(stats.inlined_calls, 1u);
    EXPECT_EQ(stats.removed_functions, 1u);
    EXPECT_EQ(function_count(out), 1u);
}

TEST(Optimize, CompiledScriptsReflectPasses){
    const std::string src = "fn main() { let x = 2 + 3 * 4; if false { println!(\"never\"); } println!(\"{}\", x); }";
    auto folded = compile_ok(src);
    EXPECT_NE(folded.find("    x=14\n"), std::string::npos) << folded;
    EXPECT_EQ(folded.find("never"), std::string::npos) << folded;

    Config cfg = test_config();
    cfg.enable_constant_folding = false;
    cfg.enable_dead_code_elimination = false;
    auto r = posixc_test::compile_source(src, cfg);
    ASSERT_TRUE(r.success) << posixc_test::dump(r.diagnostics);
    EXPECT_NE(r.script.find("    x=$((2 + (3 * 4)))\n"), std::string::npos) << r.script;
    EXPECT_NE(r.script.find("    if false; then\n"), std::string::npos) << r.script;
}
