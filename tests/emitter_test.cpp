#include <gtest/gtest.h>
#include "posixc/diagnostics.hpp"
#include "posixc/config.hpp"
#include "posixc/emitter.hpp"
#include "posixc/runtime.hpp"
#include <string>

using namespace posixc;

namespace {

PosixEmitter emitter(){ return PosixEmitter(EmitOptions{"demo.rs", "abc123"}); }

IrPtr program_with_main(IrPtr body, std::vector<IrPtr> extra = {}){
    extra.push_back(make_function("main", {}, std::move(body)));
    return make_seq(std::move(extra));
}

std::string emit_main(IrPtr body){
    return emitter().emit(program_with_main(std::move(body)));
}

std::string emission_code(const IrPtr& program){
    try {
        emitter().emit(program);
    } catch(const EmissionError& e){
        return e.diagnostic().code;
    }
    return "";
}

} // namespace

TEST(EmitterRender, Literals){
    auto em = emitter();
    EXPECT_EQ(em.render(make_literal("hello"), QuoteContext::Word), "hello");
    EXPECT_EQ(em.render(make_literal("a b"), QuoteContext::Word), "'a b'");
    EXPECT_EQ(em.render(make_literal(""), QuoteContext::Word), "''");
    EXPECT_EQ(em.render(make_literal("it's"), QuoteContext::Word), "'it'\\''s'");
    EXPECT_EQ(em.render(make_literal("$x `y`"), QuoteContext::DoubleQuoted), "\\$x \\`y\\`");
}

TEST(EmitterRender, VariablesAreBracedQuotedAndMangled){
    auto em = emitter();
    EXPECT_EQ(em.render(make_var("x"), QuoteContext::Word), "\"${x}\"");
    EXPECT_EQ(em.render(make_var("IFS"), QuoteContext::Word), "\"${_rl_IFS}\"");
    EXPECT_EQ(em.render(make_var("x"), QuoteContext::DoubleQuoted), "${x}");
}

TEST(EmitterRender, Concat){
    auto em = emitter();
    EXPECT_EQ(em.render(make_concat({make_literal("a"), make_literal("b c")}), QuoteContext::Word), "'ab c'");
    EXPECT_EQ(em.render(make_concat({make_literal("x=\""), make_var("v")}), QuoteContext::Word), "\"x=\\\"${v}\"");
}

TEST(EmitterRender, EnvironmentDefaultEscapesClosingBrace){
    auto em = emitter();
    EXPECT_EQ(em.render(make_env("HOME"), QuoteContext::Word), "\"${HOME}\"");
    EXPECT_EQ(em.render(make_env("X", make_literal("a}$b")), QuoteContext::Word), "\"${X:-${posixc_default_1}}\"");
    EXPECT_EQ(em.render(make_env("X", make_var("d")), QuoteContext::Word), "\"${X:-${d}}\"");
    EXPECT_EQ(em.render(make_env("X", make_literal("/usr/local")), QuoteContext::Word), "\"${X:-/usr/local}\"");
    EXPECT_EQ(em.default_constants(), std::vector<std::string>{"a}$b"});
}

TEST(EmitterRender, QuotedDefaultsBecomeConstants){
    auto em = emitter();
    auto quote = make_env("A", make_literal("it's"));
    auto again = make_env("B", make_concat({make_literal("it's"), make_var("x"), make_literal("a b")}));
    auto script = em.emit(make_seq({make_function("main", {}, make_seq({make_echo(quote), make_echo(again)}))}));
    EXPECT_NE(script.find("export LC_ALL=C\nposixc_default_1='it'\\''s'\n"), std::string::npos) << script;
    EXPECT_NE(script.find("\"${A:-${posixc_default_1}}\""), std::string::npos) << script;
    EXPECT_NE(script.find("\"${B:-${posixc_default_1}${x}a b}\""), std::string::npos) << script;
    EXPECT_EQ(script.find("posixc_default_2"), std::string::npos) << script;

    auto plain = em.emit(make_seq({make_function("main", {}, make_echo(make_env("A", make_literal("x"))))}));
    EXPECT_EQ(plain.find("posixc_default_"), std::string::npos) << plain;
}

TEST(EmitterRender, Arithmetic){
    auto em = emitter();
    auto neg = make_arith(ArithOp::Sub, make_literal("5"), make_literal("-3"));
    EXPECT_EQ(em.render(neg, QuoteContext::Word), "\"$((5 - (-3)))\"");
    EXPECT_EQ(em.render(neg, QuoteContext::Assignment), "$((5 - (-3)))");
    auto nested = make_arith(ArithOp::Mul, make_arith(ArithOp::Add, make_var("a"), make_literal("1")), make_literal("2"));
    EXPECT_EQ(em.render(nested, QuoteContext::Arithmetic), "(${a} + 1) * 2");
    EXPECT_EQ(em.render(make_arith(ArithOp::Shl, make_var("a"), make_literal("2")), QuoteContext::Arithmetic), "${a} << 2");
}

TEST(EmitterRender, NonIntegerInArithmeticIsRejected){
    auto em = emitter();
    try {
        em.render(make_arith(ArithOp::Add, make_literal("x"), make_literal("1")), QuoteContext::Arithmetic);
        FAIL() << "expected EmissionError";
    } catch(const EmissionError& e){
        EXPECT_EQ(e.diagnostic().code, "E0303");
    }
}

TEST(EmitterRender, ArgumentsAndStatus){
    auto em = emitter();
    EXPECT_EQ(em.render(make_positional(2), QuoteContext::Word), "\"${2}\"");
    EXPECT_EQ(em.render(make_arg_list(), QuoteContext::Word), "\"$@\"");
    EXPECT_EQ(em.render(make_arg_list(), QuoteContext::DoubleQuoted), "$*");
    EXPECT_EQ(em.render(make_arg_count(), QuoteContext::Word), "\"${#}\"");
    EXPECT_EQ(em.render(make_exit_status(), QuoteContext::Word), "\"${?}\"");
}

TEST(EmitterRender, CommandSubstitution){
    auto em = emitter();
    EXPECT_EQ(em.render(make_command_subst(make_call(CallKind::User, "two", {})), QuoteContext::Word), "\"$(two)\"");
    auto ext = make_call(CallKind::External, "printf", {make_literal("%s"), make_literal("a;b")});
    EXPECT_EQ(em.render(make_command_subst(ext), QuoteContext::Word), "\"$(printf %s 'a;b')\"");
}

TEST(EmitterRender, BooleanValuesAreCaptured){
    auto em = emitter();
    auto cmp = make_compare(CmpOp::StrEq, make_var("a"), make_literal("x"));
    EXPECT_EQ(em.render(cmp, QuoteContext::Word),
              "\"$(if [ \"${a}\" = x ]; then printf '%s' true; else printf '%s' false; fi)\"");
}

TEST(EmitterCondition, Forms){
    auto em = emitter();
    EXPECT_EQ(em.render_condition(make_compare(CmpOp::NumLt, make_var("n"), make_literal("3"))), "[ \"${n}\" -lt 3 ]");
    EXPECT_EQ(em.render_condition(make_literal("true")), "true");
    EXPECT_EQ(em.render_condition(make_var("f")), "[ \"${f}\" = true ]");
    EXPECT_EQ(em.render_condition(make_arith(ArithOp::Mod, make_var("n"), make_literal("2"))), "[ \"$((${n} % 2))\" -ne 0 ]");
    EXPECT_EQ(em.render_condition(make_arg_list()), "[ \"${#}\" -ne 0 ]");
    EXPECT_EQ(em.render_condition(make_logical(LogicOp::Not, make_var("f"))), "! [ \"${f}\" = true ]");
}

TEST(EmitterCondition, NestedLogicalIsGrouped){
    auto em = emitter();
    auto inner = make_logical(LogicOp::Or, make_var("a"), make_var("b"));
    auto outer = make_logical(LogicOp::And, make_compare(CmpOp::NumGe, make_var("n"), make_literal("0")), inner);
    EXPECT_EQ(em.render_condition(outer),
              "[ \"${n}\" -ge 0 ] && { [ \"${a}\" = true ] || [ \"${b}\" = true ]; }");
}

TEST(Emitter, HeaderAndEntryPoint){
    auto script = emit_main(make_seq({}));
    const std::string header = std::string("#!/bin/sh\n# Generated by posixc ") + generator_version() +
        "\n# Source: demo.rs (sha256:abc123)\nset -euf\nIFS=' \t\n'\nexport LC_ALL=C\n";
    EXPECT_EQ(script.substr(0, header.size()), header);
    EXPECT_NE(script.find("\nmain() {\n    :\n}\n"), std::string::npos) << script;
    const std::string tail = "\nmain \"$@\"\n";
    ASSERT_GE(script.size(), tail.size());
    EXPECT_EQ(script.substr(script.size() - tail.size()), tail);
}

TEST(Emitter, SourceNameIsSanitized){
    PosixEmitter em(EmitOptions{"bad\nname.rs", ""});
    auto script = em.emit(program_with_main(nullptr));
    EXPECT_NE(script.find("# Source: bad?name.rs\n"), std::string::npos) << script;
}

TEST(Emitter, ElifChain){
    auto body = make_if(make_var("a"), make_echo(make_literal("1")),
                        make_if(make_var("b"), make_echo(make_literal("2")), make_echo(make_literal("3"))));
    auto script = emit_main(body);
    EXPECT_NE(script.find(
        "    if [ \"${a}\" = true ]; then\n"
        "        printf '%s\\n' 1\n"
        "    elif [ \"${b}\" = true ]; then\n"
        "        printf '%s\\n' 2\n"
        "    else\n"
        "        printf '%s\\n' 3\n"
        "    fi\n"), std::string::npos) << script;
}

TEST(Emitter, CasePatternsAreQuoted){
    std::vector<ir::CaseArm> arms;
    arms.push_back(ir::CaseArm{{"a b", "c"}, false, make_echo(make_literal("1"))});
    arms.push_back(ir::CaseArm{{}, true, make_seq({})});
    auto script = emit_main(make_case(make_var("m"), std::move(arms)));
    EXPECT_NE(script.find(
        "    case \"${m}\" in\n"
        "        'a b'|c)\n"
        "            printf '%s\\n' 1\n"
        "            ;;\n"
        "        *)\n"
        "            :\n"
        "            ;;\n"
        "    esac\n"), std::string::npos) << script;
}

TEST(Emitter, LoopsAndControl){
    auto body = make_seq({
        make_for("i", make_literal("0"), make_var("n"), make_seq({make_continue()})),
        make_for_each("w", {make_literal("x"), make_var("y")}, make_break()),
        make_while(make_compare(CmpOp::NumLt, make_var("i"), make_literal("3")), make_assign("i", make_arith(ArithOp::Add, make_var("i"), make_literal("1")))),
        make_exit(make_literal("3")),
    });
    auto script = emit_main(body);
    EXPECT_NE(script.find("    for i in $(seq 0 \"${n}\"); do\n        continue\n    done\n"), std::string::npos) << script;
    EXPECT_NE(script.find("    for w in x \"${y}\"; do\n        break\n    done\n"), std::string::npos) << script;
    EXPECT_NE(script.find("    while [ \"${i}\" -lt 3 ]; do\n        i=$((${i} + 1))\n    done\n"), std::string::npos) << script;
    EXPECT_NE(script.find("    exit 3\n"), std::string::npos) << script;
}

TEST(Emitter, EmptyForEachEmitsNothing){
    auto script = emit_main(make_for_each("x", {}, make_echo(make_var("x"))));
    EXPECT_EQ(script.find("for x"), std::string::npos);
    EXPECT_NE(script.find("main() {\n    :\n}\n"), std::string::npos) << script;
}

TEST(Emitter, FunctionsBindParameters){
    auto greet = make_function("greet", {"name"}, make_seq({make_echo(make_var("name")), make_return()}));
    auto reserved = make_function("test", {}, make_echo(make_literal("t"), Stream::Stderr));
    auto main_body = make_seq({
        make_call(CallKind::User, "greet", {make_literal("world")}),
        make_call(CallKind::User, "test", {}, true),
    });
    auto script = emitter().emit(program_with_main(main_body, {greet, reserved}));
    EXPECT_NE(script.find("greet() {\n    name=\"${1}\"\n    printf '%s\\n' \"${name}\"\n    return 0\n}\n"), std::string::npos) << script;
    EXPECT_NE(script.find("_rl_test() {\n    printf '%s\\n' t >&2\n}\n"), std::string::npos) << script;
    EXPECT_NE(script.find("    greet world\n    _rl_test >/dev/null\n"), std::string::npos) << script;
    EXPECT_LT(script.find("greet() {"), script.find("main() {"));
}

TEST(Emitter, RuntimeHelpersAreIncludedSorted){
    auto upper = make_command_subst(make_call(CallKind::Runtime, "posixc_string_to_upper", {make_var("s")}));
    auto len = make_command_subst(make_call(CallKind::Runtime, "posixc_string_len", {make_var("s")}));
    auto program = program_with_main(make_seq({make_echo(upper), make_echo(len)}));

    auto names = PosixEmitter::referenced_runtime(program);
    EXPECT_EQ(names, (std::set<std::string>{"posixc_string_len", "posixc_string_to_upper"}));

    auto script = emitter().emit(program);
    auto len_at = script.find(find_runtime("posixc_string_len")->text);
    auto upper_at = script.find(find_runtime("posixc_string_to_upper")->text);
    ASSERT_NE(len_at, std::string::npos);
    ASSERT_NE(upper_at, std::string::npos);
    EXPECT_LT(len_at, upper_at);
    EXPECT_LT(upper_at, script.find("main() {"));
    EXPECT_EQ(script.find("posixc_fs_copy"), std::string::npos);
}

TEST(Emitter, StructuralErrors){
    EXPECT_EQ(emission_code(make_seq({make_function("helper", {}, nullptr)})), "E0301");
    EXPECT_EQ(emission_code(make_seq({make_echo(make_literal("x"))})), "E0301");
    EXPECT_EQ(emission_code(program_with_main(make_function("inner", {}, nullptr))), "E0301");
    EXPECT_EQ(emission_code(program_with_main(make_call(CallKind::Runtime, "posixc_nope", {}))), "E0302");
    EXPECT_EQ(emission_code(program_with_main(make_echo(make_command_subst(make_echo(make_literal("x")))))), "E0304");
}
