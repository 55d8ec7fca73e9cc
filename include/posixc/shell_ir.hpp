// Immutable intermediate representation between lowering and emission.
// Both unions are closed: every consumer visits them exhaustively.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace posixc {

struct ShellValue;
struct ShellIR;
using ValuePtr = std::shared_ptr<const ShellValue>;
using IrPtr = std::shared_ptr<const ShellIR>;

enum class ArithOp { Add, Sub, Mul, Div, Mod, BitAnd, BitOr, BitXor, Shl, Shr };
enum class CmpOp { NumEq, NumNe, NumLt, NumLe, NumGt, NumGe, StrEq, StrNe };
enum class LogicOp { And, Or, Not };
enum class Stream { Stdout, Stderr };
enum class CallKind { User, Runtime, External };

namespace val {
struct Literal { std::string text; };
struct VariableRef { std::string name; };
struct Concat { std::vector<ValuePtr> parts; };
struct CommandSubst { IrPtr command; };              // command is an ir::Call
struct EnvVar { std::string name; ValuePtr default_value; }; // default may be null
struct Arithmetic { ArithOp op; ValuePtr lhs; ValuePtr rhs; };
struct Positional { int index=1; };
struct ArgList {};
struct ArgCount {};
struct ExitStatus {};
struct Compare { CmpOp op; ValuePtr lhs; ValuePtr rhs; };
struct Logical { LogicOp op; ValuePtr lhs; ValuePtr rhs; }; // rhs is null for Not
} // namespace val

struct ShellValue {
    using variant_t = std::variant<val::Literal, val::VariableRef, val::Concat, val::CommandSubst,
                                   val::EnvVar, val::Arithmetic, val::Positional, val::ArgList,
                                   val::ArgCount, val::ExitStatus, val::Compare, val::Logical>;
    variant_t v;
};

namespace ir {
struct Assign { std::string name; ValuePtr value; };
struct Echo { ValuePtr value; Stream stream=Stream::Stdout; };
struct If { ValuePtr test; IrPtr then_branch; IrPtr else_branch; }; // else may be null
struct CaseArm { std::vector<std::string> patterns; bool wildcard=false; IrPtr body; };
struct Case { ValuePtr scrutinee; std::vector<CaseArm> arms; };
struct For { std::string var; ValuePtr first; ValuePtr last; IrPtr body; }; // inclusive bounds
struct ForEach { std::string var; std::vector<ValuePtr> items; IrPtr body; };
struct While { ValuePtr test; IrPtr body; };
struct FunctionDef { std::string name; std::vector<std::string> params; IrPtr body; };
struct Call { CallKind kind=CallKind::User; std::string program; std::vector<ValuePtr> args; bool discard_output=false; };
struct Return {};
struct Exit { ValuePtr status; };
struct Break {};
struct Continue {};
struct Seq { std::vector<IrPtr> items; };
} // namespace ir

struct ShellIR {
    using variant_t = std::variant<ir::Assign, ir::Echo, ir::If, ir::Case, ir::For, ir::ForEach,
                                   ir::While, ir::FunctionDef, ir::Call, ir::Return, ir::Exit,
                                   ir::Break, ir::Continue, ir::Seq>;
    variant_t v;
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Value constructors
ValuePtr make_literal(std::string text);
ValuePtr make_var(std::string name);
ValuePtr make_concat(std::vector<ValuePtr> parts);
ValuePtr make_command_subst(IrPtr call);
ValuePtr make_env(std::string name, ValuePtr default_value = nullptr);
ValuePtr make_arith(ArithOp op, ValuePtr lhs, ValuePtr rhs);
ValuePtr make_positional(int index);
ValuePtr make_arg_list();
ValuePtr make_arg_count();
ValuePtr make_exit_status();
ValuePtr make_compare(CmpOp op, ValuePtr lhs, ValuePtr rhs);
ValuePtr make_logical(LogicOp op, ValuePtr lhs, ValuePtr rhs = nullptr);

// Statement constructors
IrPtr make_assign(std::string name, ValuePtr value);
IrPtr make_echo(ValuePtr value, Stream stream = Stream::Stdout);
IrPtr make_if(ValuePtr test, IrPtr then_branch, IrPtr else_branch = nullptr);
IrPtr make_case(ValuePtr scrutinee, std::vector<ir::CaseArm> arms);
IrPtr make_for(std::string var, ValuePtr first, ValuePtr last, IrPtr body);
IrPtr make_for_each(std::string var, std::vector<ValuePtr> items, IrPtr body);
IrPtr make_while(ValuePtr test, IrPtr body);
IrPtr make_function(std::string name, std::vector<std::string> params, IrPtr body);
IrPtr make_call(CallKind kind, std::string program, std::vector<ValuePtr> args, bool discard_output = false);
IrPtr make_return();
IrPtr make_exit(ValuePtr status);
IrPtr make_break();
IrPtr make_continue();
IrPtr make_seq(std::vector<IrPtr> items);

// Literal helpers
bool is_integer_text(const std::string& s);
std::optional<long long> integer_value(const ShellValue& v);
std::optional<bool> bool_value(const ShellValue& v);
bool is_valid_identifier(const std::string& s);

// True when every leaf of v produces an integer inside $(( )).
bool is_numeric_value(const ShellValue& v);

const char* arith_symbol(ArithOp op);
const char* cmp_name(CmpOp op);

// Structural equality over values and statements.
bool ir_equal(const ValuePtr& a, const ValuePtr& b);
bool ir_equal(const IrPtr& a, const IrPtr& b);

// EDN-flavoured S-expression dump, e.g. (assign home (env "HOME")).
std::string to_sexpr(const ValuePtr& v);
std::string to_sexpr(const IrPtr& n);

} // namespace posixc
