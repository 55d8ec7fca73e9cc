#include "posixc/shell_ir.hpp"
#include <cerrno>
#include <cstdlib>

namespace posixc {

static ValuePtr wrap(ShellValue::variant_t v){ return std::make_shared<const ShellValue>(ShellValue{std::move(v)}); }
static IrPtr wrap_ir(ShellIR::variant_t v){ return std::make_shared<const ShellIR>(ShellIR{std::move(v)}); }

ValuePtr make_literal(std::string text){ return wrap(val::Literal{std::move(text)}); }
ValuePtr make_var(std::string name){ return wrap(val::VariableRef{std::move(name)}); }
ValuePtr make_concat(std::vector<ValuePtr> parts){ return wrap(val::Concat{std::move(parts)}); }
ValuePtr make_command_subst(IrPtr call){ return wrap(val::CommandSubst{std::move(call)}); }
ValuePtr make_env(std::string name, ValuePtr default_value){ return wrap(val::EnvVar{std::move(name), std::move(default_value)}); }
ValuePtr make_arith(ArithOp op, ValuePtr lhs, ValuePtr rhs){ return wrap(val::Arithmetic{op, std::move(lhs), std::move(rhs)}); }
ValuePtr make_positional(int index){ return wrap(val::Positional{index}); }
ValuePtr make_arg_list(){ return wrap(val::ArgList{}); }
ValuePtr make_arg_count(){ return wrap(val::ArgCount{}); }
ValuePtr make_exit_status(){ return wrap(val::ExitStatus{}); }
ValuePtr make_compare(CmpOp op, ValuePtr lhs, ValuePtr rhs){ return wrap(val::Compare{op, std::move(lhs), std::move(rhs)}); }
ValuePtr make_logical(LogicOp op, ValuePtr lhs, ValuePtr rhs){ return wrap(val::Logical{op, std::move(lhs), std::move(rhs)}); }

IrPtr make_assign(std::string name, ValuePtr value){ return wrap_ir(ir::Assign{std::move(name), std::move(value)}); }
IrPtr make_echo(ValuePtr value, Stream stream){ return wrap_ir(ir::Echo{std::move(value), stream}); }
IrPtr make_if(ValuePtr test, IrPtr then_branch, IrPtr else_branch){ return wrap_ir(ir::If{std::move(test), std::move(then_branch), std::move(else_branch)}); }
IrPtr make_case(ValuePtr scrutinee, std::vector<ir::CaseArm> arms){ return wrap_ir(ir::Case{std::move(scrutinee), std::move(arms)}); }
IrPtr make_for(std::string var, ValuePtr first, ValuePtr last, IrPtr body){ return wrap_ir(ir::For{std::move(var), std::move(first), std::move(last), std::move(body)}); }
IrPtr make_for_each(std::string var, std::vector<ValuePtr> items, IrPtr body){ return wrap_ir(ir::ForEach{std::move(var), std::move(items), std::move(body)}); }
IrPtr make_while(ValuePtr test, IrPtr body){ return wrap_ir(ir::While{std::move(test), std::move(body)}); }
IrPtr make_function(std::string name, std::vector<std::string> params, IrPtr body){ return wrap_ir(ir::FunctionDef{std::move(name), std::move(params), std::move(body)}); }
IrPtr make_call(CallKind kind, std::string program, std::vector<ValuePtr> args, bool discard_output){ return wrap_ir(ir::Call{kind, std::move(program), std::move(args), discard_output}); }
IrPtr make_return(){ return wrap_ir(ir::Return{}); }
IrPtr make_exit(ValuePtr status){ return wrap_ir(ir::Exit{std::move(status)}); }
IrPtr make_break(){ return wrap_ir(ir::Break{}); }
IrPtr make_continue(){ return wrap_ir(ir::Continue{}); }
IrPtr make_seq(std::vector<IrPtr> items){ return wrap_ir(ir::Seq{std::move(items)}); }

bool is_integer_text(const std::string& s){
    size_t i = 0;
    if(!s.empty() && s[0]=='-') i = 1;
    if(i >= s.size()) return false;
    for(; i<s.size(); ++i) if(s[i] < '0' || s[i] > '9') return false;
    return true;
}

std::optional<long long> integer_value(const ShellValue& v){
    const auto* lit = std::get_if<val::Literal>(&v.v);
    if(!lit || !is_integer_text(lit->text)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(lit->text.c_str(), &end, 10);
    if(errno == ERANGE || !end || *end) return std::nullopt;
    return n;
}

std::optional<bool> bool_value(const ShellValue& v){
    const auto* lit = std::get_if<val::Literal>(&v.v);
    if(!lit) return std::nullopt;
    if(lit->text == "true") return true;
    if(lit->text == "false") return false;
    return std::nullopt;
}

bool is_valid_identifier(const std::string& s){
    if(s.empty()) return false;
    auto first_ok = [](char c){ return (c>='a'&&c<='z') || (c>='A'&&c<='Z') || c=='_'; };
    if(!first_ok(s[0])) return false;
    for(char c : s) if(!first_ok(c) && !(c>='0'&&c<='9')) return false;
    return true;
}

bool is_numeric_value(const ShellValue& v){
    auto numeric = [](const ValuePtr& p){ return p && is_numeric_value(*p); };
    return std::visit(overloaded{
        [](const val::Literal& x){ return is_integer_text(x.text); },
        [](const val::VariableRef&){ return true; },
        [&](const val::Concat& x){
            if(x.parts.empty()) return false;
            for(const auto& p : x.parts) if(!numeric(p)) return false;
            return true;
        },
        [](const val::CommandSubst&){ return true; },
        [&](const val::EnvVar& x){ return !x.default_value || numeric(x.default_value); },
        [&](const val::Arithmetic& x){ return numeric(x.lhs) && numeric(x.rhs); },
        [](const val::Positional&){ return true; },
        [](const val::ArgList&){ return false; },
        [](const val::ArgCount&){ return true; },
        [](const val::ExitStatus&){ return true; },
        [&](const val::Compare& x){
            if(x.op == CmpOp::StrEq || x.op == CmpOp::StrNe) return false;
            return numeric(x.lhs) && numeric(x.rhs);
        },
        [&](const val::Logical& x){ return numeric(x.lhs) && (x.op == LogicOp::Not || numeric(x.rhs)); },
    }, v.v);
}

const char* arith_symbol(ArithOp op){
    switch(op){
        case ArithOp::Add: return "+"; case ArithOp::Sub: return "-";
        case ArithOp::Mul: return "*"; case ArithOp::Div: return "/";
        case ArithOp::Mod: return "%"; case ArithOp::BitAnd: return "&";
        case ArithOp::BitOr: return "|"; case ArithOp::BitXor: return "^";
        case ArithOp::Shl: return "<<"; case ArithOp::Shr: return ">>";
    }
    return "?";
}

const char* cmp_name(CmpOp op){
    switch(op){
        case CmpOp::NumEq: return "-eq"; case CmpOp::NumNe: return "-ne";
        case CmpOp::NumLt: return "-lt"; case CmpOp::NumLe: return "-le";
        case CmpOp::NumGt: return "-gt"; case CmpOp::NumGe: return "-ge";
        case CmpOp::StrEq: return "="; case CmpOp::StrNe: return "!=";
    }
    return "?";
}

} // namespace posixc
