#include "lower_internal.hpp"
#include "posixc/validator.hpp"

using namespace posixc;

namespace rustlite::detail {

[[noreturn]] static void no_value(const std::string& what, const SourceSpan& span){
    lowering_error("E0221", what + " has no value", span, "call it as a statement");
}

LoweredValue Lowerer::numeric(LoweredValue v, const SourceSpan& span) const {
    if(v.kind != ValueKind::Int || !is_numeric_value(*v.value))
        lowering_error("E0208", std::string("arithmetic operand is not numeric (") + kind_name(v.kind) + ")", span,
                       "only integers may appear in arithmetic");
    return v;
}

LoweredValue Lowerer::lower_variable(const std::string& name, const SourceSpan& span){
    const VarInfo* v = lookup(name);
    if(!v) lowering_error("E0214", "unknown variable '" + name + "'", span);
    if(v->is_array)
        lowering_error("E0213", "array '" + name + "' cannot be used as a value", span,
                       "index it with a literal or iterate it with for");
    return {make_var(v->shell), v->kind};
}

bool Lowerer::is_array_expr(const Expr& e) const {
    if(std::holds_alternative<expr::ArrayLit>(e.v)) return true;
    if(const auto* m = std::get_if<expr::MacroCall>(&e.v)) return m->name == "vec";
    return false;
}

std::vector<LoweredValue> Lowerer::array_elements(const Expr& e, const SourceSpan& span){
    std::vector<LoweredValue> out;
    if(const auto* a = std::get_if<expr::ArrayLit>(&e.v)){
        for(const auto& x : a->elems) out.push_back(lower_value(*x));
        return out;
    }
    if(const auto* m = std::get_if<expr::MacroCall>(&e.v)){
        const MacroSpec* spec = builtin_macros().find(m->name);
        if(spec) return spec->expand(*m, span, *this).elements;
    }
    lowering_error("E0299", "array expression expected", span);
}

std::vector<ValuePtr> Lowerer::lower_args(const std::vector<ExprPtr>& args){
    std::vector<ValuePtr> out;
    for(const auto& a : args) out.push_back(lower_value(*a).value);
    return out;
}

std::vector<ValuePtr> Lowerer::lower_params(const Function& f, const expr::Call& c){
    std::vector<ValuePtr> out;
    for(size_t i = 0; i < c.args.size(); ++i){
        LoweredValue v = lower_value(*c.args[i]);
        check_kind(f.params[i].type.kind, v.kind, c.args[i]->span, "parameter '" + f.params[i].name + "' of '" + f.name + "'");
        out.push_back(v.value);
    }
    return out;
}

LoweredValue Lowerer::lower_value(const Expr& e){
    return std::visit(overloaded{
        [&](const expr::IntLit& x) -> LoweredValue { return {make_literal(std::to_string(x.value)), ValueKind::Int}; },
        [&](const expr::StrLit& x) -> LoweredValue { return {make_literal(x.value), ValueKind::Str}; },
        [&](const expr::BoolLit& x) -> LoweredValue { return {make_literal(x.value ? "true" : "false"), ValueKind::Bool}; },
        [&](const expr::Var& x) -> LoweredValue { return lower_variable(x.name, e.span); },
        [&](const expr::Unary& x) -> LoweredValue { return lower_unary(x, e.span); },
        [&](const expr::Binary& x) -> LoweredValue { return lower_binary(x, e.span); },
        [&](const expr::Call& x) -> LoweredValue { return lower_call(x, e.span); },
        [&](const expr::MethodCall& x) -> LoweredValue { return lower_method(x, e.span); },
        [&](const expr::MacroCall& x) -> LoweredValue {
            const MacroSpec* spec = builtin_macros().find(x.name);
            if(!spec) lowering_error("E0299", "macro '" + x.name + "!' reached lowering", e.span);
            if(x.name == "vec")
                lowering_error("E0213", "vec! is only allowed as a let initializer or a for iterable", e.span);
            MacroExpansion out = spec->expand(x, e.span, *this);
            if(!out.value.value) no_value(x.name + "!", e.span);
            return out.value;
        },
        [&](const expr::ArrayLit&) -> LoweredValue {
            lowering_error("E0213", "array literals are only allowed as a let initializer or a for iterable", e.span);
        },
        [&](const expr::Index& x) -> LoweredValue { return lower_index(x, e.span); },
        [&](const expr::Range&) -> LoweredValue {
            lowering_error("E0220", "ranges are only allowed as for-loop iterables", e.span);
        },
        [&](const expr::BlockExpr&) -> LoweredValue {
            lowering_error("E0221", "block expressions are only allowed as let initializers, assignments and tails", e.span);
        },
        [&](const If&) -> LoweredValue {
            lowering_error("E0221", "if expressions are only allowed as let initializers, assignments and tails", e.span,
                           "bind the result with let first");
        },
        [&](const Match&) -> LoweredValue {
            lowering_error("E0221", "match expressions are only allowed as let initializers, assignments and tails", e.span,
                           "bind the result with let first");
        },
    }, e.v);
}

LoweredValue Lowerer::lower_unary(const expr::Unary& u, const SourceSpan& span){
    LoweredValue v = lower_value(*u.operand);
    if(u.op == UnOp::Not){
        if(v.kind == ValueKind::Int){
            // bitwise complement: !x == -x - 1
            numeric(v, span);
            return {make_arith(ArithOp::Sub, make_arith(ArithOp::Sub, make_literal("0"), v.value), make_literal("1")), ValueKind::Int};
        }
        return {make_logical(LogicOp::Not, v.value), ValueKind::Bool};
    }
    numeric(v, span);
    if(auto n = integer_value(*v.value)) return {make_literal(std::to_string(-*n)), ValueKind::Int};
    return {make_arith(ArithOp::Sub, make_literal("0"), v.value), ValueKind::Int};
}

static std::vector<ValuePtr> concat_parts(const ValuePtr& v){
    if(const auto* c = std::get_if<val::Concat>(&v->v)) return c->parts;
    return {v};
}

LoweredValue Lowerer::lower_binary(const expr::Binary& b, const SourceSpan& span){
    LoweredValue l = lower_value(*b.lhs);
    LoweredValue r = lower_value(*b.rhs);
    const bool textual = l.kind == ValueKind::Str || r.kind == ValueKind::Str;
    const bool boolean = l.kind == ValueKind::Bool || r.kind == ValueKind::Bool;

    auto arith = [&](ArithOp op) -> LoweredValue {
        numeric(l, b.lhs->span);
        numeric(r, b.rhs->span);
        return {make_arith(op, l.value, r.value), ValueKind::Int};
    };
    auto compare = [&](CmpOp num_op) -> LoweredValue {
        if(textual || boolean)
            lowering_error("E0212", "ordering comparison of " + std::string(kind_name(textual ? ValueKind::Str : ValueKind::Bool)) +
                           " values is not supported", span, "compare strings with == or !=");
        numeric(l, b.lhs->span);
        numeric(r, b.rhs->span);
        return {make_compare(num_op, l.value, r.value), ValueKind::Bool};
    };
    auto equality = [&](bool eq) -> LoweredValue {
        if(textual || boolean || !is_numeric_value(*l.value) || !is_numeric_value(*r.value))
            return {make_compare(eq ? CmpOp::StrEq : CmpOp::StrNe, l.value, r.value), ValueKind::Bool};
        return {make_compare(eq ? CmpOp::NumEq : CmpOp::NumNe, l.value, r.value), ValueKind::Bool};
    };

    switch(b.op){
        case BinOp::Add:
            if(textual){
                auto parts = concat_parts(l.value);
                for(auto& p : concat_parts(r.value)) parts.push_back(p);
                return {make_concat(std::move(parts)), ValueKind::Str};
            }
            return arith(ArithOp::Add);
        case BinOp::Sub: return arith(ArithOp::Sub);
        case BinOp::Mul: return arith(ArithOp::Mul);
        case BinOp::Div: return arith(ArithOp::Div);
        case BinOp::Rem: return arith(ArithOp::Mod);
        case BinOp::BitAnd:
            if(boolean) return {make_logical(LogicOp::And, l.value, r.value), ValueKind::Bool};
            return arith(ArithOp::BitAnd);
        case BinOp::BitOr:
            if(boolean) return {make_logical(LogicOp::Or, l.value, r.value), ValueKind::Bool};
            return arith(ArithOp::BitOr);
        case BinOp::BitXor:
            if(boolean) return {make_compare(CmpOp::StrNe, l.value, r.value), ValueKind::Bool};
            return arith(ArithOp::BitXor);
        case BinOp::Shl: return arith(ArithOp::Shl);
        case BinOp::Shr: return arith(ArithOp::Shr);
        case BinOp::Eq: return equality(true);
        case BinOp::Ne: return equality(false);
        case BinOp::Lt: return compare(CmpOp::NumLt);
        case BinOp::Le: return compare(CmpOp::NumLe);
        case BinOp::Gt: return compare(CmpOp::NumGt);
        case BinOp::Ge: return compare(CmpOp::NumGe);
        case BinOp::And: return {make_logical(LogicOp::And, l.value, r.value), ValueKind::Bool};
        case BinOp::Or: return {make_logical(LogicOp::Or, l.value, r.value), ValueKind::Bool};
    }
    lowering_error("E0299", "binary operator without a lowering rule", span);
}

// ---- calls

static void check_arity(const std::string& name, size_t given, int min, int max, const SourceSpan& span){
    if(static_cast<int>(given) < min || (max >= 0 && static_cast<int>(given) > max)){
        std::string expected = min == max ? std::to_string(min)
                             : max < 0 ? "at least " + std::to_string(min)
                             : std::to_string(min) + " to " + std::to_string(max);
        lowering_error("E0206", "'" + name + "' takes " + expected + " argument(s) but " + std::to_string(given) + " were given", span);
    }
}

std::string Lowerer::env_name(const expr::Call& c, const SourceSpan& span) const {
    const auto* lit = std::get_if<expr::StrLit>(&c.args.front()->v);
    if(!lit)
        lowering_error("E0202", c.callee + "() needs a string literal variable name", span,
                       "environment variable names must be known at compile time");
    if(!is_valid_identifier(lit->value))
        lowering_error("E0201", "invalid environment variable name '" + lit->value + "'", c.args.front()->span,
                       "names must match [A-Za-z_][A-Za-z0-9_]*");
    return lit->value;
}

static bool is_command_name(const std::string& s){
    if(s.empty()) return false;
    for(char c : s){
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '.' || c == '/' || c == '+' || c == '-';
        if(!ok) return false;
    }
    return s.front() != '-';
}

IrPtr Lowerer::lower_exec(const expr::Call& c, const SourceSpan& span){
    const auto* lit = std::get_if<expr::StrLit>(&c.args.front()->v);
    if(!lit) lowering_error("E0211", "exec() needs a literal program name", span, "the program must be known at compile time");
    const std::string& program = lit->value;
    if(!is_command_name(program))
        lowering_error("E0211", "invalid program name '" + program + "'", c.args.front()->span, "use a plain command name or path");
    auto slash = program.rfind('/');
    const std::string base = slash == std::string::npos ? program : program.substr(slash + 1);
    if(is_evaluating_builtin(base))
        lowering_error("E0211", "exec() cannot run '" + program + "', which evaluates shell code", c.args.front()->span);
    std::vector<ValuePtr> args;
    for(size_t i = 1; i < c.args.size(); ++i) args.push_back(lower_value(*c.args[i]).value);
    IrPtr call = make_call(CallKind::External, program, std::move(args));
    if(is_dynamic_evaluation(std::get<ir::Call>(call->v)))
        lowering_error("E0211", "exec() of '" + program + "' would evaluate text as shell code", span);
    return call;
}

LoweredValue Lowerer::lower_call(const expr::Call& c, const SourceSpan& span){
    if(auto it = functions_.find(c.callee); it != functions_.end()){
        const Function& f = *it->second;
        check_arity(c.callee, c.args.size(), static_cast<int>(f.params.size()), static_cast<int>(f.params.size()), span);
        if(f.ret.kind == ValueKind::Unit) no_value("call to '" + c.callee + "'", span);
        return {make_command_subst(make_call(CallKind::User, c.callee, lower_params(f, c))), f.ret.kind};
    }
    const StdlibFunction* fn = find_stdlib(c.callee);
    if(!fn) lowering_error("E0205", "unknown function '" + c.callee + "'", span);
    check_arity(c.callee, c.args.size(), fn->min_args, fn->max_args, span);
    switch(fn->op){
        case StdlibOp::Env:
            return {make_env(env_name(c, span)), ValueKind::Str};
        case StdlibOp::EnvOr: {
            std::string name = env_name(c, span);
            return {make_env(name, lower_value(*c.args[1]).value), ValueKind::Str};
        }
        case StdlibOp::Arg: {
            const auto* lit = std::get_if<expr::IntLit>(&c.args.front()->v);
            if(!lit) lowering_error("E0209", "arg() needs a literal position", span, "iterate args() for dynamic access");
            if(lit->value < 1) lowering_error("E0210", "argument positions start at 1", span);
            return {make_positional(static_cast<int>(lit->value)), ValueKind::Str};
        }
        case StdlibOp::Args:
            lowering_error("E0213", "args() can only be iterated with for", span);
        case StdlibOp::ArgCount: return {make_arg_count(), ValueKind::Int};
        case StdlibOp::ExitCode: return {make_exit_status(), ValueKind::Int};
        case StdlibOp::Exit: no_value(c.callee + "()", span);
        case StdlibOp::Exec: return {make_command_subst(lower_exec(c, span)), ValueKind::Str};
        case StdlibOp::Identity: {
            LoweredValue v = lower_value(*c.args.front());
            return {v.value, ValueKind::Str};
        }
        case StdlibOp::Empty: return {make_literal(""), ValueKind::Str};
        case StdlibOp::Runtime:
            if(fn->result == ValueKind::Unit) no_value(c.callee + "()", span);
            return {make_command_subst(make_call(CallKind::Runtime, fn->runtime, lower_args(c.args))), fn->result};
    }
    lowering_error("E0299", "library function without a lowering rule", span);
}

IrPtr Lowerer::lower_call_stmt(const expr::Call& c, const SourceSpan& span){
    if(auto it = functions_.find(c.callee); it != functions_.end()){
        const Function& f = *it->second;
        check_arity(c.callee, c.args.size(), static_cast<int>(f.params.size()), static_cast<int>(f.params.size()), span);
        const bool discard = f.ret.kind != ValueKind::Unit;
        if(!discard && writes_stdout_[c.callee]) note_stdout_write(span);
        return make_call(CallKind::User, c.callee, lower_params(f, c), discard);
    }
    const StdlibFunction* fn = find_stdlib(c.callee);
    if(!fn) lowering_error("E0205", "unknown function '" + c.callee + "'", span);
    check_arity(c.callee, c.args.size(), fn->min_args, fn->max_args, span);
    switch(fn->op){
        case StdlibOp::Exit: return make_exit(numeric(lower_value(*c.args.front()), c.args.front()->span).value);
        case StdlibOp::Exec:
            note_stdout_write(span);
            return lower_exec(c, span);
        case StdlibOp::Runtime:
            return make_call(CallKind::Runtime, fn->runtime, lower_args(c.args), fn->result != ValueKind::Unit);
        case StdlibOp::Env:
        case StdlibOp::EnvOr:
        case StdlibOp::Arg:
        case StdlibOp::Args:
        case StdlibOp::ArgCount:
        case StdlibOp::ExitCode:
        case StdlibOp::Identity:
        case StdlibOp::Empty:
            break;
    }
    if(fn->op != StdlibOp::Args) lower_call(c, span); // checked, value unused
    return nullptr;
}

LoweredValue Lowerer::lower_method(const expr::MethodCall& m, const SourceSpan& span){
    const StdlibMethod* method = find_method(m.method);
    if(!method) lowering_error("E0299", "method '" + m.method + "' reached lowering", span);
    check_arity(m.method, m.args.size(), method->args, method->args, span);

    if(m.method == "len"){
        if(const auto* v = std::get_if<expr::Var>(&m.receiver->v)){
            const VarInfo* info = lookup(v->name);
            if(info && info->is_array) return {make_literal(std::to_string(info->elements.size())), ValueKind::Int};
        }
        if(is_array_expr(*m.receiver))
            return {make_literal(std::to_string(array_elements(*m.receiver, span).size())), ValueKind::Int};
    }
    LoweredValue recv = lower_value(*m.receiver);
    if(!method->runtime) return {recv.value, method->result == ValueKind::Unknown ? recv.kind : method->result};
    if(recv.kind == ValueKind::Int || recv.kind == ValueKind::Bool)
        lowering_error("E0208", "method '" + m.method + "' needs a string receiver", span);
    std::vector<ValuePtr> args{recv.value};
    for(auto& a : lower_args(m.args)) args.push_back(a);
    return {make_command_subst(make_call(CallKind::Runtime, method->runtime, std::move(args))), method->result};
}

LoweredValue Lowerer::lower_index(const expr::Index& x, const SourceSpan& span){
    const auto* base = std::get_if<expr::Var>(&x.base->v);
    const VarInfo* info = base ? lookup(base->name) : nullptr;
    if(!base || !info) {
        if(base) lowering_error("E0214", "unknown variable '" + base->name + "'", x.base->span);
        lowering_error("E0213", "only array variables can be indexed", span);
    }
    if(!info->is_array) lowering_error("E0213", "'" + base->name + "' is not an array", span);
    const auto* lit = std::get_if<expr::IntLit>(&x.index->v);
    if(!lit)
        lowering_error("E0209", "array index must be an integer literal", x.index->span,
                       "a computed index would need eval; iterate the array with for instead");
    if(lit->value < 0 || static_cast<size_t>(lit->value) >= info->elements.size())
        lowering_error("E0210", "index " + std::to_string(lit->value) + " is out of range for array '" + base->name +
                       "' of length " + std::to_string(info->elements.size()), x.index->span);
    return {make_var(info->elements[static_cast<size_t>(lit->value)]), info->kind};
}

} // namespace rustlite::detail
