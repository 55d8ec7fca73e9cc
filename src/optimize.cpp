#include "posixc/optimize.hpp"
#include "posixc/features.hpp"
#include "posixc/ir_metrics.hpp"
#include <climits>
#include <cstdio>
#include <map>
#include <set>

namespace posixc {

namespace {

bool checked_arith(ArithOp op, long long a, long long b, long long& out){
    switch(op){
        case ArithOp::Add: return !__builtin_add_overflow(a, b, &out);
        case ArithOp::Sub: return !__builtin_sub_overflow(a, b, &out);
        case ArithOp::Mul: return !__builtin_mul_overflow(a, b, &out);
        case ArithOp::Div:
            if(b == 0 || (a == LLONG_MIN && b == -1)) return false;
            out = a / b; return true;
        case ArithOp::Mod:
            if(b == 0 || (a == LLONG_MIN && b == -1)) return false;
            out = a % b; return true;
        case ArithOp::BitAnd: out = a & b; return true;
        case ArithOp::BitOr: out = a | b; return true;
        case ArithOp::BitXor: out = a ^ b; return true;
        case ArithOp::Shl:
            if(a < 0 || b < 0 || b > 62 || a > (LLONG_MAX >> b)) return false;
            out = a << b; return true;
        case ArithOp::Shr:
            if(b < 0 || b > 62) return false;
            out = a >> b; return true;
    }
    return false;
}

std::optional<bool> compare_literals(CmpOp op, const ShellValue& l, const ShellValue& r){
    if(op == CmpOp::StrEq || op == CmpOp::StrNe){
        const auto* a = std::get_if<val::Literal>(&l.v);
        const auto* b = std::get_if<val::Literal>(&r.v);
        if(!a || !b) return std::nullopt;
        return (a->text == b->text) == (op == CmpOp::StrEq);
    }
    auto a = integer_value(l), b = integer_value(r);
    if(!a || !b) return std::nullopt;
    switch(op){
        case CmpOp::NumEq: return *a == *b;
        case CmpOp::NumNe: return *a != *b;
        case CmpOp::NumLt: return *a < *b;
        case CmpOp::NumLe: return *a <= *b;
        case CmpOp::NumGt: return *a > *b;
        case CmpOp::NumGe: return *a >= *b;
        default: return std::nullopt;
    }
}

ValuePtr truth(bool b, bool arithmetic_context){
    if(arithmetic_context) return make_literal(b ? "1" : "0");
    return make_literal(b ? "true" : "false");
}

std::optional<bool> constant_truth(const ShellValue& v, bool arithmetic_context){
    if(arithmetic_context){
        if(auto n = integer_value(v)) return *n != 0;
        return std::nullopt;
    }
    return bool_value(v);
}

struct Folder {
    OptimizeStats* stats;

    void count(){ if(stats) ++stats->folded; }

    ValuePtr value(const ValuePtr& v, bool arith_ctx){
        if(!v) return v;
        return std::visit(overloaded{
            [&](const val::Literal&) -> ValuePtr { return v; },
            [&](const val::VariableRef&) -> ValuePtr { return v; },
            [&](const val::Concat& x) -> ValuePtr {
                std::vector<ValuePtr> parts;
                for(const auto& p : x.parts){
                    ValuePtr f = value(p, false);
                    const auto* lit = std::get_if<val::Literal>(&f->v);
                    if(lit && lit->text.empty()){ count(); continue; }
                    if(lit && !parts.empty()){
                        if(const auto* prev = std::get_if<val::Literal>(&parts.back()->v)){
                            parts.back() = make_literal(prev->text + lit->text);
                            count();
                            continue;
                        }
                    }
                    parts.push_back(std::move(f));
                }
                if(parts.empty()) return make_literal("");
                if(parts.size() == 1 && std::holds_alternative<val::Literal>(parts[0]->v)) return parts[0];
                return make_concat(std::move(parts));
            },
            [&](const val::CommandSubst& x) -> ValuePtr { return make_command_subst(stmt(x.command)); },
            [&](const val::EnvVar& x) -> ValuePtr {
                return x.default_value ? make_env(x.name, value(x.default_value, arith_ctx)) : v;
            },
            [&](const val::Arithmetic& x) -> ValuePtr {
                ValuePtr l = value(x.lhs, true), r = value(x.rhs, true);
                auto a = integer_value(*l), b = integer_value(*r);
                long long out = 0;
                if(a && b && checked_arith(x.op, *a, *b, out)){ count(); return make_literal(std::to_string(out)); }
                return make_arith(x.op, std::move(l), std::move(r));
            },
            [&](const val::Positional&) -> ValuePtr { return v; },
            [&](const val::ArgList&) -> ValuePtr { return v; },
            [&](const val::ArgCount&) -> ValuePtr { return v; },
            [&](const val::ExitStatus&) -> ValuePtr { return v; },
            [&](const val::Compare& x) -> ValuePtr {
                const bool numeric = x.op != CmpOp::StrEq && x.op != CmpOp::StrNe;
                ValuePtr l = value(x.lhs, numeric && arith_ctx), r = value(x.rhs, numeric && arith_ctx);
                if(auto res = compare_literals(x.op, *l, *r)){ count(); return truth(*res, arith_ctx); }
                return make_compare(x.op, std::move(l), std::move(r));
            },
            [&](const val::Logical& x) -> ValuePtr {
                ValuePtr l = value(x.lhs, arith_ctx);
                auto lc = constant_truth(*l, arith_ctx);
                if(x.op == LogicOp::Not){
                    if(lc){ count(); return truth(!*lc, arith_ctx); }
                    return make_logical(LogicOp::Not, std::move(l));
                }
                ValuePtr r = value(x.rhs, arith_ctx);
                if(lc){
                    count();
                    if(x.op == LogicOp::And) return *lc ? r : truth(false, arith_ctx);
                    return *lc ? truth(true, arith_ctx) : r;
                }
                return make_logical(x.op, std::move(l), std::move(r));
            },
        }, v->v);
    }

    std::vector<ValuePtr> values(const std::vector<ValuePtr>& xs){
        std::vector<ValuePtr> out;
        for(const auto& x : xs) out.push_back(value(x, false));
        return out;
    }

    IrPtr stmt(const IrPtr& n){
        if(!n) return n;
        return std::visit(overloaded{
            [&](const ir::Assign& x) -> IrPtr { return make_assign(x.name, value(x.value, false)); },
            [&](const ir::Echo& x) -> IrPtr { return make_echo(value(x.value, false), x.stream); },
            [&](const ir::If& x) -> IrPtr { return make_if(value(x.test, false), stmt(x.then_branch), stmt(x.else_branch)); },
            [&](const ir::Case& x) -> IrPtr {
                std::vector<ir::CaseArm> arms;
                for(const auto& a : x.arms) arms.push_back(ir::CaseArm{a.patterns, a.wildcard, stmt(a.body)});
                return make_case(value(x.scrutinee, false), std::move(arms));
            },
            [&](const ir::For& x) -> IrPtr { return make_for(x.var, value(x.first, true), value(x.last, true), stmt(x.body)); },
            [&](const ir::ForEach& x) -> IrPtr { return make_for_each(x.var, values(x.items), stmt(x.body)); },
            [&](const ir::While& x) -> IrPtr { return make_while(value(x.test, false), stmt(x.body)); },
            [&](const ir::FunctionDef& x) -> IrPtr { return make_function(x.name, x.params, stmt(x.body)); },
            [&](const ir::Call& x) -> IrPtr { return make_call(x.kind, x.program, values(x.args), x.discard_output); },
            [&](const ir::Return&) -> IrPtr { return n; },
            [&](const ir::Exit& x) -> IrPtr { return make_exit(value(x.status, false)); },
            [&](const ir::Break&) -> IrPtr { return n; },
            [&](const ir::Continue&) -> IrPtr { return n; },
            [&](const ir::Seq& x) -> IrPtr {
                std::vector<IrPtr> items;
                for(const auto& i : x.items) items.push_back(stmt(i));
                return make_seq(std::move(items));
            },
        }, n->v);
    }
};

bool is_terminator(const IrPtr& n){
    return n && (std::holds_alternative<ir::Return>(n->v) || std::holds_alternative<ir::Exit>(n->v) ||
                 std::holds_alternative<ir::Break>(n->v) || std::holds_alternative<ir::Continue>(n->v));
}

bool is_empty(const IrPtr& n){
    if(!n) return true;
    const auto* s = std::get_if<ir::Seq>(&n->v);
    return s && s->items.empty();
}

struct DeadCode {
    OptimizeStats* stats;

    void removed(size_t n = 1){ if(stats) stats->removed_statements += n; }

    void flatten_into(const IrPtr& n, std::vector<IrPtr>& out, bool& terminated){
        if(terminated){ removed(); return; }
        IrPtr s = stmt(n);
        if(is_empty(s)) return;
        if(const auto* seq = std::get_if<ir::Seq>(&s->v)){
            for(const auto& i : seq->items){
                if(terminated){ removed(); continue; }
                out.push_back(i);
                if(is_terminator(i)) terminated = true;
            }
            return;
        }
        out.push_back(s);
        if(is_terminator(s)) terminated = true;
    }

    IrPtr stmt(const IrPtr& n){
        if(!n) return n;
        return std::visit(overloaded{
            [&](const ir::Assign&) -> IrPtr { return n; },
            [&](const ir::Echo&) -> IrPtr { return n; },
            [&](const ir::If& x) -> IrPtr {
                if(auto c = bool_value(*x.test)){
                    removed();
                    if(*c) return x.then_branch ? stmt(x.then_branch) : make_seq({});
                    return x.else_branch ? stmt(x.else_branch) : make_seq({});
                }
                IrPtr e = x.else_branch ? stmt(x.else_branch) : nullptr;
                if(is_empty(e)) e = nullptr;
                return make_if(x.test, stmt(x.then_branch), std::move(e));
            },
            [&](const ir::Case& x) -> IrPtr {
                std::vector<ir::CaseArm> arms;
                for(const auto& a : x.arms){
                    arms.push_back(ir::CaseArm{a.patterns, a.wildcard, stmt(a.body)});
                    if(a.wildcard) break; // later arms are unreachable
                }
                if(arms.size() < x.arms.size()) removed(x.arms.size() - arms.size());
                return make_case(x.scrutinee, std::move(arms));
            },
            [&](const ir::For& x) -> IrPtr { return make_for(x.var, x.first, x.last, stmt(x.body)); },
            [&](const ir::ForEach& x) -> IrPtr {
                if(x.items.empty()){ removed(); return make_seq({}); }
                return make_for_each(x.var, x.items, stmt(x.body));
            },
            [&](const ir::While& x) -> IrPtr {
                if(auto c = bool_value(*x.test); c && !*c){ removed(); return make_seq({}); }
                return make_while(x.test, stmt(x.body));
            },
            [&](const ir::FunctionDef& x) -> IrPtr { return make_function(x.name, x.params, stmt(x.body)); },
            [&](const ir::Call&) -> IrPtr { return n; },
            [&](const ir::Return&) -> IrPtr { return n; },
            [&](const ir::Exit&) -> IrPtr { return n; },
            [&](const ir::Break&) -> IrPtr { return n; },
            [&](const ir::Continue&) -> IrPtr { return n; },
            [&](const ir::Seq& x) -> IrPtr {
                std::vector<IrPtr> items;
                bool terminated = false;
                for(const auto& i : x.items) flatten_into(i, items, terminated);
                return make_seq(std::move(items));
            },
        }, n->v);
    }
};

void calls_in_value(const ValuePtr& v, std::set<std::string>& out);

void calls_in(const IrPtr& n, std::set<std::string>& out){
    if(!n) return;
    std::visit(overloaded{
        [&](const ir::Assign& x){ calls_in_value(x.value, out); },
        [&](const ir::Echo& x){ calls_in_value(x.value, out); },
        [&](const ir::If& x){ calls_in_value(x.test, out); calls_in(x.then_branch, out); calls_in(x.else_branch, out); },
        [&](const ir::Case& x){ calls_in_value(x.scrutinee, out); for(const auto& a : x.arms) calls_in(a.body, out); },
        [&](const ir::For& x){ calls_in_value(x.first, out); calls_in_value(x.last, out); calls_in(x.body, out); },
        [&](const ir::ForEach& x){ for(const auto& i : x.items) calls_in_value(i, out); calls_in(x.body, out); },
        [&](const ir::While& x){ calls_in_value(x.test, out); calls_in(x.body, out); },
        [&](const ir::FunctionDef& x){ calls_in(x.body, out); },
        [&](const ir::Call& x){
            if(x.kind == CallKind::User) out.insert(x.program);
            for(const auto& a : x.args) calls_in_value(a, out);
        },
        [&](const ir::Return&){},
        [&](const ir::Exit& x){ calls_in_value(x.status, out); },
        [&](const ir::Break&){},
        [&](const ir::Continue&){},
        [&](const ir::Seq& x){ for(const auto& i : x.items) calls_in(i, out); },
    }, n->v);
}

void calls_in_value(const ValuePtr& v, std::set<std::string>& out){
    if(!v) return;
    std::visit(overloaded{
        [&](const val::Literal&){},
        [&](const val::VariableRef&){},
        [&](const val::Concat& x){ for(const auto& p : x.parts) calls_in_value(p, out); },
        [&](const val::CommandSubst& x){ calls_in(x.command, out); },
        [&](const val::EnvVar& x){ calls_in_value(x.default_value, out); },
        [&](const val::Arithmetic& x){ calls_in_value(x.lhs, out); calls_in_value(x.rhs, out); },
        [&](const val::Positional&){},
        [&](const val::ArgList&){},
        [&](const val::ArgCount&){},
        [&](const val::ExitStatus&){},
        [&](const val::Compare& x){ calls_in_value(x.lhs, out); calls_in_value(x.rhs, out); },
        [&](const val::Logical& x){ calls_in_value(x.lhs, out); calls_in_value(x.rhs, out); },
    }, v->v);
}

bool contains_return(const IrPtr& n){
    if(!n) return false;
    return std::visit(overloaded{
        [&](const ir::Return&){ return true; },
        [&](const ir::If& x){ return contains_return(x.then_branch) || contains_return(x.else_branch); },
        [&](const ir::Case& x){
            for(const auto& a : x.arms) if(contains_return(a.body)) return true;
            return false;
        },
        [&](const ir::For& x){ return contains_return(x.body); },
        [&](const ir::ForEach& x){ return contains_return(x.body); },
        [&](const ir::While& x){ return contains_return(x.body); },
        [&](const ir::Seq& x){
            for(const auto& i : x.items) if(contains_return(i)) return true;
            return false;
        },
        [&](const auto&){ return false; },
    }, n->v);
}

std::map<std::string, const ir::FunctionDef*> function_table(const ir::Seq& root){
    std::map<std::string, const ir::FunctionDef*> table;
    for(const auto& item : root.items)
        if(const auto* f = item ? std::get_if<ir::FunctionDef>(&item->v) : nullptr) table[f->name] = f;
    return table;
}

struct Inliner {
    const std::map<std::string, const ir::FunctionDef*>& table;
    size_t budget; // remaining branch budget of the current caller
    OptimizeStats* stats;

    const ir::FunctionDef* candidate(const ir::Call& c) const {
        if(c.kind != CallKind::User || c.discard_output) return nullptr;
        auto it = table.find(c.program);
        if(it == table.end() || c.program == "main") return nullptr;
        const ir::FunctionDef* f = it->second;
        if(contains_return(f->body)) return nullptr;
        if(f->params.size() != c.args.size()) return nullptr;
        // arguments are evaluated before any parameter is bound
        for(const auto& a : c.args) if(!std::holds_alternative<val::Literal>(a->v)) return nullptr;
        return f;
    }

    IrPtr stmt(const IrPtr& n){
        if(!n) return n;
        return std::visit(overloaded{
            [&](const ir::Call& x) -> IrPtr {
                const ir::FunctionDef* f = candidate(x);
                if(!f) return n;
                const size_t cost = compute_metrics(f->body).branch_count;
                if(cost > budget) return n;
                budget -= cost;
                if(stats) ++stats->inlined_calls;
                std::vector<IrPtr> items;
                for(size_t i = 0; i < f->params.size(); ++i) items.push_back(make_assign(f->params[i], x.args[i]));
                items.push_back(f->body);
                return make_seq(std::move(items));
            },
            [&](const ir::If& x) -> IrPtr { return make_if(x.test, stmt(x.then_branch), stmt(x.else_branch)); },
            [&](const ir::Case& x) -> IrPtr {
                std::vector<ir::CaseArm> arms;
                for(const auto& a : x.arms) arms.push_back(ir::CaseArm{a.patterns, a.wildcard, stmt(a.body)});
                return make_case(x.scrutinee, std::move(arms));
            },
            [&](const ir::For& x) -> IrPtr { return make_for(x.var, x.first, x.last, stmt(x.body)); },
            [&](const ir::ForEach& x) -> IrPtr { return make_for_each(x.var, x.items, stmt(x.body)); },
            [&](const ir::While& x) -> IrPtr { return make_while(x.test, stmt(x.body)); },
            [&](const ir::Seq& x) -> IrPtr {
                std::vector<IrPtr> items;
                for(const auto& i : x.items) items.push_back(stmt(i));
                return make_seq(std::move(items));
            },
            [&](const auto&) -> IrPtr { return n; },
        }, n->v);
    }
};

const ir::Seq& root_seq(const IrPtr& program){
    static const ir::Seq empty{};
    if(!program) return empty;
    const auto* seq = std::get_if<ir::Seq>(&program->v);
    return seq ? *seq : empty;
}

} // namespace

ValuePtr fold_value(const ValuePtr& v, bool arithmetic_context){
    Folder f{nullptr};
    return f.value(v, arithmetic_context);
}

IrPtr fold_constants(const IrPtr& n, OptimizeStats* stats){
    Folder f{stats};
    return f.stmt(n);
}

IrPtr eliminate_dead_code(const IrPtr& program, OptimizeStats* stats){
    DeadCode dce{stats};
    const ir::Seq& root = root_seq(program);
    // functions reachable from main through user calls
    auto table = function_table(root);
    std::set<std::string> reachable{"main"};
    std::vector<std::string> work{"main"};
    while(!work.empty()){
        std::string name = work.back(); work.pop_back();
        auto it = table.find(name);
        if(it == table.end()) continue;
        std::set<std::string> callees;
        calls_in(it->second->body, callees);
        for(const auto& c : callees) if(reachable.insert(c).second) work.push_back(c);
    }
    std::vector<IrPtr> items;
    for(const auto& item : root.items){
        const auto* f = item ? std::get_if<ir::FunctionDef>(&item->v) : nullptr;
        if(f && !reachable.count(f->name)){
            if(stats) ++stats->removed_functions;
            continue;
        }
        items.push_back(f ? dce.stmt(item) : item);
    }
    return make_seq(std::move(items));
}

IrPtr inline_calls(const IrPtr& program, unsigned branch_threshold, OptimizeStats* stats){
    const ir::Seq& root = root_seq(program);
    auto table = function_table(root);
    std::vector<IrPtr> items;
    for(const auto& item : root.items){
        const auto* f = item ? std::get_if<ir::FunctionDef>(&item->v) : nullptr;
        if(!f){ items.push_back(item); continue; }
        const size_t own = compute_metrics(f->body).branch_count;
        Inliner in{table, own >= branch_threshold ? 0 : branch_threshold - own, stats};
        items.push_back(make_function(f->name, f->params, in.stmt(f->body)));
    }
    return make_seq(std::move(items));
}

IrPtr optimize(const IrPtr& program, const Config& cfg, OptimizeStats* stats){
    IrPtr out = program;
    if(cfg.enable_inlining) out = inline_calls(out, cfg.inline_branch_threshold, stats);
    if(cfg.enable_constant_folding) out = fold_constants(out, stats);
    if(cfg.enable_dead_code_elimination) out = eliminate_dead_code(out, stats);
    if(debug_opt() && stats)
        std::fprintf(stderr, "[dbg][opt] folded=%zu removed=%zu functions_removed=%zu inlined=%zu\n",
                     stats->folded, stats->removed_statements, stats->removed_functions, stats->inlined_calls);
    return out;
}

} // namespace posixc
