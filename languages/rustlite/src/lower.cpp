#include "lower_internal.hpp"
#include "posixc/features.hpp"
#include "posixc/mangle.hpp"
#include <cstdio>
#include <functional>
#include <set>

using namespace posixc;

namespace rustlite {

const char* kind_name(ValueKind k){
    switch(k){
        case ValueKind::Int: return "integer";
        case ValueKind::Str: return "string";
        case ValueKind::Bool: return "bool";
        case ValueKind::Unit: return "()";
        case ValueKind::Unknown: return "unknown";
    }
    return "unknown";
}

namespace detail {

void lowering_error(const char* code, std::string message, const SourceSpan& span, std::string hint){
    throw LoweringError(make_error(DiagnosticKind::LoweringError, code, std::move(message), std::move(hint), span));
}

IrPtr seq_or_single(std::vector<IrPtr> items){
    std::vector<IrPtr> kept;
    for(auto& i : items) if(i) kept.push_back(std::move(i));
    if(kept.size() == 1) return kept.front();
    return make_seq(std::move(kept));
}

bool kind_accepts(ValueKind expected, ValueKind got){
    if(expected == ValueKind::Unknown || got == expected) return true;
    return got == ValueKind::Unknown && expected != ValueKind::Int;
}

void check_kind(ValueKind expected, ValueKind got, const SourceSpan& span, const std::string& what){
    if(kind_accepts(expected, got)) return;
    lowering_error("E0222", what + " expects " + kind_name(expected) + " but the value is " + kind_name(got), span,
                   got == ValueKind::Str && expected == ValueKind::Int ? "text read at run time cannot be used as a number" : "");
}

const VarInfo* Lowerer::lookup(const std::string& name) const {
    for(auto it = scopes_.rbegin(); it != scopes_.rend(); ++it){
        auto f = it->find(name);
        if(f != it->end()) return &f->second;
    }
    return nullptr;
}

std::string Lowerer::fresh_name(const std::string& base){
    std::string name = base;
    for(int n = 1; taken_.count(mangle(name)); ++n) name = base + "_" + std::to_string(n);
    taken_.insert(mangle(name));
    return name;
}

std::string Lowerer::local_name(const std::string& source_name){
    if(!current_ || current_->name == "main") return fresh_name(source_name);
    return fresh_name(current_->name + "_" + source_name);
}

void Lowerer::note_stdout_write(const SourceSpan& span){
    if(current_writes_) return;
    current_writes_ = true;
    first_write_ = span;
}

// ---- call graph

static void calls_in(const Block& b, std::vector<const expr::Call*>& out);

static void calls_in(const ExprPtr& e, std::vector<const expr::Call*>& out){
    if(!e) return;
    std::visit(overloaded{
        [&](const expr::IntLit&){},
        [&](const expr::StrLit&){},
        [&](const expr::BoolLit&){},
        [&](const expr::Var&){},
        [&](const expr::Unary& x){ calls_in(x.operand, out); },
        [&](const expr::Binary& x){ calls_in(x.lhs, out); calls_in(x.rhs, out); },
        [&](const expr::Call& x){ out.push_back(&x); for(const auto& a : x.args) calls_in(a, out); },
        [&](const expr::MethodCall& x){ calls_in(x.receiver, out); for(const auto& a : x.args) calls_in(a, out); },
        [&](const expr::MacroCall& x){ for(const auto& a : x.args) calls_in(a, out); },
        [&](const expr::ArrayLit& x){ for(const auto& a : x.elems) calls_in(a, out); },
        [&](const expr::Index& x){ calls_in(x.base, out); calls_in(x.index, out); },
        [&](const expr::Range& x){ calls_in(x.start, out); calls_in(x.end, out); },
        [&](const expr::BlockExpr& x){ calls_in(x.block, out); },
        [&](const If& x){
            calls_in(x.cond, out);
            calls_in(x.then_block, out);
            if(x.else_block) calls_in(*x.else_block, out);
        },
        [&](const Match& x){
            calls_in(x.scrutinee, out);
            for(const auto& arm : x.arms){ calls_in(arm.guard, out); calls_in(arm.body, out); }
        },
    }, e->v);
}

static void calls_in(const StmtPtr& s, std::vector<const expr::Call*>& out){
    std::visit(overloaded{
        [&](const stmt::Let& x){ calls_in(x.init, out); },
        [&](const stmt::Assign& x){ calls_in(x.value, out); },
        [&](const If& x){
            calls_in(x.cond, out);
            calls_in(x.then_block, out);
            if(x.else_block) calls_in(*x.else_block, out);
        },
        [&](const Match& x){
            calls_in(x.scrutinee, out);
            for(const auto& arm : x.arms){ calls_in(arm.guard, out); calls_in(arm.body, out); }
        },
        [&](const stmt::For& x){ calls_in(x.iterable, out); calls_in(x.body, out); },
        [&](const stmt::While& x){ calls_in(x.cond, out); calls_in(x.body, out); },
        [&](const stmt::Break&){},
        [&](const stmt::Continue&){},
        [&](const stmt::Return& x){ calls_in(x.value, out); },
        [&](const stmt::ExprStmt& x){ calls_in(x.expr, out); },
    }, s->v);
}

static void calls_in(const Block& b, std::vector<const expr::Call*>& out){
    for(const auto& s : b.stmts) calls_in(s, out);
    calls_in(b.tail, out);
}

void Lowerer::check_call_graph(std::vector<Diagnostic>& warnings) const {
    std::map<std::string, std::set<std::string>> graph;
    for(const auto& [name, f] : functions_){
        std::vector<const expr::Call*> calls;
        calls_in(f->body, calls);
        for(const auto* c : calls) if(functions_.count(c->callee)) graph[name].insert(c->callee);
    }

    // 0 unvisited, 1 on the current path, 2 done
    std::map<std::string, int> state;
    std::vector<std::string> path;
    std::function<void(const std::string&)> visit = [&](const std::string& name){
        state[name] = 1;
        path.push_back(name);
        for(const auto& callee : graph[name]){
            if(state[callee] == 1){
                std::string cycle;
                bool in_cycle = false;
                for(const auto& p : path){
                    if(p == callee) in_cycle = true;
                    if(in_cycle) cycle += p + " -> ";
                }
                cycle += callee;
                lowering_error("E0204", "recursive call cycle: " + cycle, functions_.at(callee)->span,
                               "shell variables are global; rewrite the recursion as a loop");
            }
            if(state[callee] == 0) visit(callee);
        }
        path.pop_back();
        state[name] = 2;
    };
    for(const auto& f : program_.functions) if(state[f.name] == 0) visit(f.name);

    std::set<std::string> reachable;
    std::vector<std::string> work{"main"};
    while(!work.empty()){
        std::string n = work.back();
        work.pop_back();
        if(!reachable.insert(n).second) continue;
        for(const auto& c : graph[n]) work.push_back(c);
    }
    for(const auto& f : program_.functions)
        if(!reachable.count(f.name))
            warnings.push_back(make_warning("W0002", "function '" + f.name + "' is never called", "remove it or call it from main", f.span));
}

// ---- functions, blocks and statements

IrPtr Lowerer::run(std::vector<Diagnostic>& warnings){
    for(const auto& f : program_.functions){
        if(!functions_.emplace(f.name, &f).second)
            lowering_error("E0215", "function '" + f.name + "' is defined more than once", f.span);
    }
    auto main_it = functions_.find("main");
    if(main_it == functions_.end())
        lowering_error("E0203", "no 'main' function", SourceSpan{}, "add fn main() { ... }");
    const Function& entry = *main_it->second;
    if(!entry.params.empty())
        lowering_error("E0216", "'main' must not take parameters", entry.span, "read arguments with arg(n) or args()");
    if(entry.ret.kind != ValueKind::Unit)
        lowering_error("E0216", "'main' must not return a value", entry.span, "use exit(code) to set the exit status");

    check_call_graph(warnings);
    reserve_environment_names();

    // callees first, so a caller knows whether a statement call prints
    std::map<std::string, IrPtr> lowered;
    std::function<void(const Function&)> lower_after_callees = [&](const Function& f){
        if(lowered.count(f.name)) return;
        lowered[f.name] = nullptr;
        std::vector<const expr::Call*> calls;
        calls_in(f.body, calls);
        for(const auto* c : calls)
            if(auto it = functions_.find(c->callee); it != functions_.end()) lower_after_callees(*it->second);
        lowered[f.name] = lower_function(f);
    };
    for(const auto& f : program_.functions) lower_after_callees(f);

    std::vector<IrPtr> defs;
    for(const auto& f : program_.functions)
        if(f.name != "main") defs.push_back(lowered.at(f.name));
    defs.push_back(lowered.at("main"));
    return make_seq(std::move(defs));
}

void Lowerer::reserve_environment_names(){
    for(const auto& f : program_.functions){
        std::vector<const expr::Call*> calls;
        calls_in(f.body, calls);
        for(const auto* c : calls){
            if(functions_.count(c->callee) || c->args.empty()) continue;
            const StdlibFunction* fn = find_stdlib(c->callee);
            if(!fn || (fn->op != StdlibOp::Env && fn->op != StdlibOp::EnvOr)) continue;
            if(const auto* lit = std::get_if<expr::StrLit>(&c->args.front()->v)) taken_.insert(lit->value);
        }
    }
}

IrPtr Lowerer::lower_function(const Function& f){
    current_ = &f;
    current_writes_ = false;
    scopes_.clear();
    push_scope();
    std::vector<std::string> params;
    for(const auto& p : f.params){
        if(p.type.kind == ValueKind::Unit)
            lowering_error("E0213", "parameter '" + p.name + "' has no value", p.span);
        VarInfo info{p.type.kind, local_name(p.name)};
        params.push_back(info.shell);
        declare(p.name, std::move(info));
    }
    const Target t = f.ret.kind == ValueKind::Unit ? Target::discard() : Target::result(f.ret.kind);
    IrPtr body = lower_block(f.body, t);
    pop_scope();
    writes_stdout_[f.name] = current_writes_;
    if(current_writes_ && f.ret.kind != ValueKind::Unit)
        lowering_error("E0223", "function '" + f.name + "' returns a value but also writes to stdout", first_write_,
                       "its output is captured as the return value; print with eprintln! or from a function without a return type");
    if(debug_lower())
        std::fprintf(stderr, "[dbg][lower] fn %s params=%zu returns=%s\n", f.name.c_str(), params.size(), kind_name(f.ret.kind));
    return make_function(f.name, std::move(params), std::move(body));
}

IrPtr Lowerer::lower_block(const Block& b, const Target& t, ValueKind* kind){
    push_scope();
    std::vector<IrPtr> items;
    for(const auto& s : b.stmts) lower_stmt(*s, items);
    if(b.tail) items.push_back(lower_into(*b.tail, t, kind));
    pop_scope();
    return seq_or_single(std::move(items));
}

void Lowerer::lower_let(const stmt::Let& l, const SourceSpan& span, std::vector<IrPtr>& out){
    if(l.name == "_"){
        out.push_back(lower_effect(*l.init));
        return;
    }
    if(is_array_expr(*l.init)){
        auto elems = array_elements(*l.init, l.init->span);
        VarInfo info{ValueKind::Unknown, local_name(l.name), true, {}};
        for(const auto& e : elems) if(info.kind == ValueKind::Unknown) info.kind = e.kind;
        for(size_t i = 0; i < elems.size(); ++i){
            check_kind(info.kind, elems[i].kind, l.init->span, "array '" + l.name + "'");
            info.elements.push_back(fresh_name(info.shell + "_" + std::to_string(i)));
            out.push_back(make_assign(info.elements.back(), elems[i].value));
        }
        declare(l.name, std::move(info));
        return;
    }
    const ValueKind annotated = l.type ? l.type->kind : ValueKind::Unknown;
    const std::string shell = local_name(l.name);
    ValueKind kind = ValueKind::Unknown;
    out.push_back(lower_into(*l.init, Target::assign(shell, annotated), &kind));
    if(kind == ValueKind::Unit)
        lowering_error("E0213", "'" + l.name + "' would be bound to a value of type ()", span);
    if(annotated != ValueKind::Unknown) kind = annotated;
    declare(l.name, VarInfo{kind, shell});
}

void Lowerer::lower_stmt(const Stmt& s, std::vector<IrPtr>& out){
    std::visit(overloaded{
        [&](const stmt::Let& x){ lower_let(x, s.span, out); },
        [&](const stmt::Assign& x){
            const VarInfo* v = lookup(x.name);
            if(!v) lowering_error("E0214", "assignment to undeclared variable '" + x.name + "'", s.span,
                                  "declare it first with let mut");
            if(v->is_array || is_array_expr(*x.value))
                lowering_error("E0213", "arrays cannot be reassigned", s.span);
            out.push_back(lower_into(*x.value, Target::assign(v->shell, v->kind)));
        },
        [&](const If& x){ out.push_back(lower_if(x, Target::discard(), nullptr)); },
        [&](const Match& x){ out.push_back(lower_match(x, Target::discard(), nullptr, s.span, s.id)); },
        [&](const stmt::For& x){ out.push_back(lower_for(x, s.span)); },
        [&](const stmt::While& x){
            ValuePtr test = lower_value(*x.cond).value;
            out.push_back(make_while(test, lower_block(x.body, Target::discard())));
        },
        [&](const stmt::Break&){ out.push_back(make_break()); },
        [&](const stmt::Continue&){ out.push_back(make_continue()); },
        [&](const stmt::Return& x){
            if(x.value){
                if(current_->ret.kind == ValueKind::Unit) out.push_back(lower_effect(*x.value));
                else out.push_back(lower_into(*x.value, Target::result(current_->ret.kind)));
            }
            out.push_back(make_return());
        },
        [&](const stmt::ExprStmt& x){ out.push_back(lower_into(*x.expr, Target::discard())); },
    }, s.v);
}

IrPtr Lowerer::lower_into(const Expr& e, const Target& t, ValueKind* kind){
    if(const auto* x = std::get_if<If>(&e.v)) return lower_if(*x, t, kind);
    if(const auto* x = std::get_if<Match>(&e.v)) return lower_match(*x, t, kind, e.span, e.id);
    if(const auto* x = std::get_if<expr::BlockExpr>(&e.v)) return lower_block(x->block, t, kind);
    if(t.kind == Target::Kind::Discard) return lower_effect(e);
    LoweredValue v = lower_value(e);
    check_kind(t.expected, v.kind, e.span, t.kind == Target::Kind::Result ? "return value" : "assignment");
    if(kind){
        if(*kind == ValueKind::Unknown) *kind = v.kind;
        else if(v.kind != ValueKind::Unknown && v.kind != *kind)
            lowering_error("E0222", std::string("branches produce both ") + kind_name(*kind) + " and " + kind_name(v.kind) + " values", e.span);
    }
    if(t.kind == Target::Kind::Assign) return make_assign(t.name, v.value);
    return make_echo(v.value);
}

// Statement position: only calls and printing macros have effects.
IrPtr Lowerer::lower_effect(const Expr& e){
    if(const auto* c = std::get_if<expr::Call>(&e.v)) return lower_call_stmt(*c, e.span);
    if(const auto* m = std::get_if<expr::MacroCall>(&e.v)){
        const MacroSpec* spec = builtin_macros().find(m->name);
        if(!spec) lowering_error("E0299", "macro '" + m->name + "!' reached lowering", e.span);
        IrPtr statement = spec->expand(*m, e.span, *this).statement;
        const auto* echo = statement ? std::get_if<ir::Echo>(&statement->v) : nullptr;
        if(echo && echo->stream == Stream::Stdout) note_stdout_write(e.span);
        return statement;
    }
    if(std::holds_alternative<If>(e.v) || std::holds_alternative<Match>(e.v) || std::holds_alternative<expr::BlockExpr>(e.v))
        return lower_into(e, Target::discard());
    lower_value(e); // checked, value unused
    return nullptr;
}

IrPtr Lowerer::lower_if(const If& x, const Target& t, ValueKind* kind){
    ValuePtr test = lower_value(*x.cond).value;
    IrPtr then_branch = lower_block(x.then_block, t, kind);
    IrPtr else_branch = x.else_block ? lower_block(*x.else_block, t, kind) : nullptr;
    return make_if(test, then_branch, else_branch);
}

// ---- match

static bool is_simple(const ShellValue& v){
    return std::visit(overloaded{
        [](const val::Literal&){ return true; },
        [](const val::VariableRef&){ return true; },
        [](const val::Positional&){ return true; },
        [](const val::ArgCount&){ return true; },
        [](const val::EnvVar& e){ return e.default_value == nullptr; },
        [](const auto&){ return false; },
    }, v.v);
}

static long long bound_value(const std::string& text){ return std::stoll(text); }

IrPtr Lowerer::lower_match(const Match& m, const Target& t, ValueKind* kind, const SourceSpan& span, NodeId id){
    LoweredValue scrut = lower_value(*m.scrutinee);
    std::vector<IrPtr> pre;

    bool case_form = true;
    bool binds = false;
    for(const auto& arm : m.arms){
        if(arm.guard) case_form = false;
        for(const auto& alt : arm.alts){
            if(alt.kind == PatternKind::Range) case_form = false;
            if(alt.kind == PatternKind::Binding) binds = true;
            const bool mismatch =
                (alt.kind == PatternKind::Int || alt.kind == PatternKind::Range) ? scrut.kind == ValueKind::Str || scrut.kind == ValueKind::Bool
                : alt.kind == PatternKind::Str ? scrut.kind == ValueKind::Int || scrut.kind == ValueKind::Bool
                : alt.kind == PatternKind::Bool ? scrut.kind == ValueKind::Int || scrut.kind == ValueKind::Str
                : false;
            if(mismatch)
                lowering_error("E0219", "pattern does not match a " + std::string(kind_name(scrut.kind)) + " scrutinee", alt.span);
        }
    }
    if(m.arms.empty()) lowering_error("E0219", "match without arms", span);

    // evaluate the scrutinee once
    if((!case_form || binds) && !is_simple(*scrut.value)){
        const std::string tmp = fresh_name("posixc_match_" + std::to_string(id));
        pre.push_back(make_assign(tmp, scrut.value));
        scrut.value = make_var(tmp);
    }

    if(case_form){
        std::vector<ir::CaseArm> arms;
        for(const auto& arm : m.arms){
            ir::CaseArm ca;
            push_scope();
            std::vector<IrPtr> body;
            for(const auto& alt : arm.alts){
                switch(alt.kind){
                    case PatternKind::Wildcard: ca.wildcard = true; break;
                    case PatternKind::Binding: {
                        ca.wildcard = true;
                        VarInfo info{scrut.kind, local_name(alt.text)};
                        body.push_back(make_assign(info.shell, scrut.value));
                        declare(alt.text, std::move(info));
                        break;
                    }
                    case PatternKind::Int:
                    case PatternKind::Str:
                    case PatternKind::Bool:
                        ca.patterns.push_back(alt.text);
                        break;
                    case PatternKind::Range: break;
                }
            }
            body.push_back(lower_block(arm.body, t, kind));
            pop_scope();
            ca.body = seq_or_single(std::move(body));
            arms.push_back(std::move(ca));
        }
        pre.push_back(make_case(scrut.value, std::move(arms)));
        return seq_or_single(std::move(pre));
    }

    const bool textual = scrut.kind == ValueKind::Str || scrut.kind == ValueKind::Bool || !is_numeric_value(*scrut.value);
    struct Branch { ValuePtr test; IrPtr body; };
    std::vector<Branch> branches;
    for(const auto& arm : m.arms){
        push_scope();
        ValuePtr test;
        bool always = false;
        for(const auto& alt : arm.alts){
            ValuePtr alt_test;
            switch(alt.kind){
                case PatternKind::Wildcard: always = true; break;
                case PatternKind::Binding: {
                    // assigned ahead of the chain; the name is unique, so nothing else sees it
                    always = true;
                    VarInfo info{scrut.kind, local_name(alt.text)};
                    pre.push_back(make_assign(info.shell, scrut.value));
                    declare(alt.text, std::move(info));
                    break;
                }
                case PatternKind::Int:
                    alt_test = make_compare(textual ? CmpOp::StrEq : CmpOp::NumEq, scrut.value, make_literal(alt.text));
                    break;
                case PatternKind::Str:
                case PatternKind::Bool:
                    alt_test = make_compare(CmpOp::StrEq, scrut.value, make_literal(alt.text));
                    break;
                case PatternKind::Range: {
                    long long hi = bound_value(alt.high);
                    if(!alt.inclusive) hi -= 1;
                    alt_test = make_logical(LogicOp::And,
                                            make_compare(CmpOp::NumGe, scrut.value, make_literal(alt.text)),
                                            make_compare(CmpOp::NumLe, scrut.value, make_literal(std::to_string(hi))));
                    break;
                }
            }
            if(alt_test) test = test ? make_logical(LogicOp::Or, test, alt_test) : alt_test;
        }
        if(always) test = nullptr;
        if(arm.guard){
            ValuePtr guard = lower_value(*arm.guard).value;
            test = test ? make_logical(LogicOp::And, test, guard) : guard;
        }
        IrPtr body = lower_block(arm.body, t, kind);
        pop_scope();
        branches.push_back({test, body});
        if(!test) break; // later arms are unreachable
    }

    IrPtr chain;
    size_t n = branches.size();
    if(!branches.back().test){
        chain = branches.back().body;
        --n;
    }
    for(size_t i = n; i-- > 0;) chain = make_if(branches[i].test, branches[i].body, chain);
    pre.push_back(chain);
    return seq_or_single(std::move(pre));
}

// ---- for loops

IrPtr Lowerer::lower_for(const stmt::For& f, const SourceSpan& span){
    const Expr& it = *f.iterable;
    const std::string var = local_name(f.var);
    auto body_with = [&](ValueKind var_kind){
        push_scope();
        declare(f.var, VarInfo{var_kind, var});
        IrPtr body = lower_block(f.body, Target::discard());
        pop_scope();
        return body;
    };

    if(const auto* r = std::get_if<expr::Range>(&it.v)){
        ValuePtr first = numeric(lower_value(*r->start), r->start->span).value;
        ValuePtr last;
        if(r->inclusive){
            last = numeric(lower_value(*r->end), r->end->span).value;
        } else if(const auto* lit = std::get_if<expr::IntLit>(&r->end->v)){
            last = make_literal(std::to_string(lit->value - 1));
        } else {
            last = make_arith(ArithOp::Sub, numeric(lower_value(*r->end), r->end->span).value, make_literal("1"));
        }
        return make_for(var, first, last, body_with(ValueKind::Int));
    }
    if(const auto* c = std::get_if<expr::Call>(&it.v)){
        const StdlibFunction* fn = functions_.count(c->callee) ? nullptr : find_stdlib(c->callee);
        if(fn && fn->op == StdlibOp::Args){
            if(!c->args.empty()) lowering_error("E0206", "args() takes no arguments", it.span);
            return make_for_each(var, {make_arg_list()}, body_with(ValueKind::Str));
        }
    }
    if(is_array_expr(it)){
        auto elems = array_elements(it, it.span);
        std::vector<ValuePtr> items;
        ValueKind k = ValueKind::Unknown;
        for(const auto& e : elems) if(k == ValueKind::Unknown) k = e.kind;
        for(const auto& e : elems){
            check_kind(k, e.kind, it.span, "array element");
            items.push_back(e.value);
        }
        return make_for_each(var, std::move(items), body_with(k));
    }
    if(const auto* v = std::get_if<expr::Var>(&it.v)){
        const VarInfo* info = lookup(v->name);
        if(info && info->is_array){
            std::vector<ValuePtr> items;
            for(const auto& element : info->elements) items.push_back(make_var(element));
            return make_for_each(var, std::move(items), body_with(info->kind));
        }
    }
    lowering_error("E0218", "for loops iterate over a range, an array or args()", span,
                   "write for i in 0..n, for x in [a, b] or for a in args()");
}

} // namespace detail

LowerResult lower_program(const Program& program){
    LowerResult r;
    try {
        detail::Lowerer lowerer(program);
        r.ir = lowerer.run(r.diagnostics);
        r.success = true;
    } catch(const LoweringError& e){
        r.diagnostics.push_back(e.diagnostic());
        r.ir = nullptr;
    }
    if(debug_lower())
        std::fprintf(stderr, "[dbg][lower] ok=%d diagnostics=%zu\n", r.success ? 1 : 0, r.diagnostics.size());
    return r;
}

} // namespace rustlite
