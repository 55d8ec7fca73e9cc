#include "posixc/emitter.hpp"
#include "posixc/config.hpp"
#include "posixc/diagnostics.hpp"
#include "posixc/escape.hpp"
#include "posixc/features.hpp"
#include "posixc/mangle.hpp"
#include "posixc/runtime.hpp"
#include <cstdio>

namespace posixc {

[[noreturn]] static void emission_error(const char* code, std::string message){
    throw EmissionError(make_error(DiagnosticKind::EmissionError, code, std::move(message),
                                   "this is a compiler bug; please report the input program", SourceSpan{}));
}

static const ShellValue& deref(const ValuePtr& v){
    if(!v) emission_error("E0300", "null value reached the emitter");
    return *v;
}

static std::string pad(int indent){ return std::string(static_cast<size_t>(indent) * 4, ' '); }

static const char* arith_cmp(CmpOp op){
    switch(op){
        case CmpOp::NumEq: return "==";
        case CmpOp::NumNe: return "!=";
        case CmpOp::NumLt: return "<";
        case CmpOp::NumLe: return "<=";
        case CmpOp::NumGt: return ">";
        case CmpOp::NumGe: return ">=";
        case CmpOp::StrEq:
        case CmpOp::StrNe:
            break;
    }
    emission_error("E0303", "string comparison inside arithmetic expansion");
}

std::string PosixEmitter::env_expansion(const val::EnvVar& e) const {
    if(!e.default_value) return "${" + e.name + "}";
    return "${" + e.name + ":-" + in_quotes(*e.default_value, true) + "}";
}

// Quote rules inside ${NAME:-...} differ between shells (bash outside POSIX
// mode keeps single quotes there), so only plain words stay inline.
static bool inline_default(const std::string& text){
    for(char c : text) if(!is_shell_safe_char(c) && c != ' ') return false;
    return true;
}

std::string PosixEmitter::default_constant(const std::string& text) const {
    for(size_t i = 0; i < defaults_.size(); ++i)
        if(defaults_[i] == text) return "posixc_default_" + std::to_string(i + 1);
    defaults_.push_back(text);
    return "posixc_default_" + std::to_string(defaults_.size());
}

std::string PosixEmitter::bool_capture(const ShellValue& v) const {
    auto self = std::make_shared<const ShellValue>(v);
    return "$(if " + render_condition(self) + "; then printf '%s' true; else printf '%s' false; fi)";
}

std::string PosixEmitter::word(const ShellValue& v) const {
    return std::visit(overloaded{
        [&](const val::Literal& x) -> std::string { return quote_literal(x.text); },
        [&](const val::VariableRef& x) -> std::string { return "\"${" + mangle(x.name) + "}\""; },
        [&](const val::Concat& x) -> std::string {
            std::string joined;
            bool all_literal = true;
            for(const auto& p : x.parts){
                const auto* lit = std::get_if<val::Literal>(&deref(p).v);
                if(!lit){ all_literal = false; break; }
                joined += lit->text;
            }
            if(all_literal) return quote_literal(joined);
            return "\"" + in_quotes(v, false) + "\"";
        },
        [&](const val::CommandSubst& x) -> std::string { return "\"$(" + command_text(x.command) + ")\""; },
        [&](const val::EnvVar& x) -> std::string { return "\"" + env_expansion(x) + "\""; },
        [&](const val::Arithmetic&) -> std::string { return "\"$((" + arith(v, false) + "))\""; },
        [&](const val::Positional& x) -> std::string { return "\"${" + std::to_string(x.index) + "}\""; },
        [&](const val::ArgList&) -> std::string { return "\"$@\""; },
        [&](const val::ArgCount&) -> std::string { return "\"${#}\""; },
        [&](const val::ExitStatus&) -> std::string { return "\"${?}\""; },
        [&](const val::Compare&) -> std::string { return "\"" + bool_capture(v) + "\""; },
        [&](const val::Logical&) -> std::string { return "\"" + bool_capture(v) + "\""; },
    }, v.v);
}

std::string PosixEmitter::in_quotes(const ShellValue& v, bool in_default) const {
    return std::visit(overloaded{
        [&](const val::Literal& x) -> std::string {
            if(in_default && !inline_default(x.text)) return "${" + default_constant(x.text) + "}";
            return escape_double_quoted(x.text, in_default);
        },
        [&](const val::VariableRef& x) -> std::string { return "${" + mangle(x.name) + "}"; },
        [&](const val::Concat& x) -> std::string {
            std::string out;
            for(const auto& p : x.parts) out += in_quotes(deref(p), in_default);
            return out;
        },
        [&](const val::CommandSubst& x) -> std::string { return "$(" + command_text(x.command) + ")"; },
        [&](const val::EnvVar& x) -> std::string { return env_expansion(x); },
        [&](const val::Arithmetic&) -> std::string { return "$((" + arith(v, false) + "))"; },
        [&](const val::Positional& x) -> std::string { return "${" + std::to_string(x.index) + "}"; },
        [&](const val::ArgList&) -> std::string { return "$*"; },
        [&](const val::ArgCount&) -> std::string { return "${#}"; },
        [&](const val::ExitStatus&) -> std::string { return "${?}"; },
        [&](const val::Compare&) -> std::string { return bool_capture(v); },
        [&](const val::Logical&) -> std::string { return bool_capture(v); },
    }, v.v);
}

std::string PosixEmitter::arith(const ShellValue& v, bool nested) const {
    auto wrap = [nested](std::string s){ return nested ? "(" + s + ")" : s; };
    return std::visit(overloaded{
        [&](const val::Literal& x) -> std::string {
            if(!is_integer_text(x.text)) emission_error("E0303", "non-integer literal '" + x.text + "' in arithmetic");
            return nested && x.text[0] == '-' ? "(" + x.text + ")" : x.text;
        },
        [&](const val::VariableRef& x) -> std::string { return "${" + mangle(x.name) + "}"; },
        [&](const val::Concat& x) -> std::string {
            std::string out;
            for(const auto& p : x.parts) out += arith(deref(p), false);
            return wrap(out);
        },
        [&](const val::CommandSubst& x) -> std::string { return "$(" + command_text(x.command) + ")"; },
        [&](const val::EnvVar& x) -> std::string { return env_expansion(x); },
        [&](const val::Arithmetic& x) -> std::string {
            return wrap(arith(deref(x.lhs), true) + " " + arith_symbol(x.op) + " " + arith(deref(x.rhs), true));
        },
        [&](const val::Positional& x) -> std::string { return "${" + std::to_string(x.index) + "}"; },
        [&](const val::ArgList&) -> std::string { emission_error("E0303", "argument list inside arithmetic"); },
        [&](const val::ArgCount&) -> std::string { return "${#}"; },
        [&](const val::ExitStatus&) -> std::string { return "${?}"; },
        [&](const val::Compare& x) -> std::string {
            return wrap(arith(deref(x.lhs), true) + " " + arith_cmp(x.op) + " " + arith(deref(x.rhs), true));
        },
        [&](const val::Logical& x) -> std::string {
            if(x.op == LogicOp::Not) return wrap("!" + arith(deref(x.lhs), true));
            const char* op = x.op == LogicOp::And ? " && " : " || ";
            return wrap(arith(deref(x.lhs), true) + op + arith(deref(x.rhs), true));
        },
    }, v.v);
}

std::string PosixEmitter::render(const ValuePtr& v, QuoteContext ctx) const {
    const ShellValue& value = deref(v);
    switch(ctx){
        case QuoteContext::Word: return word(value);
        case QuoteContext::Assignment:
            // no field splitting on the right-hand side of an assignment
            if(std::holds_alternative<val::Arithmetic>(value.v)) return "$((" + arith(value, false) + "))";
            return word(value);
        case QuoteContext::DoubleQuoted: return in_quotes(value, false);
        case QuoteContext::ParamDefault: return in_quotes(value, true);
        case QuoteContext::Arithmetic: return arith(value, false);
    }
    emission_error("E0300", "unknown quoting context");
}

std::string PosixEmitter::grouped_condition(const ValuePtr& v) const {
    if(std::holds_alternative<val::Logical>(deref(v).v)) return "{ " + render_condition(v) + "; }";
    return render_condition(v);
}

std::string PosixEmitter::render_condition(const ValuePtr& v) const {
    const ShellValue& value = deref(v);
    auto truthy = [&]{ return "[ " + word(value) + " = true ]"; };
    auto nonzero = [&]{ return "[ " + word(value) + " -ne 0 ]"; };
    return std::visit(overloaded{
        [&](const val::Literal& x) -> std::string {
            if(x.text == "true") return "true";
            if(x.text == "false") return "false";
            if(is_integer_text(x.text)) return nonzero();
            return "[ -n " + word(value) + " ]";
        },
        [&](const val::VariableRef&) -> std::string { return truthy(); },
        [&](const val::Concat&) -> std::string { return truthy(); },
        [&](const val::CommandSubst&) -> std::string { return truthy(); },
        [&](const val::EnvVar&) -> std::string { return truthy(); },
        [&](const val::Arithmetic&) -> std::string { return nonzero(); },
        [&](const val::Positional&) -> std::string { return truthy(); },
        [&](const val::ArgList&) -> std::string { return "[ \"${#}\" -ne 0 ]"; },
        [&](const val::ArgCount&) -> std::string { return nonzero(); },
        [&](const val::ExitStatus&) -> std::string { return "[ \"${?}\" -eq 0 ]"; },
        [&](const val::Compare& x) -> std::string {
            return "[ " + word(deref(x.lhs)) + " " + cmp_name(x.op) + " " + word(deref(x.rhs)) + " ]";
        },
        [&](const val::Logical& x) -> std::string {
            switch(x.op){
                case LogicOp::Not: return "! " + grouped_condition(x.lhs);
                case LogicOp::And: return grouped_condition(x.lhs) + " && " + grouped_condition(x.rhs);
                case LogicOp::Or: return grouped_condition(x.lhs) + " || " + grouped_condition(x.rhs);
            }
            emission_error("E0300", "unknown logical operator");
        },
    }, value.v);
}

std::string PosixEmitter::command_text(const IrPtr& call) const {
    if(!call) emission_error("E0300", "null command");
    const auto* c = std::get_if<ir::Call>(&call->v);
    if(!c) emission_error("E0304", "command substitution must wrap a call");
    std::string out;
    switch(c->kind){
        case CallKind::User: out = mangle(c->program); break;
        case CallKind::Runtime:
            if(!find_runtime(c->program)) emission_error("E0302", "unknown runtime helper '" + c->program + "'");
            out = c->program;
            break;
        case CallKind::External: out = quote_literal(c->program); break;
    }
    for(const auto& a : c->args) out += " " + word(deref(a));
    if(c->discard_output) out += " >/dev/null";
    return out;
}

void PosixEmitter::emit_block(std::string& out, const IrPtr& body, int indent) const {
    const size_t before = out.size();
    if(body) emit_stmt(out, body, indent);
    if(out.size() == before) out += pad(indent) + ":\n";
}

void PosixEmitter::emit_stmt(std::string& out, const IrPtr& n, int indent) const {
    if(!n) emission_error("E0300", "null statement reached the emitter");
    const std::string p = pad(indent);
    std::visit(overloaded{
        [&](const ir::Assign& x){
            out += p + mangle(x.name) + "=" + render(x.value, QuoteContext::Assignment) + "\n";
        },
        [&](const ir::Echo& x){
            out += p + "printf '%s\\n' " + word(deref(x.value));
            if(x.stream == Stream::Stderr) out += " >&2";
            out += "\n";
        },
        [&](const ir::If& x){
            out += p + "if " + render_condition(x.test) + "; then\n";
            emit_block(out, x.then_branch, indent + 1);
            IrPtr rest = x.else_branch;
            while(rest){
                if(const auto* elif = std::get_if<ir::If>(&rest->v)){
                    out += p + "elif " + render_condition(elif->test) + "; then\n";
                    emit_block(out, elif->then_branch, indent + 1);
                    rest = elif->else_branch;
                } else {
                    out += p + "else\n";
                    emit_block(out, rest, indent + 1);
                    rest = nullptr;
                }
            }
            out += p + "fi\n";
        },
        [&](const ir::Case& x){
            out += p + "case " + word(deref(x.scrutinee)) + " in\n";
            for(const auto& arm : x.arms){
                std::string pats;
                for(const auto& pat : arm.patterns){
                    if(!pats.empty()) pats += "|";
                    pats += quote_literal(pat);
                }
                if(arm.wildcard) pats = "*";
                if(pats.empty()) emission_error("E0305", "case arm without patterns");
                out += p + "    " + pats + ")\n";
                emit_block(out, arm.body, indent + 2);
                out += p + "        ;;\n";
            }
            out += p + "esac\n";
        },
        [&](const ir::For& x){
            out += p + "for " + mangle(x.var) + " in $(seq " + word(deref(x.first)) + " " + word(deref(x.last)) + "); do\n";
            emit_block(out, x.body, indent + 1);
            out += p + "done\n";
        },
        [&](const ir::ForEach& x){
            if(x.items.empty()) return;
            out += p + "for " + mangle(x.var) + " in";
            for(const auto& item : x.items) out += " " + word(deref(item));
            out += "; do\n";
            emit_block(out, x.body, indent + 1);
            out += p + "done\n";
        },
        [&](const ir::While& x){
            out += p + "while " + render_condition(x.test) + "; do\n";
            emit_block(out, x.body, indent + 1);
            out += p + "done\n";
        },
        [&](const ir::FunctionDef&){
            emission_error("E0301", "nested function definition");
        },
        [&](const ir::Call&){
            out += p + command_text(n) + "\n";
        },
        [&](const ir::Return&){ out += p + "return 0\n"; },
        [&](const ir::Exit& x){ out += p + "exit " + word(deref(x.status)) + "\n"; },
        [&](const ir::Break&){ out += p + "break\n"; },
        [&](const ir::Continue&){ out += p + "continue\n"; },
        [&](const ir::Seq& x){ for(const auto& item : x.items) emit_stmt(out, item, indent); },
    }, n->v);
}

void PosixEmitter::emit_function(std::string& out, const ir::FunctionDef& f) const {
    const std::string name = f.name == "main" ? f.name : mangle(f.name);
    out += name + "() {\n";
    for(size_t i = 0; i < f.params.size(); ++i)
        out += "    " + mangle(f.params[i]) + "=" + word(ShellValue{val::Positional{static_cast<int>(i + 1)}}) + "\n";
    if(f.params.empty()) emit_block(out, f.body, 1);
    else if(f.body) emit_stmt(out, f.body, 1);
    out += "}\n";
}

std::string PosixEmitter::header() const {
    std::string out = "#!/bin/sh\n";
    out += std::string("# Generated by posixc ") + generator_version() + "\n";
    out += "# Source: " + sanitize_comment(opts_.source_name);
    if(!opts_.source_digest.empty()) out += " (sha256:" + sanitize_comment(opts_.source_digest) + ")";
    out += "\n";
    out += "set -euf\n";
    out += "IFS=' \t\n'\n";
    out += "export LC_ALL=C\n";
    return out;
}

static void collect_runtime_value(const ValuePtr& v, std::set<std::string>& out);

static void collect_runtime(const IrPtr& n, std::set<std::string>& out){
    if(!n) return;
    auto values = [&](const std::vector<ValuePtr>& xs){ for(const auto& x : xs) collect_runtime_value(x, out); };
    std::visit(overloaded{
        [&](const ir::Assign& x){ collect_runtime_value(x.value, out); },
        [&](const ir::Echo& x){ collect_runtime_value(x.value, out); },
        [&](const ir::If& x){ collect_runtime_value(x.test, out); collect_runtime(x.then_branch, out); collect_runtime(x.else_branch, out); },
        [&](const ir::Case& x){ collect_runtime_value(x.scrutinee, out); for(const auto& a : x.arms) collect_runtime(a.body, out); },
        [&](const ir::For& x){ collect_runtime_value(x.first, out); collect_runtime_value(x.last, out); collect_runtime(x.body, out); },
        [&](const ir::ForEach& x){ values(x.items); collect_runtime(x.body, out); },
        [&](const ir::While& x){ collect_runtime_value(x.test, out); collect_runtime(x.body, out); },
        [&](const ir::FunctionDef& x){ collect_runtime(x.body, out); },
        [&](const ir::Call& x){ if(x.kind == CallKind::Runtime) out.insert(x.program); values(x.args); },
        [&](const ir::Return&){},
        [&](const ir::Exit& x){ collect_runtime_value(x.status, out); },
        [&](const ir::Break&){},
        [&](const ir::Continue&){},
        [&](const ir::Seq& x){ for(const auto& i : x.items) collect_runtime(i, out); },
    }, n->v);
}

static void collect_runtime_value(const ValuePtr& v, std::set<std::string>& out){
    if(!v) return;
    std::visit(overloaded{
        [&](const val::Literal&){},
        [&](const val::VariableRef&){},
        [&](const val::Concat& x){ for(const auto& p : x.parts) collect_runtime_value(p, out); },
        [&](const val::CommandSubst& x){ collect_runtime(x.command, out); },
        [&](const val::EnvVar& x){ collect_runtime_value(x.default_value, out); },
        [&](const val::Arithmetic& x){ collect_runtime_value(x.lhs, out); collect_runtime_value(x.rhs, out); },
        [&](const val::Positional&){},
        [&](const val::ArgList&){},
        [&](const val::ArgCount&){},
        [&](const val::ExitStatus&){},
        [&](const val::Compare& x){ collect_runtime_value(x.lhs, out); collect_runtime_value(x.rhs, out); },
        [&](const val::Logical& x){ collect_runtime_value(x.lhs, out); collect_runtime_value(x.rhs, out); },
    }, v->v);
}

std::set<std::string> PosixEmitter::referenced_runtime(const IrPtr& root){
    std::set<std::string> names;
    collect_runtime(root, names);
    return names;
}

std::string PosixEmitter::emit(const IrPtr& program) const {
    if(!program) emission_error("E0300", "empty program");
    const auto* seq = std::get_if<ir::Seq>(&program->v);
    if(!seq) emission_error("E0301", "program root must be a sequence of functions");

    const ir::FunctionDef* entry = nullptr;
    std::vector<const ir::FunctionDef*> functions;
    for(const auto& item : seq->items){
        const auto* f = item ? std::get_if<ir::FunctionDef>(&item->v) : nullptr;
        if(!f) emission_error("E0301", "top-level statement outside a function");
        if(f->name == "main"){
            if(entry) emission_error("E0301", "duplicate entry point");
            entry = f;
        } else {
            functions.push_back(f);
        }
    }
    if(!entry) emission_error("E0301", "missing entry point 'main'");

    defaults_.clear();
    std::string out;
    const auto runtime = referenced_runtime(program);
    for(const auto& name : runtime){
        const RuntimeFunction* rf = find_runtime(name);
        if(!rf) emission_error("E0302", "unknown runtime helper '" + name + "'");
        out += "\n";
        out += rf->text;
    }
    for(const auto* f : functions){
        out += "\n";
        emit_function(out, *f);
    }
    out += "\n";
    emit_function(out, *entry);
    out += "\nmain \"$@\"\n";

    std::string constants;
    for(size_t i = 0; i < defaults_.size(); ++i)
        constants += "posixc_default_" + std::to_string(i + 1) + "=" + single_quote(defaults_[i]) + "\n";
    out = header() + constants + out;

    if(debug_emit())
        std::fprintf(stderr, "[dbg][emit] functions=%zu runtime=%zu bytes=%zu\n", functions.size() + 1, runtime.size(), out.size());
    return out;
}

} // namespace posixc
