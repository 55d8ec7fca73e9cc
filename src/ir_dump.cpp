// EDN-style printer for ShellIR, used by POSIXC_EMIT_IR and test failure messages.
#include "posixc/shell_ir.hpp"

namespace posixc {

static std::string quoted(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += '"';
    return out;
}

static const char* logic_name(LogicOp op){
    switch(op){ case LogicOp::And: return "and"; case LogicOp::Or: return "or"; case LogicOp::Not: return "not"; }
    return "?";
}

static std::string join(const std::vector<ValuePtr>& xs){
    std::string out = "[";
    for(size_t i = 0; i < xs.size(); ++i){ if(i) out += ' '; out += to_sexpr(xs[i]); }
    return out + "]";
}

std::string to_sexpr(const ValuePtr& v){
    if(!v) return "nil";
    struct V {
        std::string operator()(const val::Literal& x) const { return quoted(x.text); }
        std::string operator()(const val::VariableRef& x) const { return "(var " + x.name + ")"; }
        std::string operator()(const val::Concat& x) const { return "(concat " + join(x.parts) + ")"; }
        std::string operator()(const val::CommandSubst& x) const { return "(subst " + to_sexpr(x.command) + ")"; }
        std::string operator()(const val::EnvVar& x) const {
            std::string out = "(env " + quoted(x.name);
            if(x.default_value) out += " :default " + to_sexpr(x.default_value);
            return out + ")";
        }
        std::string operator()(const val::Arithmetic& x) const {
            return std::string("(arith ") + arith_symbol(x.op) + " " + to_sexpr(x.lhs) + " " + to_sexpr(x.rhs) + ")";
        }
        std::string operator()(const val::Positional& x) const { return "(arg " + std::to_string(x.index) + ")"; }
        std::string operator()(const val::ArgList&) const { return "(args)"; }
        std::string operator()(const val::ArgCount&) const { return "(arg-count)"; }
        std::string operator()(const val::ExitStatus&) const { return "(exit-status)"; }
        std::string operator()(const val::Compare& x) const {
            return std::string("(cmp ") + cmp_name(x.op) + " " + to_sexpr(x.lhs) + " " + to_sexpr(x.rhs) + ")";
        }
        std::string operator()(const val::Logical& x) const {
            std::string out = std::string("(") + logic_name(x.op) + " " + to_sexpr(x.lhs);
            if(x.rhs) out += " " + to_sexpr(x.rhs);
            return out + ")";
        }
    };
    return std::visit(V{}, v->v);
}

std::string to_sexpr(const IrPtr& n){
    if(!n) return "nil";
    struct V {
        std::string operator()(const ir::Assign& x) const { return "(assign " + x.name + " " + to_sexpr(x.value) + ")"; }
        std::string operator()(const ir::Echo& x) const {
            return std::string(x.stream == Stream::Stderr ? "(echo-err " : "(echo ") + to_sexpr(x.value) + ")";
        }
        std::string operator()(const ir::If& x) const {
            std::string out = "(if " + to_sexpr(x.test) + " " + to_sexpr(x.then_branch);
            if(x.else_branch) out += " " + to_sexpr(x.else_branch);
            return out + ")";
        }
        std::string operator()(const ir::Case& x) const {
            std::string out = "(case " + to_sexpr(x.scrutinee);
            for(const auto& arm : x.arms){
                out += " [";
                if(arm.wildcard) out += "_";
                for(size_t i = 0; i < arm.patterns.size(); ++i){ if(i || arm.wildcard) out += ' '; out += quoted(arm.patterns[i]); }
                out += " " + to_sexpr(arm.body) + "]";
            }
            return out + ")";
        }
        std::string operator()(const ir::For& x) const {
            return "(for " + x.var + " " + to_sexpr(x.first) + " " + to_sexpr(x.last) + " " + to_sexpr(x.body) + ")";
        }
        std::string operator()(const ir::ForEach& x) const { return "(for-each " + x.var + " " + join(x.items) + " " + to_sexpr(x.body) + ")"; }
        std::string operator()(const ir::While& x) const { return "(while " + to_sexpr(x.test) + " " + to_sexpr(x.body) + ")"; }
        std::string operator()(const ir::FunctionDef& x) const {
            std::string out = "(fn " + x.name + " [";
            for(size_t i = 0; i < x.params.size(); ++i){ if(i) out += ' '; out += x.params[i]; }
            return out + "] " + to_sexpr(x.body) + ")";
        }
        std::string operator()(const ir::Call& x) const {
            const char* kind = x.kind == CallKind::User ? "call" : x.kind == CallKind::Runtime ? "runtime" : "exec";
            std::string out = std::string("(") + kind + " " + x.program + " " + join(x.args);
            if(x.discard_output) out += " :discard true";
            return out + ")";
        }
        std::string operator()(const ir::Return&) const { return "(return)"; }
        std::string operator()(const ir::Exit& x) const { return "(exit " + to_sexpr(x.status) + ")"; }
        std::string operator()(const ir::Break&) const { return "(break)"; }
        std::string operator()(const ir::Continue&) const { return "(continue)"; }
        std::string operator()(const ir::Seq& x) const {
            std::string out = "(seq";
            for(const auto& item : x.items) out += " " + to_sexpr(item);
            return out + ")";
        }
    };
    return std::visit(V{}, n->v);
}

} // namespace posixc
