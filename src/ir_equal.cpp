// Structural equality for ShellValue / ShellIR.
#include "posixc/shell_ir.hpp"

namespace posixc {

template<typename T>
static bool all_equal(const std::vector<T>& a, const std::vector<T>& b){
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i) if(!ir_equal(a[i], b[i])) return false;
    return true;
}

bool ir_equal(const ValuePtr& a, const ValuePtr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->v.index() != b->v.index()) return false;

    struct Visitor {
        const ShellValue& b;
        bool operator()(const val::Literal& x) const { return x.text == std::get<val::Literal>(b.v).text; }
        bool operator()(const val::VariableRef& x) const { return x.name == std::get<val::VariableRef>(b.v).name; }
        bool operator()(const val::Concat& x) const { return all_equal(x.parts, std::get<val::Concat>(b.v).parts); }
        bool operator()(const val::CommandSubst& x) const { return ir_equal(x.command, std::get<val::CommandSubst>(b.v).command); }
        bool operator()(const val::EnvVar& x) const {
            const auto& y = std::get<val::EnvVar>(b.v);
            return x.name == y.name && ir_equal(x.default_value, y.default_value);
        }
        bool operator()(const val::Arithmetic& x) const {
            const auto& y = std::get<val::Arithmetic>(b.v);
            return x.op == y.op && ir_equal(x.lhs, y.lhs) && ir_equal(x.rhs, y.rhs);
        }
        bool operator()(const val::Positional& x) const { return x.index == std::get<val::Positional>(b.v).index; }
        bool operator()(const val::ArgList&) const { return true; }
        bool operator()(const val::ArgCount&) const { return true; }
        bool operator()(const val::ExitStatus&) const { return true; }
        bool operator()(const val::Compare& x) const {
            const auto& y = std::get<val::Compare>(b.v);
            return x.op == y.op && ir_equal(x.lhs, y.lhs) && ir_equal(x.rhs, y.rhs);
        }
        bool operator()(const val::Logical& x) const {
            const auto& y = std::get<val::Logical>(b.v);
            return x.op == y.op && ir_equal(x.lhs, y.lhs) && ir_equal(x.rhs, y.rhs);
        }
    };
    return std::visit(Visitor{*b}, a->v);
}

bool ir_equal(const IrPtr& a, const IrPtr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->v.index() != b->v.index()) return false;

    struct Visitor {
        const ShellIR& b;
        bool operator()(const ir::Assign& x) const {
            const auto& y = std::get<ir::Assign>(b.v);
            return x.name == y.name && ir_equal(x.value, y.value);
        }
        bool operator()(const ir::Echo& x) const {
            const auto& y = std::get<ir::Echo>(b.v);
            return x.stream == y.stream && ir_equal(x.value, y.value);
        }
        bool operator()(const ir::If& x) const {
            const auto& y = std::get<ir::If>(b.v);
            return ir_equal(x.test, y.test) && ir_equal(x.then_branch, y.then_branch) && ir_equal(x.else_branch, y.else_branch);
        }
        bool operator()(const ir::Case& x) const {
            const auto& y = std::get<ir::Case>(b.v);
            if(!ir_equal(x.scrutinee, y.scrutinee) || x.arms.size() != y.arms.size()) return false;
            for(size_t i = 0; i < x.arms.size(); ++i){
                const auto& l = x.arms[i]; const auto& r = y.arms[i];
                if(l.wildcard != r.wildcard || l.patterns != r.patterns || !ir_equal(l.body, r.body)) return false;
            }
            return true;
        }
        bool operator()(const ir::For& x) const {
            const auto& y = std::get<ir::For>(b.v);
            return x.var == y.var && ir_equal(x.first, y.first) && ir_equal(x.last, y.last) && ir_equal(x.body, y.body);
        }
        bool operator()(const ir::ForEach& x) const {
            const auto& y = std::get<ir::ForEach>(b.v);
            return x.var == y.var && all_equal(x.items, y.items) && ir_equal(x.body, y.body);
        }
        bool operator()(const ir::While& x) const {
            const auto& y = std::get<ir::While>(b.v);
            return ir_equal(x.test, y.test) && ir_equal(x.body, y.body);
        }
        bool operator()(const ir::FunctionDef& x) const {
            const auto& y = std::get<ir::FunctionDef>(b.v);
            return x.name == y.name && x.params == y.params && ir_equal(x.body, y.body);
        }
        bool operator()(const ir::Call& x) const {
            const auto& y = std::get<ir::Call>(b.v);
            return x.kind == y.kind && x.program == y.program && x.discard_output == y.discard_output && all_equal(x.args, y.args);
        }
        bool operator()(const ir::Return&) const { return true; }
        bool operator()(const ir::Exit& x) const { return ir_equal(x.status, std::get<ir::Exit>(b.v).status); }
        bool operator()(const ir::Break&) const { return true; }
        bool operator()(const ir::Continue&) const { return true; }
        bool operator()(const ir::Seq& x) const { return all_equal(x.items, std::get<ir::Seq>(b.v).items); }
    };
    return std::visit(Visitor{*b}, a->v);
}

} // namespace posixc
