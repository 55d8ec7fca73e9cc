#include "posixc/ir_metrics.hpp"
#include <algorithm>

namespace posixc {

namespace {

struct MetricsWalker {
    IrMetrics m;

    void value(const ValuePtr& v){
        if(!v) return;
        ++m.node_count;
        std::visit(overloaded{
            [&](const val::Literal&){},
            [&](const val::VariableRef&){},
            [&](const val::Concat& x){ for(const auto& p : x.parts) value(p); },
            [&](const val::CommandSubst& x){ stmt(x.command, 0); },
            [&](const val::EnvVar& x){ value(x.default_value); },
            [&](const val::Arithmetic& x){ value(x.lhs); value(x.rhs); },
            [&](const val::Positional&){},
            [&](const val::ArgList&){},
            [&](const val::ArgCount&){},
            [&](const val::ExitStatus&){},
            [&](const val::Compare& x){ value(x.lhs); value(x.rhs); },
            [&](const val::Logical& x){
                if(x.op != LogicOp::Not) ++m.branch_count;
                value(x.lhs); value(x.rhs);
            },
        }, v->v);
    }

    void stmt(const IrPtr& n, size_t depth){
        if(!n) return;
        ++m.node_count;
        auto nested = [&](const IrPtr& body){
            m.max_nesting_depth = std::max(m.max_nesting_depth, depth + 1);
            stmt(body, depth + 1);
        };
        std::visit(overloaded{
            [&](const ir::Assign& x){ value(x.value); },
            [&](const ir::Echo& x){ value(x.value); },
            [&](const ir::If& x){
                ++m.branch_count;
                value(x.test);
                nested(x.then_branch);
                if(x.else_branch){
                    // elif chains stay at the same depth
                    if(std::holds_alternative<ir::If>(x.else_branch->v)) stmt(x.else_branch, depth);
                    else nested(x.else_branch);
                }
            },
            [&](const ir::Case& x){
                value(x.scrutinee);
                for(const auto& arm : x.arms){ ++m.branch_count; nested(arm.body); }
            },
            [&](const ir::For& x){ ++m.branch_count; value(x.first); value(x.last); nested(x.body); },
            [&](const ir::ForEach& x){ ++m.branch_count; for(const auto& i : x.items) value(i); nested(x.body); },
            [&](const ir::While& x){ ++m.branch_count; value(x.test); nested(x.body); },
            [&](const ir::FunctionDef& x){ ++m.function_count; stmt(x.body, 0); },
            [&](const ir::Call& x){ for(const auto& a : x.args) value(a); },
            [&](const ir::Return&){},
            [&](const ir::Exit& x){ value(x.status); },
            [&](const ir::Break&){},
            [&](const ir::Continue&){},
            [&](const ir::Seq& x){ for(const auto& i : x.items) stmt(i, depth); },
        }, n->v);
    }
};

} // namespace

IrMetrics compute_metrics(const IrPtr& root){
    MetricsWalker w;
    w.stmt(root, 0);
    return w.m;
}

} // namespace posixc
