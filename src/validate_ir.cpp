#include "posixc/validator.hpp"
#include "posixc/features.hpp"
#include "posixc/runtime.hpp"
#include <cstdio>
#include <set>

namespace posixc {

bool is_evaluating_builtin(const std::string& program){
    static const std::set<std::string> names = {
        ".", "alias", "builtin", "command", "eval", "exec", "source", "trap",
    };
    return names.count(program) != 0;
}

static std::string base_name(const std::string& program){
    auto slash = program.rfind('/');
    return slash == std::string::npos ? program : program.substr(slash + 1);
}

static bool is_shell_program(const std::string& base){
    static const std::set<std::string> shells = {
        "ash", "bash", "dash", "ksh", "mksh", "sh", "yash", "zsh",
    };
    return shells.count(base) != 0;
}

// Programs that run the rest of their arguments as another command.
static bool is_launcher(const std::string& base){
    static const std::set<std::string> names = {
        "busybox", "chroot", "doas", "env", "flock", "ionice", "nice", "nohup", "nsenter", "setsid",
        "stdbuf", "sudo", "taskset", "time", "timeout", "unshare", "xargs",
    };
    return names.count(base) != 0;
}

// Programs that hand their arguments to a shell as command text.
static bool passes_command_text(const std::string& base){
    static const std::set<std::string> names = { "runuser", "script", "ssh", "su", "watch" };
    return names.count(base) != 0;
}

static bool is_c_option(const std::string& word){
    return word.size() > 1 && word[0] == '-' && word[1] != '-' && word.find('c') != std::string::npos;
}

// Options, VAR=value assignments and numeric operands (durations, priorities)
// that a launcher consumes before the command it runs.
static bool is_launcher_operand(const std::string& word){
    return word.empty() || word[0] == '-' || word.find('=') != std::string::npos || (word[0] >= '0' && word[0] <= '9');
}

namespace {

enum class ArgMode {
    Data,        // arguments are plain data
    FindArgs,    // find: data until -exec and friends
    Launcher,    // the next non-operand word is the command to run
    Launched,    // after a launcher's command word
    Shell,       // a shell: -c or a computed word means evaluated text
    CommandText, // su, ssh, ...: computed words are evaluated text
};

ArgMode mode_for(const std::string& program, bool launched){
    const std::string base = base_name(program);
    if(is_shell_program(base)) return ArgMode::Shell;
    if(passes_command_text(base)) return ArgMode::CommandText;
    if(is_launcher(base)) return ArgMode::Launcher;
    if(base == "find") return ArgMode::FindArgs;
    return launched ? ArgMode::Launched : ArgMode::Data;
}

bool is_find_exec(const std::string& word){
    return word == "-exec" || word == "-execdir" || word == "-ok" || word == "-okdir";
}

} // namespace

bool is_dynamic_evaluation(const ir::Call& call){
    if(call.kind != CallKind::External) return false;
    if(is_evaluating_builtin(base_name(call.program))) return true;
    ArgMode mode = mode_for(call.program, false);
    bool computed_word = false;
    for(const auto& a : call.args){
        if(mode == ArgMode::Data) return false;
        if(!a) continue;
        const auto* lit = std::get_if<val::Literal>(&a->v);
        switch(mode){
            case ArgMode::Data:
                break;
            case ArgMode::FindArgs:
                if(lit && is_find_exec(lit->text)) mode = ArgMode::Launcher;
                break;
            case ArgMode::Launcher:
                // a computed word may name the command itself
                if(!lit) return true;
                if(is_launcher_operand(lit->text)) break;
                if(is_evaluating_builtin(base_name(lit->text))) return true;
                mode = mode_for(lit->text, true);
                break;
            case ArgMode::Launched:
                if(!lit){ computed_word = true; break; }
                // sudo -u user sh -c ...: the real command may come later
                if(computed_word && is_c_option(lit->text)) return true;
                if(is_evaluating_builtin(base_name(lit->text))) return true;
                if(mode_for(lit->text, true) != ArgMode::Launched) mode = mode_for(lit->text, true);
                break;
            case ArgMode::Shell:
                // any option cluster carrying 'c' makes the next word a script
                if(!lit || is_c_option(lit->text)) return true;
                break;
            case ArgMode::CommandText:
                if(!lit) return true;
                break;
        }
    }
    return false;
}

namespace {

class IrChecker {
public:
    ValidationReport report;

    void stmt(const IrPtr& n){
        if(!n){ fail("E0411", "null statement in IR"); return; }
        std::visit(overloaded{
            [&](const ir::Assign& x){ ident(x.name, "variable"); value(x.value); },
            [&](const ir::Echo& x){ value(x.value); },
            [&](const ir::If& x){ value(x.test); stmt_opt(x.then_branch); stmt_opt(x.else_branch); },
            [&](const ir::Case& x){ value(x.scrutinee); for(const auto& a : x.arms) stmt_opt(a.body); },
            [&](const ir::For& x){
                ident(x.var, "loop variable");
                arith_operand(x.first); arith_operand(x.last);
                stmt_opt(x.body);
            },
            [&](const ir::ForEach& x){ ident(x.var, "loop variable"); for(const auto& i : x.items) value(i); stmt_opt(x.body); },
            [&](const ir::While& x){ value(x.test); stmt_opt(x.body); },
            [&](const ir::FunctionDef& x){
                ident(x.name, "function");
                for(const auto& p : x.params) ident(p, "parameter");
                stmt_opt(x.body);
            },
            [&](const ir::Call& x){ call(x); },
            [&](const ir::Return&){},
            [&](const ir::Exit& x){ arith_operand(x.status); },
            [&](const ir::Break&){},
            [&](const ir::Continue&){},
            [&](const ir::Seq& x){ for(const auto& i : x.items) stmt(i); },
        }, n->v);
    }

private:
    void fail(const char* code, std::string message){
        report.ok = false;
        report.diagnostics.push_back(make_error(DiagnosticKind::ValidationFailure, code, std::move(message),
                                                "", SourceSpan{}));
    }

    void stmt_opt(const IrPtr& n){ if(n) stmt(n); }

    void ident(const std::string& name, const char* what){
        if(!is_valid_identifier(name)) fail("E0411", std::string("invalid ") + what + " name '" + name + "'");
    }

    void call(const ir::Call& c){
        switch(c.kind){
            case CallKind::User: ident(c.program, "function"); break;
            case CallKind::Runtime:
                if(!find_runtime(c.program)) fail("E0411", "unknown runtime helper '" + c.program + "'");
                break;
            case CallKind::External:
                if(c.program.empty()) fail("E0411", "empty program name");
                break;
        }
        if(is_dynamic_evaluation(c)) fail("E0402", "call to '" + c.program + "' would evaluate text as shell code");
        for(const auto& a : c.args) value(a);
    }

    void arith_operand(const ValuePtr& v){
        if(!v){ fail("E0410", "missing arithmetic operand"); return; }
        if(!is_numeric_value(*v)) fail("E0410", "arithmetic operand is not numeric: " + to_sexpr(v));
        value(v);
    }

    void value(const ValuePtr& v){
        if(!v){ fail("E0411", "null value in IR"); return; }
        std::visit(overloaded{
            [&](const val::Literal&){},
            [&](const val::VariableRef& x){ ident(x.name, "variable"); },
            [&](const val::Concat& x){ for(const auto& p : x.parts) value(p); },
            [&](const val::CommandSubst& x){
                if(!x.command || !std::holds_alternative<ir::Call>(x.command->v)){
                    fail("E0409", "command substitution must wrap a single call");
                    return;
                }
                stmt(x.command);
            },
            [&](const val::EnvVar& x){
                if(!is_valid_identifier(x.name)) fail("E0401", "invalid environment variable name '" + x.name + "'");
                if(x.default_value) value(x.default_value);
            },
            [&](const val::Arithmetic& x){ arith_operand(x.lhs); arith_operand(x.rhs); },
            [&](const val::Positional& x){ if(x.index < 1) fail("E0411", "positional index must be positive"); },
            [&](const val::ArgList&){},
            [&](const val::ArgCount&){},
            [&](const val::ExitStatus&){},
            [&](const val::Compare& x){
                if(x.op == CmpOp::StrEq || x.op == CmpOp::StrNe){ value(x.lhs); value(x.rhs); }
                else { arith_operand(x.lhs); arith_operand(x.rhs); }
            },
            [&](const val::Logical& x){
                value(x.lhs);
                if(x.op != LogicOp::Not) value(x.rhs);
            },
        }, v->v);
    }
};

} // namespace

ValidationReport validate_ir(const IrPtr& program){
    IrChecker checker;
    checker.stmt(program);
    if(debug_validate())
        std::fprintf(stderr, "[dbg][validate] ir ok=%d diagnostics=%zu\n", checker.report.ok ? 1 : 0,
                     checker.report.diagnostics.size());
    return std::move(checker.report);
}

} // namespace posixc
