#pragma once
#include "rustlite/lower.hpp"
#include "rustlite/macros.hpp"
#include "rustlite/stdlib.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rustlite::detail {

struct VarInfo {
    ValueKind kind = ValueKind::Unknown; // element kind for arrays
    std::string shell;                   // shell variable holding the value
    bool is_array = false;
    std::vector<std::string> elements;   // arrays: one shell variable per element
};

// Where the value of a block or control expression goes.
struct Target {
    enum class Kind { Discard, Assign, Result };
    Kind kind = Kind::Discard;
    std::string name; // Assign only
    ValueKind expected = ValueKind::Unknown;

    static Target discard(){ return {}; }
    static Target assign(std::string n, ValueKind k = ValueKind::Unknown){ return {Kind::Assign, std::move(n), k}; }
    static Target result(ValueKind k){ return {Kind::Result, {}, k}; }
};

// An Unknown value may carry arbitrary text, so it never fills an integer slot.
bool kind_accepts(ValueKind expected, ValueKind got);

// E0222 unless kind_accepts(expected, got).
void check_kind(ValueKind expected, ValueKind got, const SourceSpan& span, const std::string& what);

[[noreturn]] void lowering_error(const char* code, std::string message, const SourceSpan& span, std::string hint = "");

// Drops null items; a single item is returned as is.
posixc::IrPtr seq_or_single(std::vector<posixc::IrPtr> items);


class Lowerer : public MacroContext {
public:
    explicit Lowerer(const Program& program) : program_(program) {}

    posixc::IrPtr run(std::vector<posixc::Diagnostic>& warnings);

    LoweredValue lower_value(const Expr& e) override;
    LoweredValue lower_variable(const std::string& name, const SourceSpan& span) override;

private:
    // lower.cpp
    void check_call_graph(std::vector<posixc::Diagnostic>& warnings) const;
    void reserve_environment_names();
    posixc::IrPtr lower_function(const Function& f);
    posixc::IrPtr lower_block(const Block& b, const Target& t, ValueKind* kind = nullptr);
    void lower_stmt(const Stmt& s, std::vector<posixc::IrPtr>& out);
    void lower_let(const stmt::Let& l, const SourceSpan& span, std::vector<posixc::IrPtr>& out);
    posixc::IrPtr lower_into(const Expr& e, const Target& t, ValueKind* kind = nullptr);
    posixc::IrPtr lower_if(const If& x, const Target& t, ValueKind* kind);
    posixc::IrPtr lower_match(const Match& m, const Target& t, ValueKind* kind, const SourceSpan& span, NodeId id);
    posixc::IrPtr lower_for(const stmt::For& f, const SourceSpan& span);
    posixc::IrPtr lower_effect(const Expr& e);

    // lower_expr.cpp
    LoweredValue lower_unary(const expr::Unary& u, const SourceSpan& span);
    LoweredValue lower_binary(const expr::Binary& b, const SourceSpan& span);
    LoweredValue lower_call(const expr::Call& c, const SourceSpan& span);
    posixc::IrPtr lower_call_stmt(const expr::Call& c, const SourceSpan& span);
    LoweredValue lower_method(const expr::MethodCall& m, const SourceSpan& span);
    LoweredValue lower_index(const expr::Index& x, const SourceSpan& span);
    posixc::IrPtr lower_exec(const expr::Call& c, const SourceSpan& span);
    std::string env_name(const expr::Call& c, const SourceSpan& span) const;
    std::vector<posixc::ValuePtr> lower_args(const std::vector<ExprPtr>& args);
    std::vector<posixc::ValuePtr> lower_params(const Function& f, const expr::Call& c);
    LoweredValue numeric(LoweredValue v, const SourceSpan& span) const;
    bool is_array_expr(const Expr& e) const;
    std::vector<LoweredValue> array_elements(const Expr& e, const SourceSpan& span);

    void push_scope(){ scopes_.emplace_back(); }
    void pop_scope(){ scopes_.pop_back(); }
    void declare(const std::string& name, VarInfo info){ scopes_.back()[name] = std::move(info); }
    const VarInfo* lookup(const std::string& name) const;

    // Shell variables are global: every binding gets a name no other binding,
    // generated temporary or environment read uses. Locals of functions other
    // than main are prefixed with the function name.
    std::string fresh_name(const std::string& base);
    std::string local_name(const std::string& source_name);

    void note_stdout_write(const SourceSpan& span);

    const Program& program_;
    std::map<std::string, const Function*> functions_;
    std::vector<std::map<std::string, VarInfo>> scopes_;
    const Function* current_ = nullptr;
    std::set<std::string> taken_; // as emitted, after mangling
    std::map<std::string, bool> writes_stdout_; // per lowered function
    bool current_writes_ = false;
    SourceSpan first_write_;
};

} // namespace rustlite::detail
