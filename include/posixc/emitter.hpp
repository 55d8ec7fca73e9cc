// ShellIR -> POSIX sh text
#pragma once
#include "posixc/shell_ir.hpp"
#include <set>
#include <string>
#include <vector>

namespace posixc {

// Where a rendered value is placed.
enum class QuoteContext {
    Word,            // standalone command argument
    Assignment,      // right-hand side of name=value
    DoubleQuoted,    // inside "..."
    ParamDefault,    // inside "${NAME:-...}"
    Arithmetic,      // inside $(( ... ))
};

struct EmitOptions {
    std::string source_name = "<memory>";
    std::string source_digest; // hex sha256 of the source text
};

class PosixEmitter {
public:
    explicit PosixEmitter(EmitOptions opts) : opts_(std::move(opts)) {}

    // Root must be a Seq of FunctionDefs containing "main". Throws EmissionError.
    std::string emit(const IrPtr& program) const;

    // The single escape routine every interpolated value goes through.
    std::string render(const ValuePtr& v, QuoteContext ctx) const;

    // Command list usable after if/while.
    std::string render_condition(const ValuePtr& v) const;

    // Runtime helper names referenced anywhere in the tree.
    static std::set<std::string> referenced_runtime(const IrPtr& root);

    // Literal ${NAME:-...} defaults hoisted so far; entry i is posixc_default_<i+1>.
    const std::vector<std::string>& default_constants() const { return defaults_; }

private:
    EmitOptions opts_;
    // Filled while rendering; emit() writes them after the header.
    mutable std::vector<std::string> defaults_;

    std::string word(const ShellValue& v) const;
    std::string in_quotes(const ShellValue& v, bool in_default) const;
    std::string arith(const ShellValue& v, bool nested) const;
    std::string env_expansion(const val::EnvVar& e) const;
    std::string default_constant(const std::string& text) const;
    std::string bool_capture(const ShellValue& v) const;
    std::string grouped_condition(const ValuePtr& v) const;
    std::string command_text(const IrPtr& call) const;

    void emit_stmt(std::string& out, const IrPtr& n, int indent) const;
    void emit_block(std::string& out, const IrPtr& body, int indent) const;
    void emit_function(std::string& out, const ir::FunctionDef& f) const;
    std::string header() const;
};

} // namespace posixc
