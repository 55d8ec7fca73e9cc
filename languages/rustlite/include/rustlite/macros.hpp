// Expansion rules for the allow-listed macros
#pragma once
#include "rustlite/ast.hpp"
#include "posixc/shell_ir.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rustlite {

struct LoweredValue {
    posixc::ValuePtr value;
    ValueKind kind = ValueKind::Unknown;
};

// Services the lowering pass offers to macro expanders.
class MacroContext {
public:
    virtual ~MacroContext() = default;
    virtual LoweredValue lower_value(const Expr& e) = 0;
    virtual LoweredValue lower_variable(const std::string& name, const SourceSpan& span) = 0;
};

struct MacroExpansion {
    posixc::IrPtr statement;            // println!, eprintln!
    LoweredValue value;                 // format!
    std::vector<LoweredValue> elements; // vec!
};

using MacroExpander = std::function<MacroExpansion(const expr::MacroCall&, const SourceSpan&, MacroContext&)>;

struct MacroSpec {
    bool takes_format = false;
    MacroExpander expand;
};

class MacroRegistry {
public:
    void add_macro(std::string name, MacroSpec spec);
    const MacroSpec* find(std::string_view name) const;
private:
    std::map<std::string, MacroSpec, std::less<>> macros_;
};

// format!, println!, eprintln! and vec!
const MacroRegistry& builtin_macros();

struct FormatSegment {
    enum class Kind { Text, Next, Index, Named };
    Kind kind = Kind::Text;
    std::string text;  // literal text or captured name
    size_t index = 0;  // Index only
    bool debug = false; // {:?}
};

// Splits a format string into literal text and placeholders. Throws
// posixc::LoweringError (E0207) on malformed or unsupported placeholders.
std::vector<FormatSegment> parse_format_string(const std::string& fmt, const SourceSpan& span);

// Concat of the formatted pieces; all arguments must be consumed.
LoweredValue expand_format(const expr::MacroCall& call, const SourceSpan& span, MacroContext& ctx);

} // namespace rustlite
