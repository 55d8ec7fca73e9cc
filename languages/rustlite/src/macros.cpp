#include "rustlite/macros.hpp"
#include "posixc/diagnostics.hpp"
#include <cctype>

using namespace posixc;

namespace rustlite {

void MacroRegistry::add_macro(std::string name, MacroSpec spec){
    macros_[std::move(name)] = std::move(spec);
}

const MacroSpec* MacroRegistry::find(std::string_view name) const {
    auto it = macros_.find(name);
    return it == macros_.end() ? nullptr : &it->second;
}

[[noreturn]] static void format_error(const std::string& message, const SourceSpan& span, std::string hint = ""){
    throw LoweringError(make_error(DiagnosticKind::LoweringError, "E0207", message, std::move(hint), span));
}

static bool is_ident_text(const std::string& s){
    if(s.empty() || !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    for(char c : s) if(!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    return true;
}

std::vector<FormatSegment> parse_format_string(const std::string& fmt, const SourceSpan& span){
    std::vector<FormatSegment> out;
    std::string text;
    auto flush = [&]{
        if(text.empty()) return;
        FormatSegment s; s.text = std::move(text); out.push_back(std::move(s));
        text.clear();
    };
    for(size_t i = 0; i < fmt.size(); ++i){
        char c = fmt[i];
        if(c == '}'){
            if(i + 1 < fmt.size() && fmt[i + 1] == '}'){ text.push_back('}'); ++i; continue; }
            format_error("unmatched '}' in format string", span, "write '}}' for a literal brace");
        }
        if(c != '{'){ text.push_back(c); continue; }
        if(i + 1 < fmt.size() && fmt[i + 1] == '{'){ text.push_back('{'); ++i; continue; }
        auto close = fmt.find('}', i + 1);
        if(close == std::string::npos)
            format_error("unterminated placeholder in format string", span, "write '{{' for a literal brace");
        std::string inner = fmt.substr(i + 1, close - i - 1);
        i = close;
        FormatSegment seg;
        if(auto colon = inner.find(':'); colon != std::string::npos){
            if(inner.substr(colon) != ":?")
                format_error("unsupported format specification '{" + inner + "}'", span, "only {}, {:?} and {name} are supported");
            seg.debug = true;
            inner = inner.substr(0, colon);
        }
        if(inner.empty()){
            seg.kind = FormatSegment::Kind::Next;
        } else if(std::isdigit(static_cast<unsigned char>(inner[0]))){
            for(char d : inner) if(!std::isdigit(static_cast<unsigned char>(d)))
                format_error("invalid placeholder '{" + inner + "}'", span);
            seg.kind = FormatSegment::Kind::Index;
            seg.index = std::stoul(inner);
        } else if(is_ident_text(inner)){
            seg.kind = FormatSegment::Kind::Named;
            seg.text = inner;
        } else {
            format_error("invalid placeholder '{" + inner + "}'", span);
        }
        flush();
        out.push_back(std::move(seg));
    }
    flush();
    return out;
}

// {:?} on a string shows it quoted.
static ValuePtr display(const LoweredValue& v, bool debug){
    if(debug && v.kind == ValueKind::Str) return make_concat({make_literal("\""), v.value, make_literal("\"")});
    return v.value;
}

LoweredValue expand_format(const expr::MacroCall& call, const SourceSpan& span, MacroContext& ctx){
    if(!call.literal_format)
        throw LoweringError(make_error(DiagnosticKind::LoweringError, "E0217",
                                       call.name + "! requires a string literal as its first argument",
                                       "write " + call.name + "!(\"{}\", value)", span));
    const SourceSpan fspan = call.format_span.line >= 0 ? call.format_span : span;
    auto segments = parse_format_string(call.format, fspan);

    std::vector<LoweredValue> args;
    for(const auto& a : call.args) args.push_back(ctx.lower_value(*a));
    std::vector<bool> used(args.size(), false);

    std::vector<ValuePtr> parts;
    size_t next = 0;
    for(const auto& seg : segments){
        switch(seg.kind){
            case FormatSegment::Kind::Text:
                parts.push_back(make_literal(seg.text));
                break;
            case FormatSegment::Kind::Next:
            case FormatSegment::Kind::Index: {
                size_t idx = seg.kind == FormatSegment::Kind::Next ? next++ : seg.index;
                if(idx >= args.size())
                    format_error("format string references argument " + std::to_string(idx) + " but only " +
                                 std::to_string(args.size()) + " were given", fspan);
                used[idx] = true;
                parts.push_back(display(args[idx], seg.debug));
                break;
            }
            case FormatSegment::Kind::Named:
                parts.push_back(display(ctx.lower_variable(seg.text, fspan), seg.debug));
                break;
        }
    }
    for(size_t i = 0; i < used.size(); ++i)
        if(!used[i]) format_error("argument " + std::to_string(i) + " is never used by the format string", span,
                                  "add a {} placeholder or remove the argument");

    if(parts.empty()) return {make_literal(""), ValueKind::Str};
    if(parts.size() == 1) return {parts.front(), ValueKind::Str};
    return {make_concat(std::move(parts)), ValueKind::Str};
}

static MacroRegistry make_builtin_macros(){
    MacroRegistry reg;
    // format!("...", args) -> Concat
    reg.add_macro("format", {true, [](const expr::MacroCall& call, const SourceSpan& span, MacroContext& ctx){
        MacroExpansion e;
        e.value = expand_format(call, span, ctx);
        return e;
    }});
    // println!("...", args) -> printf '%s\n' "<concat>"
    reg.add_macro("println", {true, [](const expr::MacroCall& call, const SourceSpan& span, MacroContext& ctx){
        MacroExpansion e;
        if(!call.literal_format && call.args.empty()) e.statement = make_echo(make_literal(""));
        else e.statement = make_echo(expand_format(call, span, ctx).value);
        return e;
    }});
    reg.add_macro("eprintln", {true, [](const expr::MacroCall& call, const SourceSpan& span, MacroContext& ctx){
        MacroExpansion e;
        if(!call.literal_format && call.args.empty()) e.statement = make_echo(make_literal(""), Stream::Stderr);
        else e.statement = make_echo(expand_format(call, span, ctx).value, Stream::Stderr);
        return e;
    }});
    // vec![a, b] -> element values, flattened by the caller
    reg.add_macro("vec", {false, [](const expr::MacroCall& call, const SourceSpan&, MacroContext& ctx){
        MacroExpansion e;
        for(const auto& a : call.args) e.elements.push_back(ctx.lower_value(*a));
        return e;
    }});
    return reg;
}

const MacroRegistry& builtin_macros(){
    static const MacroRegistry reg = make_builtin_macros();
    return reg;
}

} // namespace rustlite
