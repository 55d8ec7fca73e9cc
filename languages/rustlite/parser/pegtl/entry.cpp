#include "../parser.hpp"
#include "build_ast.hpp"
#include "grammar.hpp"
#include "selector.hpp"
#include "posixc/features.hpp"
#include <cstdio>
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace rustlite {

namespace {

struct RuleMessage { const char* rule; const char* message; };

// Friendly text for the rules guarded by must<>.
const RuleMessage kRuleMessages[] = {
    {"str_body", "unterminated string literal or invalid escape"},
    {"param_list", "expected a parameter list"},
    {"rbracket", "expected ']'"},
    {"rbrace", "expected '}'"},
    {"rparen", "expected ')'"},
    {"block", "expected a block"},
    {"ident", "expected an identifier"},
    {"semi", "expected ';'"},
    {"eof", "expected an item such as 'fn'"},
};

std::string friendly_message(const std::string& what){
    const std::string marker = "parse error matching ";
    auto at = what.find(marker);
    if(at == std::string::npos) return "syntax error";
    std::string rule = what.substr(at + marker.size());
    if(auto sep = rule.rfind("::"); sep != std::string::npos) rule = rule.substr(sep + 2);
    for(const auto& m : kRuleMessages) if(rule == m.rule) return m.message;
    return "syntax error near " + rule;
}

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view filename, size_t max_diagnostics) const {
    ParseResult r;
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    try {
        auto root = tao::pegtl::parse_tree::parse< grammar::module, grammar::selector >(in);
        if(!root){
            r.diagnostics.push_back(posixc::make_error(posixc::DiagnosticKind::ParseError, "E0001", "syntax error", "",
                                                       posixc::SourceSpan{1, 1, -1, -1}));
            return r;
        }
        posixc::DiagnosticSink sink{&r.diagnostics, max_diagnostics};
        r.program = pegtl_front::build_program(*root, sink);
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        r.diagnostics.push_back(posixc::make_error(posixc::DiagnosticKind::ParseError, "E0001", friendly_message(e.what()), "",
                                                   posixc::SourceSpan{static_cast<int>(p.line), static_cast<int>(p.column), -1, -1}));
        return r;
    }
    r.success = !posixc::has_errors(r.diagnostics);
    if(posixc::debug_parse())
        std::fprintf(stderr, "[dbg][parse] %.*s functions=%zu diagnostics=%zu\n", static_cast<int>(filename.size()),
                     filename.data(), r.program.functions.size(), r.diagnostics.size());
    return r;
}

} // namespace rustlite
