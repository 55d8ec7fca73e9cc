#include "build_ast.hpp"
#include "grammar.hpp"
#include "rustlite/macros.hpp"
#include "rustlite/stdlib.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace rustlite::pegtl_front {

namespace {

namespace g = rustlite::grammar;
using node = tao::pegtl::parse_tree::node;
using posixc::DiagnosticKind;

struct Builder {
    posixc::DiagnosticSink& sink;
    NodeId next_id = 0;

    static SourceSpan span_of(const node& n){
        SourceSpan s;
        auto b = n.begin();
        s.line = static_cast<int>(b.line);
        s.col = static_cast<int>(b.column);
        if(n.has_content()){
            auto e = n.end();
            s.end_line = static_cast<int>(e.line);
            s.end_col = static_cast<int>(e.column);
        }
        return s;
    }

    static std::string trimmed(const node& n){
        std::string s = n.string();
        while(!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }

    void unsupported(const char* code, const std::string& what, const node& n, std::string hint = ""){
        sink.emit(posixc::make_error(DiagnosticKind::UnsupportedFeature, code, what + " are not supported",
                                     std::move(hint), span_of(n)));
    }

    void error(DiagnosticKind kind, const char* code, std::string message, const node& n, std::string hint = ""){
        sink.emit(posixc::make_error(kind, code, std::move(message), std::move(hint), span_of(n)));
    }

    ExprPtr make_expr(Expr::variant_t v, const node& n, NodeId id){
        return std::make_shared<const Expr>(Expr{std::move(v), span_of(n), id});
    }

    StmtPtr make_stmt(Stmt::variant_t v, const node& n, NodeId id){
        return std::make_shared<const Stmt>(Stmt{std::move(v), span_of(n), id});
    }

    // Keeps traversal going after a reported construct.
    ExprPtr placeholder(const node& n){ return make_expr(expr::IntLit{0}, n, next_id++); }

    // ---- literals

    bool parse_int(const node& n, long long& out){
        std::string text;
        for(char c : n.string()) if(c != '_') text.push_back(c);
        int base = 10;
        if(text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'o' || text[1] == 'b')){
            base = text[1] == 'x' ? 16 : text[1] == 'o' ? 8 : 2;
            text = text.substr(2);
        }
        // integer suffixes begin with i or u, neither of which is a hex digit
        if(auto suffix = text.find_first_of("iu"); suffix != std::string::npos) text.resize(suffix);
        errno = 0;
        char* end = nullptr;
        unsigned long long v = std::strtoull(text.c_str(), &end, base);
        if(errno == ERANGE || v > static_cast<unsigned long long>(LLONG_MAX) || end == text.c_str()){
            error(DiagnosticKind::UnsupportedFeature, "E0124", "integer literal out of range", n,
                  "shell arithmetic is limited to signed 64-bit values");
            return false;
        }
        out = static_cast<long long>(v);
        return true;
    }

    static void append_utf8(std::string& out, unsigned long cp){
        if(cp < 0x80){ out.push_back(static_cast<char>(cp)); }
        else if(cp < 0x800){
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if(cp < 0x10000){
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Contents of a string or raw string literal with escapes resolved.
    std::string string_value(const node& n){
        const std::string raw = n.string();
        if(n.is_type<g::raw_str_lit>()){
            auto first = raw.find('"');
            auto last = raw.rfind('"');
            return raw.substr(first + 1, last - first - 1);
        }
        std::string out;
        bool nul = false;
        for(size_t i = 1; i + 1 < raw.size(); ++i){
            char c = raw[i];
            if(c != '\\'){ out.push_back(c); continue; }
            char e = raw[++i];
            switch(e){
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case '0': nul = true; break;
                case '\\': out.push_back('\\'); break;
                case '"': out.push_back('"'); break;
                case '\'': out.push_back('\''); break;
                case 'x': {
                    unsigned long v = std::strtoul(raw.substr(i + 1, 2).c_str(), nullptr, 16);
                    if(v == 0) nul = true; else out.push_back(static_cast<char>(v));
                    i += 2;
                    break;
                }
                case 'u': {
                    auto close = raw.find('}', i);
                    unsigned long cp = std::strtoul(raw.substr(i + 2, close - i - 2).c_str(), nullptr, 16);
                    if(cp == 0) nul = true; else append_utf8(out, cp);
                    i = close;
                    break;
                }
                case '\n':
                    // line continuation swallows the newline and leading whitespace
                    while(i + 1 < raw.size() - 1 && (raw[i + 1] == ' ' || raw[i + 1] == '\t' || raw[i + 1] == '\n')) ++i;
                    break;
                default: out.push_back(e); break;
            }
        }
        if(nul)
            error(DiagnosticKind::UnsupportedFeature, "E0124", "string literal contains a NUL character", n,
                  "shell variables cannot hold NUL bytes");
        return out;
    }

    // ---- types

    TypeRef build_type(const node& n){
        TypeRef t;
        t.text = trimmed(n);
        if(n.is_type<g::tuple_type>()){
            if(n.children.empty()){ t.kind = ValueKind::Unit; return t; }
            unsupported("E0117", "tuple types", n);
            return t;
        }
        if(n.is_type<g::ref_type>()){
            for(const auto& c : n.children)
                if(c->is_type<g::mut_marker>()){ unsupported("E0124", "mutable references", n); return t; }
            const node& inner = *n.children.back();
            if(inner.is_type<g::path_type>() && inner.children.size() == 1){
                const std::string name = inner.children.front()->string();
                if(name == "str" || name == "String"){ t.kind = ValueKind::Str; return t; }
            }
            error(DiagnosticKind::UnsupportedFeature, "E0122", "unsupported type '" + t.text + "'", n,
                  "use &str, String, bool or an integer type");
            return t;
        }
        if(n.is_type<g::path_type>()){
            bool generic = false;
            for(const auto& c : n.children) if(c->is_type<g::generic_args>()) generic = true;
            std::string name = n.children.back()->is_type<g::ident>() ? n.children.back()->string() : "";
            if(!generic && (n.children.size() == 1 || t.text == "std::string::String")){
                static const char* const ints[] = {"i8", "i16", "i32", "i64", "u8", "u16", "u32", "u64", "isize", "usize"};
                for(const char* i : ints) if(name == i){ t.kind = ValueKind::Int; return t; }
                if(name == "String"){ t.kind = ValueKind::Str; return t; }
                if(name == "bool"){ t.kind = ValueKind::Bool; return t; }
            }
        }
        error(DiagnosticKind::UnsupportedFeature, "E0122", "unsupported type '" + t.text + "'", n,
              "use &str, String, bool or an integer type");
        return t;
    }

    static bool is_type_node(const node& n){
        return n.is_type<g::ref_type>() || n.is_type<g::path_type>() || n.is_type<g::tuple_type>() ||
               n.is_type<g::array_type>() || n.is_type<g::impl_type>() || n.is_type<g::fn_type>();
    }

    // ---- items

    void unsupported_item(const node& n){
        if(n.is_type<g::struct_item>()) unsupported("E0108", "struct definitions", n);
        else if(n.is_type<g::enum_item>()) unsupported("E0109", "enum definitions", n);
        else if(n.is_type<g::trait_item>()) unsupported("E0102", "traits", n);
        else if(n.is_type<g::impl_block>()) unsupported("E0103", "impl blocks", n);
        else if(n.is_type<g::const_item>() || n.is_type<g::static_item>())
            unsupported("E0110", "const and static items", n, "use a let binding inside the function");
        else if(n.is_type<g::mod_item>()) unsupported("E0111", "modules", n);
        else if(n.is_type<g::type_alias>()) unsupported("E0112", "type aliases", n);
        else if(n.is_type<g::macro_rules_item>()) unsupported("E0105", "macro_rules! definitions", n);
        else error(DiagnosticKind::ParseError, "E0001", "unexpected item", n);
    }

    void ignored_use(const node& n){
        sink.emit(posixc::make_warning("W0001", "use declaration ignored", "the allow-listed library needs no imports",
                                       span_of(n)));
    }

    Function build_function(const node& n){
        Function f;
        f.id = next_id++;
        f.span = span_of(n);
        f.ret.kind = ValueKind::Unit;
        f.ret.text = "()";
        for(const auto& c : n.children){
            if(c->is_type<g::qual_async>()) unsupported("E0101", "async functions", *c);
            else if(c->is_type<g::qual_unsafe>()) unsupported("E0104", "unsafe functions", *c);
            else if(c->is_type<g::qual_extern>()) unsupported("E0124", "extern functions", *c);
            else if(c->is_type<g::ident>()) f.name = c->string();
            else if(c->is_type<g::generic_params>()) unsupported("E0107", "generic parameters", *c);
            else if(c->is_type<g::where_clause>()) unsupported("E0107", "where clauses", *c);
            else if(c->is_type<g::param_list>()){
                for(const auto& p : c->children) build_param(*p, f.params);
            } else if(c->is_type<g::ret_type>()){
                f.ret = build_type(*c->children.back());
            } else if(c->is_type<g::block>()){
                f.body = build_block(*c);
            }
        }
        return f;
    }

    void build_param(const node& n, std::vector<Param>& out){
        if(n.children.size() == 1 && n.children.front()->is_type<g::self_param>()){
            unsupported("E0124", "methods with a self parameter", n);
            return;
        }
        if(n.is_type<g::self_param>()){
            unsupported("E0124", "methods with a self parameter", n);
            return;
        }
        Param p;
        p.span = span_of(n);
        for(const auto& c : n.children){
            if(c->is_type<g::ident>()) p.name = c->string();
            else if(c->is_type<g::pat_wildcard>()) p.name = "_";
            else if(c->is_type<g::pat_tuple>()) unsupported("E0117", "tuple patterns", *c);
            else if(is_type_node(*c)) p.type = build_type(*c);
        }
        out.push_back(std::move(p));
    }

    // ---- blocks and statements

    static bool has_semi(const node& n){
        for(const auto& c : n.children) if(c->is_type<g::stmt_semi>()) return true;
        return false;
    }

    // First child that is not a statement terminator.
    static const node* first_operand(const node& n){
        for(const auto& c : n.children) if(!c->is_type<g::stmt_semi>()) return c.get();
        return nullptr;
    }

    static bool yields_value(const node& n){
        return n.is_type<g::if_expr>() || n.is_type<g::match_expr>() || n.is_type<g::block>() ||
               n.is_type<g::unsafe_block>() || n.is_type<g::async_block>();
    }

    Block build_block(const node& n){
        Block b;
        b.span = span_of(n);
        for(size_t i = 0; i < n.children.size(); ++i){
            const node& c = *n.children[i];
            const bool last = i + 1 == n.children.size();
            if(last && !has_semi(c)){
                if(c.is_type<g::expr_stmt>()){ b.tail = build_expr(*first_operand(c)); continue; }
                if(c.is_type<g::block_like_stmt>() && yields_value(*first_operand(c))){
                    b.tail = build_expr(*first_operand(c));
                    continue;
                }
            }
            if(auto s = build_stmt(c)) b.stmts.push_back(std::move(s));
        }
        return b;
    }

    StmtPtr build_stmt(const node& n){
        if(n.is_type<g::let_stmt>()) return build_let(n);
        if(n.is_type<g::assign_stmt>()) return build_assign(n);
        if(n.is_type<g::return_stmt>()){
            NodeId id = next_id++;
            stmt::Return r;
            if(const node* v = first_operand(n)) r.value = build_expr(*v);
            return make_stmt(std::move(r), n, id);
        }
        if(n.is_type<g::break_stmt>()) return make_stmt(stmt::Break{}, n, next_id++);
        if(n.is_type<g::continue_stmt>()) return make_stmt(stmt::Continue{}, n, next_id++);
        if(n.is_type<g::block_like_stmt>()) return build_control_stmt(*first_operand(n));
        if(n.is_type<g::expr_stmt>()){
            NodeId id = next_id++;
            return make_stmt(stmt::ExprStmt{build_expr(*first_operand(n))}, n, id);
        }
        if(n.is_type<g::use_decl>()){ ignored_use(n); return nullptr; }
        if(n.is_type<g::fn_item>()){ unsupported("E0121", "nested function definitions", n, "move the function to the top level"); return nullptr; }
        unsupported("E0121", "items inside function bodies", n);
        return nullptr;
    }

    StmtPtr build_control_stmt(const node& n){
        NodeId id = next_id++;
        if(n.is_type<g::if_expr>()) return make_stmt(build_if(n), n, id);
        if(n.is_type<g::match_expr>()) return make_stmt(build_match(n), n, id);
        if(n.is_type<g::while_expr>()){
            stmt::While w;
            if(n.children.front()->is_type<g::let_condition>()){
                unsupported("E0124", "while let loops", n);
                w.cond = placeholder(n);
            } else {
                w.cond = build_expr(*n.children.front());
            }
            w.body = build_block(*n.children.back());
            return make_stmt(std::move(w), n, id);
        }
        if(n.is_type<g::for_expr>()){
            stmt::For f;
            const node& pat = *n.children[0];
            f.var = "_";
            if(pat.children.size() == 1 && pat.children.front()->is_type<g::pat_binding>()){
                for(const auto& c : pat.children.front()->children) if(c->is_type<g::ident>()) f.var = c->string();
            } else if(!(pat.children.size() == 1 && pat.children.front()->is_type<g::pat_wildcard>())){
                unsupported("E0117", "destructuring for-loop patterns", pat);
            }
            f.iterable = build_expr(*n.children[1]);
            f.body = build_block(*n.children[2]);
            return make_stmt(std::move(f), n, id);
        }
        return make_stmt(stmt::ExprStmt{build_expr(n)}, n, id);
    }

    StmtPtr build_let(const node& n){
        NodeId id = next_id++;
        stmt::Let l;
        bool have_name = false;
        for(const auto& c : n.children){
            if(c->is_type<g::mut_marker>()) l.is_mutable = true;
            else if(!have_name && c->is_type<g::ident>()){ l.name = c->string(); have_name = true; }
            else if(!have_name && c->is_type<g::pat_wildcard>()){ l.name = "_"; have_name = true; }
            else if(!have_name && c->is_type<g::pat_tuple>()){
                unsupported("E0117", "tuple patterns", *c);
                l.name = "_";
                have_name = true;
            }
            else if(is_type_node(*c)) l.type = build_type(*c);
            else l.init = build_expr(*c);
        }
        if(!l.init){
            unsupported("E0124", "let bindings without an initializer", n, "initialize the variable where it is declared");
            l.init = placeholder(n);
        }
        return make_stmt(std::move(l), n, id);
    }

    StmtPtr build_assign(const node& n){
        NodeId id = next_id++;
        const node& target = *n.children[0];
        const node& op = *n.children[1];
        stmt::Assign a;
        if(target.is_type<g::path_expr>() && target.children.size() == 1){
            a.name = target.children.front()->string();
        } else {
            unsupported("E0124", "assignments to this kind of target", target, "assign to a plain variable");
            a.name = "_";
        }
        ExprPtr rhs = build_expr(*n.children[2]);
        if(op.is_type<g::op_assign>()){
            a.value = rhs;
        } else {
            BinOp bop = BinOp::Add;
            if(op.is_type<g::op_add_assign>()) bop = BinOp::Add;
            else if(op.is_type<g::op_sub_assign>()) bop = BinOp::Sub;
            else if(op.is_type<g::op_mul_assign>()) bop = BinOp::Mul;
            else if(op.is_type<g::op_div_assign>()) bop = BinOp::Div;
            else if(op.is_type<g::op_rem_assign>()) bop = BinOp::Rem;
            else if(op.is_type<g::op_and_assign>()) bop = BinOp::BitAnd;
            else if(op.is_type<g::op_or_assign>()) bop = BinOp::BitOr;
            else if(op.is_type<g::op_xor_assign>()) bop = BinOp::BitXor;
            else if(op.is_type<g::op_shl_assign>()) bop = BinOp::Shl;
            else if(op.is_type<g::op_shr_assign>()) bop = BinOp::Shr;
            // a op= b  ->  a = a op b
            auto lhs = make_expr(expr::Var{a.name}, target, next_id++);
            a.value = make_expr(expr::Binary{bop, lhs, rhs}, n, next_id++);
        }
        return make_stmt(std::move(a), n, id);
    }

    // ---- control expressions

    If build_if(const node& n){
        If r;
        if(n.children[0]->is_type<g::let_condition>()){
            unsupported("E0124", "if let expressions", n, "use match instead");
            r.cond = placeholder(n);
        } else {
            r.cond = build_expr(*n.children[0]);
        }
        r.then_block = build_block(*n.children[1]);
        if(n.children.size() > 2){
            const node& e = *n.children[2];
            if(e.is_type<g::if_expr>()){
                Block b;
                b.span = span_of(e);
                NodeId id = next_id++;
                b.tail = make_expr(build_if(e), e, id);
                r.else_block = std::move(b);
            } else {
                r.else_block = build_block(e);
            }
        }
        return r;
    }

    bool build_pattern_literal(const node& n, PatternAlt& alt){
        bool negative = false;
        for(const auto& c : n.children){
            if(c->is_type<g::pat_neg>()){ negative = true; continue; }
            if(c->is_type<g::int_lit>()){
                long long v = 0;
                if(!parse_int(*c, v)) return false;
                alt.kind = PatternKind::Int;
                alt.text = std::to_string(negative ? -v : v);
                return true;
            }
            if(c->is_type<g::str_lit>() || c->is_type<g::raw_str_lit>()){
                alt.kind = PatternKind::Str;
                alt.text = string_value(*c);
                return true;
            }
            if(c->is_type<g::bool_lit>()){
                alt.kind = PatternKind::Bool;
                alt.text = c->string();
                return true;
            }
            if(c->is_type<g::float_lit>()){ unsupported("E0120", "floating-point literals", *c); return false; }
            if(c->is_type<g::char_lit>()){ unsupported("E0120", "character literals", *c); return false; }
        }
        return false;
    }

    std::vector<PatternAlt> build_pattern(const node& n){
        std::vector<PatternAlt> alts;
        for(const auto& cp : n.children){
            const node& c = *cp;
            PatternAlt alt;
            alt.span = span_of(c);
            if(c.is_type<g::pat_wildcard>()){
                alt.kind = PatternKind::Wildcard;
            } else if(c.is_type<g::pat_binding>()){
                alt.kind = PatternKind::Binding;
                for(const auto& b : c.children) if(b->is_type<g::ident>()) alt.text = b->string();
            } else if(c.is_type<g::pat_literal>()){
                if(!build_pattern_literal(c, alt)) continue;
            } else if(c.is_type<g::pat_range>()){
                PatternAlt lo, hi;
                if(!build_pattern_literal(*c.children.front(), lo) || !build_pattern_literal(*c.children.back(), hi)) continue;
                if(lo.kind != PatternKind::Int || hi.kind != PatternKind::Int){
                    error(DiagnosticKind::UnsupportedFeature, "E0219", "range patterns need integer bounds", c);
                    continue;
                }
                alt.kind = PatternKind::Range;
                alt.text = lo.text;
                alt.high = hi.text;
                alt.inclusive = c.children.size() == 2 || c.children[1]->is_type<g::op_range_incl>();
            } else if(c.is_type<g::pat_tuple>()){
                unsupported("E0117", "tuple patterns", c);
                continue;
            } else {
                error(DiagnosticKind::UnsupportedFeature, "E0219", "unsupported pattern '" + trimmed(c) + "'", c,
                      "match on integer, string or bool literals");
                continue;
            }
            alts.push_back(std::move(alt));
        }
        return alts;
    }

    Block arm_body(const node& n){
        if(n.is_type<g::block>()) return build_block(n);
        Block b;
        b.span = span_of(n);
        b.tail = build_expr(n);
        return b;
    }

    Match build_match(const node& n){
        Match m;
        m.scrutinee = build_expr(*n.children.front());
        for(size_t i = 1; i < n.children.size(); ++i){
            const node& arm = *n.children[i];
            MatchArm a;
            a.span = span_of(arm);
            for(const auto& c : arm.children){
                if(c->is_type<g::pattern>()) a.alts = build_pattern(*c);
                else if(c->is_type<g::match_guard>()) a.guard = build_expr(*c->children.front());
                else a.body = arm_body(*c);
            }
            m.arms.push_back(std::move(a));
        }
        return m;
    }

    // ---- expressions

    std::string build_path(const node& n){
        std::string path;
        for(const auto& c : n.children){
            if(c->is_type<g::turbofish>()){ unsupported("E0107", "turbofish type arguments", *c); continue; }
            if(!path.empty()) path += "::";
            path += c->string();
        }
        return path;
    }

    std::vector<ExprPtr> build_args(const node& call_args){
        std::vector<ExprPtr> args;
        for(const auto& c : call_args.children) args.push_back(build_expr(*c));
        return args;
    }

    ExprPtr build_macro(const node& n){
        NodeId id = next_id++;
        expr::MacroCall m;
        m.name = n.children.front()->string();
        const MacroSpec* spec = builtin_macros().find(m.name);
        if(!spec){
            error(DiagnosticKind::UnsupportedFeature, "E0106", "macro '" + m.name + "!' is not supported", n,
                  "only format!, println!, eprintln! and vec! are available");
            return make_expr(expr::IntLit{0}, n, id);
        }
        const node& body = *n.children.back();
        if(!body.is_type<g::macro_args>()){
            error(DiagnosticKind::UnsupportedFeature, "E0106", "arguments of " + m.name + "! are not supported in this form", n);
            return make_expr(expr::IntLit{0}, n, id);
        }
        size_t first = 0;
        if(spec->takes_format && !body.children.empty()){
            const node& f = *body.children.front();
            if(f.is_type<g::str_lit>() || f.is_type<g::raw_str_lit>()){
                m.literal_format = true;
                m.format = string_value(f);
                m.format_span = span_of(f);
                first = 1;
            }
        }
        for(size_t i = first; i < body.children.size(); ++i) m.args.push_back(build_expr(*body.children[i]));
        return make_expr(std::move(m), n, id);
    }

    ExprPtr build_postfix(const node& n){
        const node& head = *n.children.front();
        size_t i = 1;
        ExprPtr cur;
        if(head.is_type<g::path_expr>() && n.children[1]->is_type<g::call_args>()){
            NodeId id = next_id++;
            std::string callee = build_path(head);
            cur = make_expr(expr::Call{callee, build_args(*n.children[1])}, n, id);
            i = 2;
        } else {
            cur = build_expr(head);
        }
        for(; i < n.children.size(); ++i){
            const node& s = *n.children[i];
            if(s.is_type<g::method_suffix>()){
                NodeId id = next_id++;
                expr::MethodCall mc;
                mc.receiver = cur;
                for(const auto& c : s.children){
                    if(c->is_type<g::ident>()) mc.method = c->string();
                    else if(c->is_type<g::turbofish>()) unsupported("E0107", "turbofish type arguments", *c);
                    else if(c->is_type<g::call_args>()) mc.args = build_args(*c);
                }
                if(!find_method(mc.method))
                    error(DiagnosticKind::UnsupportedFeature, "E0123", "method '" + mc.method + "' is not supported", s,
                          "supported methods: to_string, trim, len, contains, starts_with, ends_with, replace, to_uppercase, to_lowercase");
                cur = make_expr(std::move(mc), s, id);
            } else if(s.is_type<g::index_suffix>()){
                NodeId id = next_id++;
                cur = make_expr(expr::Index{cur, build_expr(*s.children.front())}, s, id);
            } else if(s.is_type<g::field_suffix>()){
                unsupported("E0119", "field access expressions", s);
            } else if(s.is_type<g::await_suffix>()){
                unsupported("E0101", "await expressions", s);
            } else if(s.is_type<g::try_suffix>()){
                unsupported("E0114", "the ? operator", s);
            } else if(s.is_type<g::call_args>()){
                unsupported("E0124", "calls through expressions", s, "call a function by name");
            }
        }
        return cur;
    }

    static BinOp binop_of(const node& op){
        if(op.is_type<g::op_mul>()) return BinOp::Mul;
        if(op.is_type<g::op_div>()) return BinOp::Div;
        if(op.is_type<g::op_rem>()) return BinOp::Rem;
        if(op.is_type<g::op_add>()) return BinOp::Add;
        if(op.is_type<g::op_sub>()) return BinOp::Sub;
        if(op.is_type<g::op_shl>()) return BinOp::Shl;
        if(op.is_type<g::op_shr>()) return BinOp::Shr;
        if(op.is_type<g::op_bitand>()) return BinOp::BitAnd;
        if(op.is_type<g::op_bitxor>()) return BinOp::BitXor;
        if(op.is_type<g::op_bitor>()) return BinOp::BitOr;
        if(op.is_type<g::op_eq>()) return BinOp::Eq;
        if(op.is_type<g::op_ne>()) return BinOp::Ne;
        if(op.is_type<g::op_le>()) return BinOp::Le;
        if(op.is_type<g::op_ge>()) return BinOp::Ge;
        if(op.is_type<g::op_lt>()) return BinOp::Lt;
        if(op.is_type<g::op_gt>()) return BinOp::Gt;
        if(op.is_type<g::op_and>()) return BinOp::And;
        return BinOp::Or;
    }

    static bool is_binary_chain(const node& n){
        return n.is_type<g::mul_expr>() || n.is_type<g::add_expr>() || n.is_type<g::shift_expr>() ||
               n.is_type<g::bitand_expr>() || n.is_type<g::bitxor_expr>() || n.is_type<g::bitor_expr>() ||
               n.is_type<g::cmp_expr>() || n.is_type<g::and_expr>() || n.is_type<g::or_expr>();
    }

    ExprPtr build_expr(const node& n){
        if(n.is_type<g::int_lit>()){
            NodeId id = next_id++;
            long long v = 0;
            parse_int(n, v);
            return make_expr(expr::IntLit{v}, n, id);
        }
        if(n.is_type<g::str_lit>() || n.is_type<g::raw_str_lit>()){
            NodeId id = next_id++;
            return make_expr(expr::StrLit{string_value(n)}, n, id);
        }
        if(n.is_type<g::bool_lit>()) return make_expr(expr::BoolLit{n.string() == "true"}, n, next_id++);
        if(n.is_type<g::float_lit>()){ unsupported("E0120", "floating-point literals", n); return placeholder(n); }
        if(n.is_type<g::char_lit>()){ unsupported("E0120", "character literals", n, "use a string literal"); return placeholder(n); }
        if(n.is_type<g::path_expr>()){
            NodeId id = next_id++;
            if(n.children.size() != 1){
                unsupported("E0124", "path expressions", n);
                return make_expr(expr::IntLit{0}, n, id);
            }
            return make_expr(expr::Var{n.children.front()->string()}, n, id);
        }
        if(n.is_type<g::postfix_expr>()) return build_postfix(n);
        if(n.is_type<g::macro_call>()) return build_macro(n);
        if(n.is_type<g::closure>()){ unsupported("E0113", "closures", n, "define a named function"); return placeholder(n); }
        if(n.is_type<g::paren_or_tuple>()){ unsupported("E0117", "tuples", n); return placeholder(n); }
        if(n.is_type<g::array_lit>()){
            NodeId id = next_id++;
            expr::ArrayLit a;
            for(const auto& c : n.children){
                if(c->is_type<g::array_repeat_tail>()){ unsupported("E0124", "array repeat expressions", *c); continue; }
                a.elems.push_back(build_expr(*c));
            }
            return make_expr(std::move(a), n, id);
        }
        if(n.is_type<g::if_expr>()){ NodeId id = next_id++; return make_expr(build_if(n), n, id); }
        if(n.is_type<g::match_expr>()){ NodeId id = next_id++; return make_expr(build_match(n), n, id); }
        if(n.is_type<g::block>()){ NodeId id = next_id++; return make_expr(expr::BlockExpr{build_block(n)}, n, id); }
        if(n.is_type<g::loop_expr>()){ unsupported("E0115", "loop expressions", n, "use while true"); return placeholder(n); }
        if(n.is_type<g::unsafe_block>()){ unsupported("E0104", "unsafe blocks", n); return placeholder(n); }
        if(n.is_type<g::async_block>()){ unsupported("E0101", "async blocks", n); return placeholder(n); }
        if(n.is_type<g::while_expr>() || n.is_type<g::for_expr>()){
            unsupported("E0124", "loops used as values", n);
            return placeholder(n);
        }
        if(n.is_type<g::unary_expr>()){
            const node& op = *n.children.front();
            const node& operand = *n.children.back();
            if(op.is_type<g::op_ref>()){
                if(!op.children.empty()){ unsupported("E0124", "mutable references", op); return placeholder(n); }
                return build_expr(operand); // shared borrows are transparent
            }
            if(op.is_type<g::op_deref>()){ unsupported("E0118", "dereference expressions", n); return placeholder(n); }
            NodeId id = next_id++;
            if(op.is_type<g::op_neg>() && operand.is_type<g::int_lit>()){
                long long v = 0;
                parse_int(operand, v);
                return make_expr(expr::IntLit{-v}, n, id);
            }
            UnOp uop = op.is_type<g::op_neg>() ? UnOp::Neg : UnOp::Not;
            return make_expr(expr::Unary{uop, build_expr(operand)}, n, id);
        }
        if(n.is_type<g::cast_expr>()){ unsupported("E0116", "as casts", n); return placeholder(n); }
        if(is_binary_chain(n)){
            NodeId id = next_id++;
            ExprPtr acc = build_expr(*n.children[0]);
            for(size_t i = 1; i + 1 < n.children.size(); i += 2){
                BinOp op = binop_of(*n.children[i]);
                ExprPtr rhs = build_expr(*n.children[i + 1]);
                acc = make_expr(expr::Binary{op, acc, rhs}, n, i == 1 ? id : next_id++);
            }
            return acc;
        }
        if(n.is_type<g::expr>()){
            // lhs followed by a range tail
            NodeId id = next_id++;
            expr::Range r;
            r.start = build_expr(*n.children[0]);
            const node& tail = *n.children[1];
            r.inclusive = tail.children.front()->is_type<g::op_range_incl>();
            if(tail.children.size() < 2){
                unsupported("E0124", "open-ended ranges", tail);
                r.end = placeholder(tail);
            } else {
                r.end = build_expr(*tail.children[1]);
            }
            return make_expr(std::move(r), n, id);
        }
        error(DiagnosticKind::ParseError, "E0001", "unexpected expression '" + trimmed(n) + "'", n);
        return placeholder(n);
    }
};

} // namespace

Program build_program(const node& root, posixc::DiagnosticSink& sink){
    Builder b{sink};
    Program p;
    for(const auto& c : root.children){
        if(c->is_type<g::fn_item>()) p.functions.push_back(b.build_function(*c));
        else if(c->is_type<g::use_decl>()) b.ignored_use(*c);
        else b.unsupported_item(*c);
    }
    return p;
}

} // namespace rustlite::pegtl_front
