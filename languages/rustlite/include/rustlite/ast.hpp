// Source-level syntax tree for the accepted subset.
// Built once by the parser, consumed once by lowering.
#pragma once
#include "posixc/diagnostics.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rustlite {

using posixc::SourceSpan;
using NodeId = std::uint32_t; // pre-order position, stable for a given source text

enum class ValueKind { Int, Str, Bool, Unit, Unknown };

struct TypeRef {
    ValueKind kind = ValueKind::Unknown;
    std::string text; // as written
};

struct Expr;
struct Stmt;
using ExprPtr = std::shared_ptr<const Expr>;
using StmtPtr = std::shared_ptr<const Stmt>;

struct Block {
    std::vector<StmtPtr> stmts;
    ExprPtr tail; // value of the block, may be null
    SourceSpan span;
};

enum class BinOp { Add, Sub, Mul, Div, Rem, BitAnd, BitOr, BitXor, Shl, Shr, Eq, Ne, Lt, Le, Gt, Ge, And, Or };
enum class UnOp { Neg, Not };

// Shared by statement and expression position.
struct If {
    ExprPtr cond;
    Block then_block;
    std::optional<Block> else_block; // `else if` is an else block whose tail is an If
};

enum class PatternKind { Wildcard, Binding, Int, Str, Bool, Range };

struct PatternAlt {
    PatternKind kind = PatternKind::Wildcard;
    std::string text;      // binding name, literal text (unquoted) or range low bound
    std::string high;      // range high bound
    bool inclusive = true; // range only
    SourceSpan span;
};

struct MatchArm {
    std::vector<PatternAlt> alts; // or-pattern alternatives
    ExprPtr guard;                // may be null
    Block body;
    SourceSpan span;
};

struct Match {
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
};

namespace expr {
struct IntLit { long long value = 0; };
struct StrLit { std::string value; };
struct BoolLit { bool value = false; };
struct Var { std::string name; };
struct Unary { UnOp op; ExprPtr operand; };
struct Binary { BinOp op; ExprPtr lhs; ExprPtr rhs; };
struct Call { std::string callee; std::vector<ExprPtr> args; }; // callee path joined with "::"
struct MethodCall { ExprPtr receiver; std::string method; std::vector<ExprPtr> args; };
// format!/println!/eprintln! carry the format string; vec! carries only elements.
struct MacroCall {
    std::string name;
    bool literal_format = false; // first argument was a string literal, moved into format
    std::string format;
    SourceSpan format_span;
    std::vector<ExprPtr> args;
};
struct ArrayLit { std::vector<ExprPtr> elems; };
struct Index { ExprPtr base; ExprPtr index; };
struct Range { ExprPtr start; ExprPtr end; bool inclusive = false; };
struct BlockExpr { Block block; };
} // namespace expr

struct Expr {
    using variant_t = std::variant<expr::IntLit, expr::StrLit, expr::BoolLit, expr::Var, expr::Unary, expr::Binary,
                                   expr::Call, expr::MethodCall, expr::MacroCall, expr::ArrayLit, expr::Index,
                                   expr::Range, expr::BlockExpr, If, Match>;
    variant_t v;
    SourceSpan span;
    NodeId id = 0;
};

namespace stmt {
struct Let { std::string name; bool is_mutable = false; std::optional<TypeRef> type; ExprPtr init; }; // name "_" discards
struct Assign { std::string name; ExprPtr value; }; // compound forms are already desugared
struct For { std::string var; ExprPtr iterable; Block body; };
struct While { ExprPtr cond; Block body; };
struct Break {};
struct Continue {};
struct Return { ExprPtr value; }; // may be null
struct ExprStmt { ExprPtr expr; };
} // namespace stmt

struct Stmt {
    using variant_t = std::variant<stmt::Let, stmt::Assign, If, Match, stmt::For, stmt::While, stmt::Break,
                                   stmt::Continue, stmt::Return, stmt::ExprStmt>;
    variant_t v;
    SourceSpan span;
    NodeId id = 0;
};

struct Param {
    std::string name;
    TypeRef type;
    SourceSpan span;
};

struct Function {
    std::string name;
    std::vector<Param> params;
    TypeRef ret; // Unit when omitted
    Block body;
    SourceSpan span;
    NodeId id = 0;
};

struct Program {
    std::vector<Function> functions;
};

const char* kind_name(ValueKind k);

} // namespace rustlite
