#pragma once
#include "rustlite/ast.hpp"
#include "posixc/diagnostics.hpp"
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace rustlite::pegtl_front {

// Parse tree -> AST. Unsupported constructs are reported to sink and replaced
// by placeholders so the walk can continue.
Program build_program(const tao::pegtl::parse_tree::node& root, posixc::DiagnosticSink& sink);

} // namespace rustlite::pegtl_front
