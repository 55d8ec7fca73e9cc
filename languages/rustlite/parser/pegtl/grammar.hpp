#pragma once
#include <tao/pegtl.hpp>

// Grammar for the accepted subset plus the surrounding language forms that are
// recognized only so they can be reported as unsupported.
namespace rustlite::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct line_comment : seq< two<'/'>, until< eolf > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct ws : star< sor< space, line_comment, block_comment > > {};

struct ident_other : ranges< 'a', 'z', 'A', 'Z', '0', '9', '_', '_' > {};
template< typename Str > struct word : seq< Str, not_at< ident_other > > {};
template< typename Str > struct key : seq< word< Str >, ws > {};

struct any_keyword : sor<
    word< TAO_PEGTL_STRING("as") >, word< TAO_PEGTL_STRING("async") >, word< TAO_PEGTL_STRING("await") >,
    word< TAO_PEGTL_STRING("break") >, word< TAO_PEGTL_STRING("const") >, word< TAO_PEGTL_STRING("continue") >,
    word< TAO_PEGTL_STRING("crate") >, word< TAO_PEGTL_STRING("dyn") >, word< TAO_PEGTL_STRING("else") >,
    word< TAO_PEGTL_STRING("enum") >, word< TAO_PEGTL_STRING("extern") >, word< TAO_PEGTL_STRING("false") >,
    word< TAO_PEGTL_STRING("fn") >, word< TAO_PEGTL_STRING("for") >, word< TAO_PEGTL_STRING("if") >,
    word< TAO_PEGTL_STRING("impl") >, word< TAO_PEGTL_STRING("in") >, word< TAO_PEGTL_STRING("let") >,
    word< TAO_PEGTL_STRING("loop") >, word< TAO_PEGTL_STRING("match") >, word< TAO_PEGTL_STRING("mod") >,
    word< TAO_PEGTL_STRING("move") >, word< TAO_PEGTL_STRING("mut") >, word< TAO_PEGTL_STRING("pub") >,
    word< TAO_PEGTL_STRING("ref") >, word< TAO_PEGTL_STRING("return") >, word< TAO_PEGTL_STRING("self") >,
    word< TAO_PEGTL_STRING("Self") >, word< TAO_PEGTL_STRING("static") >, word< TAO_PEGTL_STRING("struct") >,
    word< TAO_PEGTL_STRING("super") >, word< TAO_PEGTL_STRING("trait") >, word< TAO_PEGTL_STRING("true") >,
    word< TAO_PEGTL_STRING("type") >, word< TAO_PEGTL_STRING("unsafe") >, word< TAO_PEGTL_STRING("use") >,
    word< TAO_PEGTL_STRING("where") >, word< TAO_PEGTL_STRING("while") > > {};

struct ident : seq< not_at< any_keyword >, ranges< 'a', 'z', 'A', 'Z', '_', '_' >, star< ident_other > > {};

struct kw_as : key< TAO_PEGTL_STRING("as") > {};
struct kw_async : key< TAO_PEGTL_STRING("async") > {};
struct kw_break : key< TAO_PEGTL_STRING("break") > {};
struct kw_const : key< TAO_PEGTL_STRING("const") > {};
struct kw_continue : key< TAO_PEGTL_STRING("continue") > {};
struct kw_dyn : key< TAO_PEGTL_STRING("dyn") > {};
struct kw_else : key< TAO_PEGTL_STRING("else") > {};
struct kw_enum : key< TAO_PEGTL_STRING("enum") > {};
struct kw_extern : key< TAO_PEGTL_STRING("extern") > {};
struct kw_fn : key< TAO_PEGTL_STRING("fn") > {};
struct kw_for : key< TAO_PEGTL_STRING("for") > {};
struct kw_if : key< TAO_PEGTL_STRING("if") > {};
struct kw_impl : key< TAO_PEGTL_STRING("impl") > {};
struct kw_in : key< TAO_PEGTL_STRING("in") > {};
struct kw_let : key< TAO_PEGTL_STRING("let") > {};
struct kw_loop : key< TAO_PEGTL_STRING("loop") > {};
struct kw_match : key< TAO_PEGTL_STRING("match") > {};
struct kw_mod : key< TAO_PEGTL_STRING("mod") > {};
struct kw_move : key< TAO_PEGTL_STRING("move") > {};
struct kw_pub : key< TAO_PEGTL_STRING("pub") > {};
struct kw_ref : key< TAO_PEGTL_STRING("ref") > {};
struct kw_return : key< TAO_PEGTL_STRING("return") > {};
struct kw_self : key< TAO_PEGTL_STRING("self") > {};
struct kw_static : key< TAO_PEGTL_STRING("static") > {};
struct kw_struct : key< TAO_PEGTL_STRING("struct") > {};
struct kw_trait : key< TAO_PEGTL_STRING("trait") > {};
struct kw_type : key< TAO_PEGTL_STRING("type") > {};
struct kw_unsafe : key< TAO_PEGTL_STRING("unsafe") > {};
struct kw_use : key< TAO_PEGTL_STRING("use") > {};
struct kw_where : key< TAO_PEGTL_STRING("where") > {};
struct kw_while : key< TAO_PEGTL_STRING("while") > {};
struct mut_marker : word< TAO_PEGTL_STRING("mut") > {};

// Punctuation
struct comma : seq< one<','>, ws > {};
struct colon : seq< one<':'>, not_at< one<':'> >, ws > {};
struct semi : seq< one<';'>, ws > {};
struct stmt_semi : one<';'> {};
struct rbrace : one<'}'> {};
struct rparen : one<')'> {};
struct rbracket : one<']'> {};
struct fat_arrow : seq< one<'='>, one<'>'>, ws > {};
struct path_sep : two<':'> {};

// Literals
struct str_escape : seq< one<'\\'>, sor< one<'n', 't', 'r', '0', '\\', '"', '\''>,
                                         seq< one<'u'>, one<'{'>, plus< xdigit >, one<'}'> >,
                                         seq< one<'x'>, xdigit, xdigit >,
                                         one<'\n'> > > {};
struct str_body : until< one<'"'>, sor< str_escape, not_one<'"', '\\'> > > {};
struct str_lit : seq< one<'"'>, must< str_body > > {};
struct raw_str_lit : seq< one<'r'>, sor< seq< one<'"'>, until< one<'"'> > >,
                                         seq< one<'#'>, one<'"'>, until< seq< one<'"'>, one<'#'> > > > > > {};
struct char_lit : seq< one<'\''>, sor< str_escape, not_one<'\'', '\\', '\n'> >, one<'\''> > {};
struct dec_digits : seq< digit, star< sor< digit, one<'_'> > > > {};
struct int_suffix : seq< one<'i', 'u'>, sor< TAO_PEGTL_STRING("size"), TAO_PEGTL_STRING("128"), TAO_PEGTL_STRING("16"),
                                              TAO_PEGTL_STRING("32"), TAO_PEGTL_STRING("64"), one<'8'> > > {};
struct int_lit : seq< sor< seq< one<'0'>, one<'x'>, plus< sor< xdigit, one<'_'> > > >,
                           seq< one<'0'>, one<'o'>, plus< sor< range<'0', '7'>, one<'_'> > > >,
                           seq< one<'0'>, one<'b'>, plus< one<'0', '1', '_'> > >,
                           dec_digits >,
                      opt< int_suffix >, not_at< ident_other > > {};
struct exponent : seq< one<'e', 'E'>, opt< one<'+', '-'> >, plus< digit > > {};
struct float_lit : seq< dec_digits,
                        sor< seq< one<'.'>, digit, star< sor< digit, one<'_'> > >, opt< exponent > >,
                             exponent,
                             seq< one<'f'>, sor< TAO_PEGTL_STRING("32"), TAO_PEGTL_STRING("64") > > >,
                        opt< one<'f'>, sor< TAO_PEGTL_STRING("32"), TAO_PEGTL_STRING("64") > >,
                        not_at< ident_other > > {};
struct bool_lit : sor< word< TAO_PEGTL_STRING("true") >, word< TAO_PEGTL_STRING("false") > > {};

// Token trees for skipped bodies; they never produce parse tree nodes.
struct tt_str : seq< one<'"'>, star< sor< seq< one<'\\'>, any >, not_one<'"', '\\'> > >, one<'"'> > {};
struct tt_char : seq< one<'\''>, sor< seq< one<'\\'>, any >, not_one<'\'', '\\'> >, one<'\''> > {};
struct brace_tree;
struct paren_tree;
struct bracket_tree;
struct tt_atom : sor< line_comment, block_comment, tt_str, tt_char, not_one<'{', '}', '(', ')', '[', ']'> > {};
struct brace_tree : seq< one<'{'>, star< sor< brace_tree, paren_tree, bracket_tree, tt_atom > >, one<'}'> > {};
struct paren_tree : seq< one<'('>, star< sor< brace_tree, paren_tree, bracket_tree, tt_atom > >, one<')'> > {};
struct bracket_tree : seq< one<'['>, star< sor< brace_tree, paren_tree, bracket_tree, tt_atom > >, one<']'> > {};
struct angle_tree : seq< one<'<'>, star< sor< angle_tree, not_one<'<', '>'> > >, one<'>'> > {};
struct skip_to_semi : until< one<';'>, sor< raw_str_lit, tt_str, brace_tree, any > > {};

// Types
struct type_expr;
struct lifetime : seq< one<'\''>, ident > {};
struct generic_args : seq< one<'<'>, ws, list< sor< seq< lifetime, ws >, type_expr >, comma >, opt< comma >, one<'>'>, ws > {};
struct ref_type : seq< one<'&'>, ws, opt< lifetime, ws >, opt< mut_marker, ws >, type_expr > {};
struct path_type : seq< ident, star< path_sep, ident >, ws, opt< generic_args > > {};
struct tuple_type : seq< one<'('>, ws, opt< list< type_expr, comma >, opt< comma > >, one<')'>, ws > {};
struct array_type : seq< one<'['>, ws, type_expr, until< one<']'> >, ws > {};
struct impl_type : seq< sor< kw_impl, kw_dyn >, list< type_expr, seq< one<'+'>, ws > > > {};
struct fn_type : seq< key< TAO_PEGTL_STRING("fn") >, paren_tree, ws, opt< one<'-'>, one<'>'>, ws, type_expr > > {};
struct type_expr : sor< ref_type, tuple_type, array_type, impl_type, fn_type, path_type > {};

// Expressions
struct expr;
struct block;
struct pattern;
struct expr_list : seq< expr, star< comma, expr >, opt< comma > > {};
struct call_args : seq< one<'('>, ws, opt< expr_list >, must< rparen >, ws > {};

struct turbofish : seq< path_sep, ws, generic_args > {};
struct path_expr : seq< ident, star< sor< turbofish, seq< path_sep, ident > > > > {};

struct macro_args : sor< seq< one<'('>, ws, opt< expr_list >, one<')'> >,
                         seq< one<'['>, ws, opt< expr_list >, one<']'> >,
                         seq< one<'{'>, ws, opt< expr_list >, one<'}'> > > {};
struct macro_tokens : sor< paren_tree, bracket_tree, brace_tree > {};
struct macro_call : seq< ident, one<'!'>, ws, sor< macro_args, macro_tokens >, ws > {};

struct closure : seq< opt< kw_move >, sor< two<'|'>, seq< one<'|'>, until< one<'|'> > > >, ws,
                      opt< one<'-'>, one<'>'>, ws, type_expr >, expr > {};

struct tuple_tail : seq< comma, opt< expr_list > > {};
struct paren_or_tuple : seq< one<'('>, ws, opt< expr, opt< tuple_tail > >, must< rparen >, ws > {};
struct array_repeat_tail : seq< one<';'>, ws, expr > {};
struct array_lit : seq< one<'['>, ws, opt< expr, sor< array_repeat_tail, seq< star< comma, expr >, opt< comma > > > >,
                        must< rbracket >, ws > {};

struct let_condition : seq< kw_let, pattern, one<'='>, not_at< one<'='> >, ws, expr > {};
struct if_expr : seq< kw_if, sor< let_condition, expr >, block, opt< kw_else, sor< if_expr, block > > > {};
struct while_expr : seq< kw_while, sor< let_condition, expr >, block > {};
struct for_expr : seq< kw_for, pattern, kw_in, expr, block > {};
struct loop_expr : seq< kw_loop, block > {};
struct unsafe_block : seq< kw_unsafe, block > {};
struct async_block : seq< kw_async, opt< kw_move >, block > {};

struct match_guard : seq< kw_if, expr > {};
struct block_like;
struct match_arm : seq< pattern, opt< match_guard >, fat_arrow,
                        sor< seq< block_like, opt< comma > >,
                             seq< expr, sor< comma, at< one<'}'> > > > > > {};
struct match_expr : seq< kw_match, expr, one<'{'>, ws, star< match_arm >, must< rbrace >, ws > {};

struct block_like : sor< if_expr, match_expr, while_expr, for_expr, loop_expr, unsafe_block, async_block, block > {};

template< typename R > struct tok : seq< R, ws > {};
struct primary : sor< tok< float_lit >, tok< int_lit >, tok< raw_str_lit >, tok< str_lit >, tok< char_lit >, tok< bool_lit >,
                      closure, block_like, macro_call, seq< path_expr, ws >, paren_or_tuple, array_lit > {};

struct await_suffix : seq< one<'.'>, ws, word< TAO_PEGTL_STRING("await") >, ws > {};
struct method_suffix : seq< one<'.'>, ws, ident, ws, opt< turbofish >, call_args > {};
struct field_suffix : seq< one<'.'>, ws, sor< ident, plus< digit > >, ws > {};
struct index_suffix : seq< one<'['>, ws, expr, must< rbracket >, ws > {};
struct try_suffix : seq< one<'?'>, ws > {};
struct postfix_expr : seq< primary, star< sor< await_suffix, method_suffix, field_suffix, index_suffix, call_args, try_suffix > > > {};

struct op_neg : one<'-'> {};
struct op_not : one<'!'> {};
struct op_deref : one<'*'> {};
struct op_ref : seq< one<'&'>, opt< ws, mut_marker > > {};
struct unary_expr : sor< seq< sor< op_neg, op_not, op_deref, op_ref >, ws, unary_expr >, postfix_expr > {};
struct cast_expr : seq< unary_expr, star< kw_as, type_expr > > {};

struct op_mul : seq< one<'*'>, not_at< one<'='> > > {};
struct op_div : seq< one<'/'>, not_at< one<'='> > > {};
struct op_rem : seq< one<'%'>, not_at< one<'='> > > {};
struct op_add : seq< one<'+'>, not_at< one<'='> > > {};
struct op_sub : seq< one<'-'>, not_at< one<'=', '>'> > > {};
struct op_shl : seq< two<'<'>, not_at< one<'='> > > {};
struct op_shr : seq< two<'>'>, not_at< one<'='> > > {};
struct op_bitand : seq< one<'&'>, not_at< one<'&', '='> > > {};
struct op_bitxor : seq< one<'^'>, not_at< one<'='> > > {};
struct op_bitor : seq< one<'|'>, not_at< one<'|', '='> > > {};
struct op_eq : two<'='> {};
struct op_ne : seq< one<'!'>, one<'='> > {};
struct op_le : seq< one<'<'>, one<'='> > {};
struct op_ge : seq< one<'>'>, one<'='> > {};
struct op_lt : seq< one<'<'>, not_at< one<'<', '='> > > {};
struct op_gt : seq< one<'>'>, not_at< one<'>', '='> > > {};
struct op_and : two<'&'> {};
struct op_or : two<'|'> {};
struct op_range_incl : seq< two<'.'>, one<'='> > {};
struct op_range : seq< two<'.'>, not_at< one<'.', '='> > > {};

struct mul_expr : seq< cast_expr, star< sor< op_mul, op_div, op_rem >, ws, cast_expr > > {};
struct add_expr : seq< mul_expr, star< sor< op_add, op_sub >, ws, mul_expr > > {};
struct shift_expr : seq< add_expr, star< sor< op_shl, op_shr >, ws, add_expr > > {};
struct bitand_expr : seq< shift_expr, star< op_bitand, ws, shift_expr > > {};
struct bitxor_expr : seq< bitand_expr, star< op_bitxor, ws, bitand_expr > > {};
struct bitor_expr : seq< bitxor_expr, star< op_bitor, ws, bitxor_expr > > {};
struct cmp_expr : seq< bitor_expr, opt< sor< op_eq, op_ne, op_le, op_ge, op_lt, op_gt >, ws, bitor_expr > > {};
struct and_expr : seq< cmp_expr, star< op_and, ws, cmp_expr > > {};
struct or_expr : seq< and_expr, star< op_or, ws, and_expr > > {};
struct range_tail : seq< sor< op_range_incl, op_range >, ws, opt< or_expr > > {};
struct expr : seq< or_expr, opt< range_tail > > {};

// Patterns
struct pat_neg : one<'-'> {};
struct pat_literal : seq< opt< pat_neg, ws >, sor< float_lit, int_lit, str_lit, char_lit, bool_lit >, ws > {};
struct pat_range : seq< pat_literal, sor< op_range_incl, op_range, TAO_PEGTL_STRING("...") >, ws, pat_literal > {};
struct pat_wildcard : seq< one<'_'>, not_at< ident_other >, ws > {};
struct pat_tuple : seq< one<'('>, ws, opt< list< pattern, comma >, opt< comma > >, one<')'>, ws > {};
struct pat_struct_like : seq< path_expr, ws, sor< paren_tree, brace_tree >, ws > {};
struct pat_path : seq< ident, plus< path_sep, ident >, ws > {};
struct pat_binding : seq< opt< kw_ref >, opt< mut_marker, ws >, ident, ws > {};
struct pattern_single : sor< pat_range, pat_literal, pat_wildcard, pat_tuple, pat_struct_like, pat_path, pat_binding > {};
struct pattern : seq< opt< one<'|'>, ws >, pattern_single, star< one<'|'>, not_at< one<'|'> >, ws, pattern_single > > {};

// Statements
struct attribute : seq< one<'#'>, opt< one<'!'> >, ws, bracket_tree, ws > {};
struct item;
struct nested_item;
struct let_stmt : seq< kw_let, opt< mut_marker, ws >, sor< pat_tuple, pat_wildcard, seq< ident, ws > >,
                       opt< colon, type_expr >, opt< one<'='>, not_at< one<'='> >, ws, expr >, must< semi > > {};
struct op_assign : seq< one<'='>, not_at< one<'=', '>'> > > {};
struct op_add_assign : TAO_PEGTL_STRING("+=") {};
struct op_sub_assign : TAO_PEGTL_STRING("-=") {};
struct op_mul_assign : TAO_PEGTL_STRING("*=") {};
struct op_div_assign : TAO_PEGTL_STRING("/=") {};
struct op_rem_assign : TAO_PEGTL_STRING("%=") {};
struct op_and_assign : TAO_PEGTL_STRING("&=") {};
struct op_or_assign : TAO_PEGTL_STRING("|=") {};
struct op_xor_assign : TAO_PEGTL_STRING("^=") {};
struct op_shl_assign : TAO_PEGTL_STRING("<<=") {};
struct op_shr_assign : TAO_PEGTL_STRING(">>=") {};
struct assign_op : sor< op_assign, op_add_assign, op_sub_assign, op_mul_assign, op_div_assign, op_rem_assign,
                        op_and_assign, op_or_assign, op_xor_assign, op_shl_assign, op_shr_assign > {};
struct assign_stmt : seq< unary_expr, assign_op, ws, expr, must< semi > > {};
struct stmt_end : sor< seq< stmt_semi, ws >, at< one<'}'> > > {};
struct return_stmt : seq< kw_return, opt< expr >, stmt_end > {};
struct break_stmt : seq< kw_break, stmt_end > {};
struct continue_stmt : seq< kw_continue, stmt_end > {};
struct block_like_stmt : seq< block_like, opt< stmt_semi, ws > > {};
struct expr_stmt : seq< expr, stmt_end > {};
struct stmt : sor< semi, seq< star< attribute >, sor< nested_item, let_stmt, return_stmt, break_stmt, continue_stmt,
                                                    block_like_stmt, assign_stmt, expr_stmt > > > {};
struct block : seq< one<'{'>, ws, star< stmt >, must< rbrace >, ws > {};

// Items
struct vis : seq< kw_pub, opt< paren_tree, ws > > {};
struct use_decl : seq< opt< vis >, kw_use, skip_to_semi, ws > {};
struct qual_const : kw_const {};
struct qual_async : kw_async {};
struct qual_unsafe : kw_unsafe {};
struct qual_extern : seq< kw_extern, opt< str_lit, ws > > {};
struct generic_params : seq< angle_tree, ws > {};
struct self_param : seq< opt< one<'&'>, ws, opt< lifetime, ws > >, opt< mut_marker, ws >, kw_self, opt< colon, type_expr > > {};
struct param : sor< self_param, seq< opt< mut_marker, ws >, sor< pat_tuple, pat_wildcard, seq< ident, ws > >, colon, type_expr > > {};
struct param_list : seq< one<'('>, ws, opt< param, star< comma, param >, opt< comma > >, must< rparen >, ws > {};
struct ret_type : seq< one<'-'>, one<'>'>, ws, type_expr > {};
struct where_clause : seq< kw_where, until< at< one<'{', ';'> > > > {};
struct fn_item : seq< opt< vis >, star< sor< qual_const, qual_async, qual_unsafe, qual_extern > >, kw_fn,
                      must< ident >, ws, opt< generic_params >, must< param_list >, opt< ret_type >, opt< where_clause >,
                      must< block > > {};
struct struct_item : seq< opt< vis >, kw_struct, ident, ws, opt< generic_params >, opt< where_clause >,
                          sor< semi, seq< brace_tree, ws >, seq< paren_tree, ws, opt< where_clause >, semi > > > {};
struct enum_item : seq< opt< vis >, kw_enum, ident, ws, opt< generic_params >, opt< where_clause >, brace_tree, ws > {};
struct trait_item : seq< opt< vis >, opt< kw_unsafe >, kw_trait, ident, ws, until< at< one<'{'> > >, brace_tree, ws > {};
struct impl_block : seq< opt< kw_unsafe >, kw_impl, until< at< one<'{'> > >, brace_tree, ws > {};
struct const_item : seq< opt< vis >, kw_const, sor< ident, one<'_'> >, ws, skip_to_semi, ws > {};
struct static_item : seq< opt< vis >, kw_static, skip_to_semi, ws > {};
struct mod_item : seq< opt< vis >, kw_mod, ident, ws, sor< semi, seq< brace_tree, ws > > > {};
struct type_alias : seq< opt< vis >, kw_type, ident, ws, skip_to_semi, ws > {};
struct macro_rules_item : seq< TAO_PEGTL_STRING("macro_rules"), one<'!'>, ws, ident, ws,
                               sor< seq< brace_tree, ws >, seq< sor< paren_tree, bracket_tree >, ws, semi > > > {};
struct nested_item : sor< use_decl, macro_rules_item, fn_item, struct_item, enum_item, trait_item, impl_block,
                          const_item, static_item, mod_item, type_alias > {};
struct item : seq< star< attribute >, nested_item > {};

struct module : seq< ws, star< item >, must< eof > > {};

} // namespace rustlite::grammar
