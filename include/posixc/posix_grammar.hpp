// POSIX sh grammar used to re-parse emitted scripts.
// Covers the shell command language without here-documents or backquotes.
#pragma once
#include <tao/pegtl.hpp>

namespace posixc::posix_grammar {
using namespace tao::pegtl;

struct blank : one< ' ', '\t' > {};
struct line_cont : seq< one< '\\' >, one< '\n' > > {};
struct comment : seq< one< '#' >, star< not_one< '\n' > > > {};
struct sp : star< sor< blank, line_cont > > {};
struct linebreak : star< sor< blank, line_cont, comment, one< '\n' > > > {};

struct delim : sor< one< ' ', '\t', '\n', ';', '&', '|', '(', ')', '<', '>' >, eof > {};
template< typename Str >
struct kw : seq< Str, at< delim > > {};

struct kw_if : kw< TAO_PEGTL_STRING("if") > {};
struct kw_then : kw< TAO_PEGTL_STRING("then") > {};
struct kw_else : kw< TAO_PEGTL_STRING("else") > {};
struct kw_elif : kw< TAO_PEGTL_STRING("elif") > {};
struct kw_fi : kw< TAO_PEGTL_STRING("fi") > {};
struct kw_do : kw< TAO_PEGTL_STRING("do") > {};
struct kw_done : kw< TAO_PEGTL_STRING("done") > {};
struct kw_case : kw< TAO_PEGTL_STRING("case") > {};
struct kw_esac : kw< TAO_PEGTL_STRING("esac") > {};
struct kw_while : kw< TAO_PEGTL_STRING("while") > {};
struct kw_until : kw< TAO_PEGTL_STRING("until") > {};
struct kw_for : kw< TAO_PEGTL_STRING("for") > {};
struct kw_in : kw< TAO_PEGTL_STRING("in") > {};
struct kw_lbrace : kw< one< '{' > > {};
struct kw_rbrace : kw< one< '}' > > {};
struct kw_bang : kw< one< '!' > > {};
struct reserved : sor< kw_if, kw_then, kw_else, kw_elif, kw_fi, kw_do, kw_done, kw_case, kw_esac,
                       kw_while, kw_until, kw_for, kw_in, kw_lbrace, kw_rbrace, kw_bang > {};

// Expansions
struct compound_list;
struct escaped : seq< one< '\\' >, any > {};
struct sq_string : seq< one< '\'' >, until< one< '\'' > > > {};
struct name : seq< ranges< 'a', 'z', 'A', 'Z', '_', '_' >, star< ranges< 'a', 'z', 'A', 'Z', '0', '9', '_', '_' > > > {};
struct dollar;
struct dq_string : seq< one< '"' >, star< sor< escaped, dollar, not_one< '"', '\\', '$', '`' > > >, one< '"' > > {};
struct param_body : plus< sor< escaped, dq_string, dollar, not_one< '}', '"', '$', '\\' > > > {};
struct param_exp : seq< one< '$' >, one< '{' >, param_body, one< '}' > > {};
struct arith_body;
struct arith_group : seq< one< '(' >, arith_body, one< ')' > > {};
struct arith_body : star< sor< arith_group, dollar, not_one< '(', ')', '$' > > > {};
struct arith_exp : seq< one< '$' >, two< '(' >, arith_body, two< ')' > > {};
struct cmd_subst : seq< one< '$' >, one< '(' >, linebreak, opt< compound_list >, linebreak, one< ')' > > {};
struct special_param : seq< one< '$' >, sor< one< '@', '*', '#', '?', '-', '$', '!' >, digit, name > > {};
struct dollar : sor< arith_exp, cmd_subst, param_exp, special_param > {};

// Words
struct word_char : not_one< ' ', '\t', '\n', '|', '&', ';', '<', '>', '(', ')', '$', '`', '\\', '"', '\'' > {};
struct word_part : sor< sq_string, dq_string, dollar, escaped, plus< word_char > > {};
struct word : plus< word_part > {};
struct cmd_word : seq< not_at< reserved >, word > {};

// Redirections
struct redir_op : sor< TAO_PEGTL_STRING(">>"), TAO_PEGTL_STRING(">&"), TAO_PEGTL_STRING("<&"),
                       TAO_PEGTL_STRING(">|"), TAO_PEGTL_STRING("<>"), one< '>' >, one< '<' > > {};
struct io_number : seq< plus< digit >, at< one< '<', '>' > > > {};
struct redirect : seq< opt< io_number >, redir_op, sp, word > {};

// Commands
struct simple_command : seq< sor< redirect, cmd_word >, star< sp, sor< redirect, word > > > {};
struct term_sep : seq< sp, sor< seq< one< ';' >, not_at< one< ';' > > >, seq< one< '&' >, not_at< one< '&' > > >,
                                seq< opt< comment >, one< '\n' > > >, linebreak > {};
struct and_or;
struct compound_list : seq< linebreak, and_or, star< seq< term_sep, and_or > >, opt< term_sep > > {};

struct brace_group : seq< kw_lbrace, compound_list, sp, kw_rbrace > {};
struct subshell : seq< one< '(' >, compound_list, sp, one< ')' > > {};
struct if_clause : seq< kw_if, compound_list, sp, kw_then, compound_list,
                        star< seq< sp, kw_elif, compound_list, sp, kw_then, compound_list > >,
                        opt< seq< sp, kw_else, compound_list > >, sp, kw_fi > {};
struct while_clause : seq< sor< kw_while, kw_until >, compound_list, sp, kw_do, compound_list, sp, kw_done > {};
struct for_clause : seq< kw_for, sp, name,
                         opt< seq< linebreak, kw_in, star< seq< sp, word > >, term_sep > >,
                         linebreak, kw_do, compound_list, sp, kw_done > {};
struct pattern_list : seq< opt< one< '(' > >, sp, word, star< seq< sp, one< '|' >, sp, word > >, sp, one< ')' > > {};
struct case_item : seq< not_at< kw_esac >, pattern_list, sor< compound_list, linebreak >,
                        opt< seq< sp, two< ';' >, linebreak > > > {};
struct case_clause : seq< kw_case, sp, word, linebreak, kw_in, linebreak, star< case_item >, sp, kw_esac > {};
struct compound_command : seq< sor< brace_group, subshell, if_clause, while_clause, for_clause, case_clause >,
                               star< seq< sp, redirect > > > {};
struct function_def : seq< not_at< reserved >, name, sp, one< '(' >, sp, one< ')' >, linebreak, compound_command > {};
struct command : sor< compound_command, function_def, simple_command > {};

struct pipe_op : seq< one< '|' >, not_at< one< '|' > > > {};
struct pipe_sequence : seq< command, star< seq< sp, pipe_op, linebreak, command > > > {};
struct pipeline : seq< opt< seq< kw_bang, sp > >, pipe_sequence > {};
struct and_or_op : sor< two< '&' >, two< '|' > > {};
struct and_or : seq< pipeline, star< seq< sp, and_or_op, linebreak, pipeline > > > {};

struct script : seq< linebreak, opt< compound_list >, linebreak, must< eof > > {};

} // namespace posixc::posix_grammar
