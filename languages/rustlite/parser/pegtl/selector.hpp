#pragma once
#include "grammar.hpp"
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace rustlite::grammar {

namespace pt = tao::pegtl::parse_tree;

// Nodes kept in the parse tree. Precedence levels with a single operand fold away.
template< typename Rule >
struct selector : pt::selector< Rule,
    pt::store_content::on<
        ident, int_lit, float_lit, str_lit, raw_str_lit, char_lit, bool_lit, mut_marker, stmt_semi, pat_neg,
        op_neg, op_not, op_deref, op_ref, op_mul, op_div, op_rem, op_add, op_sub, op_shl, op_shr,
        op_bitand, op_bitxor, op_bitor, op_eq, op_ne, op_le, op_ge, op_lt, op_gt, op_and, op_or,
        op_range_incl, op_range,
        op_assign, op_add_assign, op_sub_assign, op_mul_assign, op_div_assign, op_rem_assign,
        op_and_assign, op_or_assign, op_xor_assign, op_shl_assign, op_shr_assign,
        qual_const, qual_async, qual_unsafe, qual_extern >,
    pt::store_content::on<
        generic_args, ref_type, path_type, tuple_type, array_type, impl_type, fn_type,
        call_args, turbofish, path_expr, macro_args, macro_tokens, macro_call, closure,
        tuple_tail, array_repeat_tail, array_lit, let_condition, if_expr, while_expr, for_expr, loop_expr,
        unsafe_block, async_block, match_guard, match_arm, match_expr,
        await_suffix, method_suffix, field_suffix, index_suffix, try_suffix, range_tail,
        pat_literal, pat_range, pat_wildcard, pat_tuple, pat_struct_like, pat_path, pat_binding, pattern,
        let_stmt, assign_stmt, return_stmt, break_stmt, continue_stmt, block_like_stmt, expr_stmt, block,
        use_decl, generic_params, self_param, param, param_list, ret_type, where_clause, fn_item,
        struct_item, enum_item, trait_item, impl_block, const_item, static_item, mod_item, type_alias,
        macro_rules_item >,
    pt::fold_one::on<
        expr, or_expr, and_expr, cmp_expr, bitor_expr, bitxor_expr, bitand_expr, shift_expr, add_expr,
        mul_expr, cast_expr, unary_expr, postfix_expr, paren_or_tuple > > {};

} // namespace rustlite::grammar
