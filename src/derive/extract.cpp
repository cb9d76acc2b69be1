//! # Variant Name Derive - Extraction
//!
//! Turns a parsed item into a `SumType`, rejecting anything that is not an
//! enum with a D001 diagnostic anchored at the item's name.

#include "derive/variant_name.hpp"
#include "log/log.hpp"

namespace vnc::derive {

namespace {

auto describe_target(const parser::Item& item) -> std::string {
    std::string kind(parser::item_kind_name(item.kind));
    if (item.name.empty()) {
        return "found `" + kind + "` item";
    }
    return "`" + item.name + "` is a `" + kind + "` item";
}

auto to_branch(const parser::Variant& variant) -> Branch {
    Branch branch;
    branch.name = variant.name;
    switch (variant.shape) {
    case parser::VariantShape::Unit:
        branch.shape = BranchShape::Empty;
        break;
    case parser::VariantShape::Tuple:
        branch.shape = BranchShape::Positional;
        branch.arity = variant.tuple_arity;
        break;
    case parser::VariantShape::Record:
        branch.shape = BranchShape::Named;
        branch.fields = variant.record_fields;
        break;
    }
    for (const auto& attr : variant.attributes) {
        if (!attr.is_doc && attr.path == "cfg") {
            branch.cfg_predicates.push_back(attr.args);
        }
    }
    return branch;
}

} // namespace

auto extract_sum_type(const parser::Item& item, DirectiveMode mode)
    -> Result<SumType, DeriveError> {
    if (item.kind != parser::ItemKind::Enum) {
        VNC_LOG_DEBUG("derive", "rejecting " << parser::item_kind_name(item.kind) << " `"
                                             << item.name << "`");
        return DeriveError{
            .message = "`" + directive_display(mode) + "` is only applicable to sum types (enums)",
            .span = item.name_span,
            .notes = {describe_target(item)},
            .code = DeriveErrorCodes::INVALID_TARGET,
        };
    }

    SumType sum;
    sum.name = item.name;
    sum.name_span = item.name_span;
    sum.generics = item.generics;
    if (item.where_clause) {
        sum.where_predicates = item.where_clause->predicates;
    }
    sum.branches.reserve(item.variants.size());
    for (const auto& variant : item.variants) {
        sum.branches.push_back(to_branch(variant));
    }

    VNC_LOG_TRACE("derive", "extracted `" << sum.name << "` with " << sum.branches.size()
                                          << " branches");
    return sum;
}

} // namespace vnc::derive
