//! # Variant Name Derive - Emission
//!
//! Prints the impl block through a `SourceWriter`, so indentation follows
//! `FormatOptions` and the indentation of the enum being expanded.

#include "derive/variant_name.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace vnc::derive {

namespace {

void emit_header(format::SourceWriter& out, const SumType& sum, const GenericSignature& sig) {
    std::string head = "impl" + sig.impl_params + " " + sum.name + sig.type_args;
    if (sig.where_predicates.empty()) {
        out.emit_line(head + " {");
        return;
    }

    out.emit_line(head);
    out.emit_line("where");
    out.push_indent();
    for (const auto& predicate : sig.where_predicates) {
        out.emit_line(predicate + ",");
    }
    out.pop_indent();
    out.emit_line("{");
}

void emit_accessor(format::SourceWriter& out, const SumType& sum) {
    if (out.options().doc_comment) {
        out.emit_line("/// Compile-time string with the variant's identifier.");
    }
    out.emit_line("#[inline(always)]");
    out.emit_line(std::string("pub const fn ") + ACCESSOR_NAME + "(&self) -> &'static str {");
    out.push_indent();

    if (sum.branches.empty()) {
        // An enum without variants is uninhabited; the empty match on the
        // place expression is exhaustive and still const.
        out.emit_line("match *self {}");
    } else {
        // When every arm is cfg-gated the enum may compile to no variants;
        // only the place expression keeps the match exhaustive then.
        bool all_gated = std::all_of(sum.branches.begin(), sum.branches.end(),
                                     [](const Branch& b) { return !b.cfg_predicates.empty(); });
        out.emit_line(all_gated ? "match *self {" : "match self {");
        out.push_indent();
        for (const auto& arm : synthesize_patterns(sum)) {
            for (const auto& attr : arm.attributes) {
                out.emit_line(attr);
            }
            out.emit_line(arm.pattern + " => " + arm.literal + ",");
        }
        out.pop_indent();
        out.emit_line("}");
    }

    out.pop_indent();
    out.emit_line("}");
}

} // namespace

auto emit_dispatch(const SumType& sum, const format::FormatOptions& options,
                   const std::string& base_indent) -> std::string {
    format::SourceWriter out(options, base_indent);
    auto sig = preserve_generics(sum);

    emit_header(out, sum, sig);
    out.push_indent();
    emit_accessor(out, sum);
    out.pop_indent();
    out.emit_line("}");

    VNC_LOG_DEBUG("derive", "generated " << ACCESSOR_NAME << " for `" << sum.name << "` ("
                                         << sum.branches.size() << " arms)");
    return out.str();
}

} // namespace vnc::derive
