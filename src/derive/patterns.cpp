//! # Variant Name Derive - Patterns
//!
//! One wildcard arm per branch. The payload is never bound, so the pattern
//! depends only on the branch shape:
//!
//! ```text
//! A           Self::A
//! B(u8, u8)   Self::B(..)
//! C { x: u8 } Self::C { .. }
//! ```

#include "derive/variant_name.hpp"

namespace vnc::derive {

auto synthesize_pattern(const Branch& branch) -> BranchPattern {
    std::string pattern = "Self::" + branch.name;
    switch (branch.shape) {
    case BranchShape::Empty:
        break;
    case BranchShape::Positional:
        pattern += "(..)";
        break;
    case BranchShape::Named:
        pattern += " { .. }";
        break;
    }

    std::vector<std::string> attributes;
    attributes.reserve(branch.cfg_predicates.size());
    for (const auto& predicate : branch.cfg_predicates) {
        attributes.push_back("#[cfg(" + predicate + ")]");
    }

    // Identifiers cannot contain `"` or `\`, so no escaping is needed
    return BranchPattern{.pattern = std::move(pattern),
                         .literal = "\"" + branch.name + "\"",
                         .attributes = std::move(attributes)};
}

auto synthesize_patterns(const SumType& sum) -> std::vector<BranchPattern> {
    std::vector<BranchPattern> patterns;
    patterns.reserve(sum.branches.size());
    for (const auto& branch : sum.branches) {
        patterns.push_back(synthesize_pattern(branch));
    }
    return patterns;
}

} // namespace vnc::derive
