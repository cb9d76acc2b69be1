//! # Variant Name Derive - Generics
//!
//! Splits a generic header the way an impl block needs it: the parameter
//! list is redeclared after `impl` with its bounds, and the type is named
//! with the bare parameter names.
//!
//! ```text
//! enum E<'a, T: Clone = u8, const N: usize = 4>
//!   impl<'a, T: Clone, const N: usize> E<'a, T, N>
//! ```
//!
//! Defaults are dropped since they are not allowed on impl parameters.

#include "derive/variant_name.hpp"

namespace vnc::derive {

namespace {

auto declare_param(const parser::GenericParam& param) -> std::string {
    switch (param.kind) {
    case parser::GenericParamKind::Const:
        return "const " + param.name + ": " + param.const_type;
    case parser::GenericParamKind::Lifetime:
    case parser::GenericParamKind::Type:
        break;
    }
    if (param.bounds.empty()) {
        return param.name;
    }
    return param.name + ": " + param.bounds;
}

} // namespace

auto preserve_generics(const SumType& sum) -> GenericSignature {
    GenericSignature sig;
    sig.where_predicates = sum.where_predicates;
    if (sum.generics.empty()) {
        return sig;
    }

    sig.impl_params = "<";
    sig.type_args = "<";
    for (size_t i = 0; i < sum.generics.size(); ++i) {
        if (i > 0) {
            sig.impl_params += ", ";
            sig.type_args += ", ";
        }
        sig.impl_params += declare_param(sum.generics[i]);
        sig.type_args += sum.generics[i].name;
    }
    sig.impl_params += ">";
    sig.type_args += ">";
    return sig;
}

} // namespace vnc::derive
