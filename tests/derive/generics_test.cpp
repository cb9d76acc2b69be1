#include "derive/variant_name.hpp"

#include <gtest/gtest.h>

using namespace vnc;
using namespace vnc::derive;

class GenericsTest : public ::testing::Test {
protected:
    static auto lifetime(std::string name, std::string bounds = {}) -> parser::GenericParam {
        parser::GenericParam param{};
        param.kind = parser::GenericParamKind::Lifetime;
        param.name = std::move(name);
        param.bounds = std::move(bounds);
        return param;
    }

    static auto type(std::string name, std::string bounds = {}, std::string default_value = {})
        -> parser::GenericParam {
        parser::GenericParam param{};
        param.kind = parser::GenericParamKind::Type;
        param.name = std::move(name);
        param.bounds = std::move(bounds);
        param.default_value = std::move(default_value);
        return param;
    }

    static auto constant(std::string name, std::string const_type, std::string default_value = {})
        -> parser::GenericParam {
        parser::GenericParam param{};
        param.kind = parser::GenericParamKind::Const;
        param.name = std::move(name);
        param.const_type = std::move(const_type);
        param.default_value = std::move(default_value);
        return param;
    }
};

TEST_F(GenericsTest, NoParameters) {
    SumType sum;
    sum.name = "Plain";
    auto sig = preserve_generics(sum);
    EXPECT_TRUE(sig.impl_params.empty());
    EXPECT_TRUE(sig.type_args.empty());
    EXPECT_TRUE(sig.where_predicates.empty());
}

TEST_F(GenericsTest, LifetimeTypeAndConst) {
    SumType sum;
    sum.name = "Generic";
    sum.generics = {lifetime("'a"), type("T"), constant("N", "usize")};

    auto sig = preserve_generics(sum);
    EXPECT_EQ(sig.impl_params, "<'a, T, const N: usize>");
    EXPECT_EQ(sig.type_args, "<'a, T, N>");
}

TEST_F(GenericsTest, BoundsStayOnImplSide) {
    SumType sum;
    sum.name = "Bounded";
    sum.generics = {lifetime("'a"), lifetime("'b", "'a"), type("T", "Clone + 'b")};

    auto sig = preserve_generics(sum);
    EXPECT_EQ(sig.impl_params, "<'a, 'b: 'a, T: Clone + 'b>");
    EXPECT_EQ(sig.type_args, "<'a, 'b, T>");
}

TEST_F(GenericsTest, DefaultsAreDropped) {
    SumType sum;
    sum.name = "Defaulted";
    sum.generics = {type("T", "Copy", "u8"), constant("N", "usize", "4")};

    auto sig = preserve_generics(sum);
    EXPECT_EQ(sig.impl_params, "<T: Copy, const N: usize>");
    EXPECT_EQ(sig.type_args, "<T, N>");
}

TEST_F(GenericsTest, WherePredicatesPassThrough) {
    SumType sum;
    sum.name = "Constrained";
    sum.generics = {type("T")};
    sum.where_predicates = {"T: Into<Vec<u8>>", "for<'x> &'x T: IntoIterator"};

    auto sig = preserve_generics(sum);
    EXPECT_EQ(sig.where_predicates, sum.where_predicates);
}
