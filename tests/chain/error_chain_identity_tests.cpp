/**
 * @file error_chain_identity_tests.cpp
 * @brief Unit tests for ErrorChain::is(), Error::is() and unwrap()
 */
#include <gtest/gtest.h>
#include "errchain/chain/error_chain.hpp"
#include "errchain/chain/error_chain.inline.hpp"
#include <stdexcept>

using namespace errchain;

namespace
{

// Sentinels owned by a module, compared by reference.
struct StoreErrors
{
    ErrorChain base = ErrorChain::make("store");
    ErrorChain not_found = base.wrap_template("key %s not found");
    ErrorChain io = base.wrap("io failure");
};

} // namespace

// ============================================================================
// Ancestor identity
// ============================================================================

TEST(ErrorChainIdentityTests, Is_SelfAndAncestors)
{
    auto base = ErrorChain::make("X");
    auto mid = base.wrap("Y");
    auto leaf = mid.wrap("Z");

    EXPECT_TRUE(leaf.is(leaf));
    EXPECT_TRUE(leaf.is(mid));
    EXPECT_TRUE(leaf.is(base));
    EXPECT_TRUE(mid.is(base));
}

TEST(ErrorChainIdentityTests, Is_NotByText)
{
    auto base = ErrorChain::make("X");
    auto leaf = base.wrap("Y").wrap("Z");
    EXPECT_FALSE(leaf.is(ErrorChain::make("X")));
}

TEST(ErrorChainIdentityTests, Is_NotDescendants)
{
    auto base = ErrorChain::make("X");
    auto mid = base.wrap("Y");
    EXPECT_FALSE(base.is(mid));
}

TEST(ErrorChainIdentityTests, Is_NotSiblings)
{
    auto base = ErrorChain::make("X");
    auto a = base.wrap("A");
    auto b = base.wrap("A");
    EXPECT_FALSE(a.is(b));
    EXPECT_TRUE(a.is(base));
    EXPECT_TRUE(b.is(base));
}

TEST(ErrorChainIdentityTests, Is_TemplateAncestorsKeepIdentity)
{
    StoreErrors errs;
    auto err = errs.not_found.with_args("users/7");
    EXPECT_EQ(err.render(), "store: key users/7 not found");
    EXPECT_TRUE(err.is(errs.not_found));
    EXPECT_TRUE(err.is(errs.base));
    EXPECT_FALSE(err.is(errs.io));
}

TEST(ErrorChainIdentityTests, Is_EmptyTargetNeverMatches)
{
    auto err = ErrorChain::make("X");
    EXPECT_FALSE(err.is(Error{}));
}

// ============================================================================
// Cause identity
// ============================================================================

TEST(ErrorChainIdentityTests, Is_CauseAndCauseAncestors)
{
    auto base = ErrorChain::make("base");
    auto wrap1 = base.wrap("wrap1");
    auto wrap2 = wrap1.wrap("wrap2");
    auto basecause = ErrorChain::make("basecause");
    auto cause = basecause.wrap("cause");
    auto err = wrap2.wrap_cause("error", cause);

    EXPECT_TRUE(err.is(basecause));
    EXPECT_TRUE(err.is(cause));
    EXPECT_TRUE(err.is(base));
    EXPECT_TRUE(err.is(wrap1));
    EXPECT_FALSE(cause.is(base));
}

TEST(ErrorChainIdentityTests, Is_CauseOfAncestor)
{
    auto root_cause = ErrorChain::make("timeout");
    auto mid = ErrorChain::make("rpc").wrap_cause("call failed", root_cause);
    auto leaf = mid.wrap("retry exhausted");
    EXPECT_TRUE(leaf.is(root_cause));
}

TEST(ErrorChainIdentityTests, Is_TransitiveCause)
{
    auto deepest = ErrorChain::make("eof");
    auto cause = ErrorChain::make("decode").wrap_cause("truncated", deepest);
    auto err = ErrorChain::make("load").wrap_cause("bad file", cause);
    EXPECT_TRUE(err.is(deepest));
}

TEST(ErrorChainIdentityTests, Is_NativeCauseByPointer)
{
    auto native = std::make_shared<std::runtime_error>("disk full");
    auto other = std::make_shared<std::runtime_error>("disk full");
    auto err = ErrorChain::make("store").wrap_cause("flush failed", native);
    EXPECT_TRUE(err.is(native));
    EXPECT_FALSE(err.is(other));
}

TEST(ErrorChainIdentityTests, Is_CauseWithArgs)
{
    auto cause = ErrorChain::make("cause");
    auto tmpl = ErrorChain::make("base").wrap_template("op %s");
    auto err = tmpl.wrap_cause_with_args(cause, "read");
    EXPECT_TRUE(err.is(cause));
    EXPECT_TRUE(err.is(tmpl));
    EXPECT_EQ(err.cause(), Error{cause});
}

TEST(ErrorChainIdentityTests, Is_ExtrasCarryNoIdentity)
{
    auto extra = ErrorChain::make("extra");
    auto err = ErrorChain::make("base");
    err.extra(extra);
    EXPECT_FALSE(err.is(extra));
}

// ============================================================================
// Error variant
// ============================================================================

TEST(ErrorChainIdentityTests, Error_EmptyMatchesOnlyEmpty)
{
    Error empty;
    EXPECT_FALSE(empty.has_value());
    EXPECT_TRUE(empty.is(Error{}));
    EXPECT_FALSE(empty.is(ErrorChain::make("X")));
    EXPECT_EQ(empty.message(), "");
}

TEST(ErrorChainIdentityTests, Error_NullNativeIsEmpty)
{
    std::shared_ptr<std::runtime_error> null_native;
    Error err{null_native};
    EXPECT_FALSE(err);
}

TEST(ErrorChainIdentityTests, Error_HoldsChainOrNative)
{
    auto chain = ErrorChain::make("X");
    Error from_chain{chain};
    ASSERT_NE(from_chain.chain(), nullptr);
    EXPECT_EQ(from_chain.native(), nullptr);
    EXPECT_EQ(*from_chain.chain(), chain);

    auto native = std::make_shared<std::logic_error>("bad");
    Error from_native{native};
    EXPECT_EQ(from_native.chain(), nullptr);
    ASSERT_NE(from_native.native(), nullptr);
    EXPECT_EQ(from_native.message(), "bad");
}

TEST(ErrorChainIdentityTests, Error_EqualityIsIdentity)
{
    auto chain = ErrorChain::make("X");
    EXPECT_EQ(Error{chain}, Error{chain});
    EXPECT_NE(Error{chain}, Error{ErrorChain::make("X")});
    EXPECT_NE(Error{chain}, Error{});
    EXPECT_EQ(Error{}, Error{});
}

// ============================================================================
// Unwrap
// ============================================================================

TEST(ErrorChainIdentityTests, Unwrap_ReturnsParent)
{
    auto base = ErrorChain::make("base");
    auto wrap = base.wrap("wrap");
    auto parent = wrap.unwrap();
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(*parent, base);
}

TEST(ErrorChainIdentityTests, Unwrap_RootHasNoParent)
{
    EXPECT_FALSE(ErrorChain::make("base").unwrap().has_value());
}

TEST(ErrorChainIdentityTests, Unwrap_WalksToRoot)
{
    auto base = ErrorChain::make("base");
    auto leaf = base.wrap_template("%s").with_args("a").wrap("b");
    ErrorChain current = leaf;
    int hops = 0;
    while (auto parent = current.unwrap())
    {
        current = *parent;
        ++hops;
    }
    EXPECT_EQ(current, base);
    EXPECT_EQ(hops, 3);
}

// ============================================================================
// Lifetime
// ============================================================================

TEST(ErrorChainIdentityTests, DeepChain_DropsWithoutRecursion)
{
    constexpr int depth = 100000;
    auto chain = ErrorChain::make("root");
    for (int i = 0; i < depth; ++i)
    {
        chain = chain.wrap("x");
    }
    EXPECT_EQ(chain.text(), "x");
    chain = ErrorChain::make("replaced");
    EXPECT_FALSE(chain.unwrap().has_value());
}

TEST(ErrorChainIdentityTests, DeepChain_SharedAncestorsSurviveDrop)
{
    constexpr int depth = 100000;
    auto base = ErrorChain::make("root");
    auto middle = base;
    for (int i = 0; i < depth; ++i)
    {
        middle = middle.wrap("x");
    }
    {
        auto leaf = middle;
        for (int i = 0; i < depth; ++i)
        {
            leaf = leaf.wrap("y");
        }
        EXPECT_TRUE(leaf.is(base));
        EXPECT_TRUE(leaf.is(middle));
    }
    EXPECT_TRUE(middle.is(base));
    ASSERT_TRUE(middle.unwrap().has_value());
    EXPECT_EQ(middle.unwrap()->text(), "x");
}
