#include <gtest/gtest.h>
#include "Unifier.h"
#include "KnowledgeBase.h"

namespace Chainer
{

    class UnifierTest : public ::testing::Test
    {
    protected:
        KnowledgeBase kb{false}; // 这里要构造参数个数不同的同名谓词
        int pred_P;
        int pred_Q;
        Term const_a;
        Term const_b;
        Term var_x;
        Term var_y;
        void SetUp() override
        {
            pred_P = kb.addPredicate("P"); // 二元谓词 P
            pred_Q = kb.addPredicate("Q"); // 一元谓词 Q
            const_a = kb.addConstant("A");
            const_b = kb.addConstant("B");
            var_x = kb.addVariable("x");
            var_y = kb.addVariable("y");
        }
    };

    TEST_F(UnifierTest, BindsVariablesToFactConstants)
    {
        // P(x, A) 与 P(B, A)
        Fact pattern(pred_P, {var_x, const_a});
        Fact fact(pred_P, {const_b, const_a});

        auto sub = Unifier::unify(pattern, fact, Substitution());
        ASSERT_TRUE(sub.has_value());
        EXPECT_EQ(sub->size(), 1u);
        EXPECT_EQ(sub->resolve(var_x), const_b);
        EXPECT_EQ(sub->apply(pattern), fact);
    }

    TEST_F(UnifierTest, DifferentPredicateFails)
    {
        Fact pattern(pred_P, {var_x, var_y});
        Fact fact(pred_Q, {const_a, const_b});
        EXPECT_FALSE(Unifier::unify(pattern, fact, Substitution()).has_value());
    }

    TEST_F(UnifierTest, DifferentArityFails)
    {
        Fact pattern(pred_P, {var_x, var_y});
        Fact fact(pred_P, {const_a});
        EXPECT_FALSE(Unifier::unify(pattern, fact, Substitution()).has_value());
    }

    TEST_F(UnifierTest, ConstantMismatchFails)
    {
        Fact pattern(pred_P, {var_x, const_a});
        Fact fact(pred_P, {const_a, const_b});
        EXPECT_FALSE(Unifier::unify(pattern, fact, Substitution()).has_value());
    }

    TEST_F(UnifierTest, RepeatedVariableMustMatchSameConstant)
    {
        Fact pattern(pred_P, {var_x, var_x});
        EXPECT_FALSE(Unifier::unify(pattern, Fact(pred_P, {const_a, const_b}), Substitution()).has_value());

        auto sub = Unifier::unify(pattern, Fact(pred_P, {const_a, const_a}), Substitution());
        ASSERT_TRUE(sub.has_value());
        EXPECT_EQ(sub->size(), 1u);
    }

    TEST_F(UnifierTest, RespectsExistingBindings)
    {
        Substitution existing = Substitution().extend(var_x, const_a);
        Fact pattern(pred_Q, {var_x});

        EXPECT_TRUE(Unifier::unify(pattern, Fact(pred_Q, {const_a}), existing).has_value());
        EXPECT_FALSE(Unifier::unify(pattern, Fact(pred_Q, {const_b}), existing).has_value());
    }

    TEST_F(UnifierTest, ChasesVariableToVariableBindings)
    {
        // x -> y 且 y 未绑定，合一时绑定 y
        Substitution existing = Substitution().extend(var_x, var_y);
        auto sub = Unifier::unify(Fact(pred_Q, {var_x}), Fact(pred_Q, {const_b}), existing);
        ASSERT_TRUE(sub.has_value());
        EXPECT_EQ(sub->resolve(var_y), const_b);
        EXPECT_EQ(sub->resolve(var_x), const_b);
    }

    TEST_F(UnifierTest, DoesNotModifyInputSubstitution)
    {
        Substitution existing;
        auto sub = Unifier::unify(Fact(pred_P, {var_x, var_y}), Fact(pred_P, {const_a, const_b}), existing);
        ASSERT_TRUE(sub.has_value());
        EXPECT_TRUE(existing.empty());
        EXPECT_EQ(sub->size(), 2u);
    }

    TEST_F(UnifierTest, GroundPatternMatchesOnlyItself)
    {
        Fact ground(pred_P, {const_a, const_b});
        auto sub = Unifier::unify(ground, ground, Substitution());
        ASSERT_TRUE(sub.has_value());
        EXPECT_TRUE(sub->empty());
    }

    TEST_F(UnifierTest, SecondArgumentMustBeGround)
    {
        EXPECT_THROW(Unifier::unify(Fact(pred_Q, {var_x}), Fact(pred_Q, {var_y}), Substitution()),
                     std::invalid_argument);
    }

} // namespace Chainer
