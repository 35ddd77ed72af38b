#include <gtest/gtest.h>
#include "TraceSerializer.h"
#include "ForwardChainer.h"
#include "FactParser.h"

namespace Chainer
{

    class TraceSerializerTest : public ::testing::Test
    {
    protected:
        KnowledgeBase kb;

        void SetUp() override
        {
            FactParser::addFact("American(Robert)", kb);
            FactParser::addFact("Owns(A, T1)", kb);
            FactParser::addFact("Missile(T1)", kb);
            FactParser::addFact("Enemy(A, America)", kb);

            FactParser::addRule({"Missile(x)"}, "Weapon(x)", kb);
            FactParser::addRule({"Enemy(x, America)"}, "Hostile(x)", kb);
            FactParser::addRule({"Missile(x)", "Owns(A, x)"}, "Sells(Robert, x, A)", kb);
            FactParser::addRule({"American(p)", "Weapon(q)", "Sells(p, q, r)", "Hostile(r)"}, "Criminal(p)", kb);
        }
    };

    TEST_F(TraceSerializerTest, SubstitutionUsesNames)
    {
        Substitution sub = Substitution()
                               .extend(kb.addVariable("p"), kb.addConstant("Robert"))
                               .extend(kb.addVariable("q"), kb.addConstant("T1"));
        json expected = {{"p", "Robert"}, {"q", "T1"}};
        EXPECT_EQ(TraceSerializer::serializeSubstitution(sub, kb), expected);
        EXPECT_TRUE(TraceSerializer::serializeSubstitution(Substitution(), kb).is_object());
    }

    TEST_F(TraceSerializerTest, ProvenResult)
    {
        ForwardChainer chainer;
        ChainResult result = chainer.run(kb, FactParser::parseQuery("Criminal(Robert)", kb));

        json data = TraceSerializer::serializeResult(result, kb.getRules(), kb);
        EXPECT_EQ(data["proven"], true);
        EXPECT_EQ(data["state"], chainStateToString(ChainState::QUERY_PROVEN));
        EXPECT_EQ(data["rounds"], 2);
        ASSERT_EQ(data["trace"].size(), 4u);
        EXPECT_EQ(data["facts"].size(), 8u);
        EXPECT_EQ(data["facts"][0], "American(Robert)");
        EXPECT_EQ(data["facts"][7], "Criminal(Robert)");

        const json &last = data["trace"][3];
        EXPECT_EQ(last["round"], 2);
        EXPECT_EQ(last["rule"], 3);
        EXPECT_EQ(last["rule_text"], "American(p) & Weapon(q) & Sells(p, q, r) & Hostile(r) => Criminal(p)");
        EXPECT_EQ(last["derived"], "Criminal(Robert)");
        json sources = {"American(Robert)", "Weapon(T1)", "Sells(Robert, T1, A)", "Hostile(A)"};
        EXPECT_EQ(last["sources"], sources);
        EXPECT_EQ(last["substitution"]["r"], "A");
    }

    TEST_F(TraceSerializerTest, EmptyTraceIsArray)
    {
        ForwardChainer chainer;
        ChainResult result = chainer.run(kb, FactParser::parseQuery("Missile(T1)", kb));

        json data = TraceSerializer::serializeResult(result, kb.getRules(), kb);
        EXPECT_TRUE(data["trace"].is_array());
        EXPECT_TRUE(data["trace"].empty());
        EXPECT_EQ(data["rounds"], 0);
    }

    TEST_F(TraceSerializerTest, OutputParsesBack)
    {
        ForwardChainer chainer;
        ChainResult result = chainer.run(kb, FactParser::parseQuery("Criminal(A)", kb));

        std::string text = TraceSerializer::serializeResult(result, kb.getRules(), kb).dump(2);
        json parsed = json::parse(text);
        EXPECT_EQ(parsed["proven"], false);
        EXPECT_EQ(parsed["state"], chainStateToString(ChainState::CONVERGED));
    }

} // namespace Chainer
