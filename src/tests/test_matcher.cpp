#include <gtest/gtest.h>
#include "test_helpers.h"
#include "daehwa_matcher.h"
#include "daehwa_generated.h"

using namespace Daehwa;

namespace {

class MatcherTest : public ::testing::Test {
protected:
    Bot bot;
    SimpleEvaluator evaluator;
    Value user = Value::object();
    Value conversation = Value::object();
    Value dialog = Value::object();
    Value turn = Value::object();
    Value step = Value::object();
    Value settings = Value::object();

    Memory memory() {
        return Memory(&user, &conversation, &dialog, &turn, &step, &settings);
    }

    void load(const std::string& rules) {
        std::string source = R"({ "dialogs": [ { "id": "main", "rules": )" + rules + " } ] }";
        ASSERT_TRUE(DaehwaTest::loadBot(bot, source)) << source;
    }

    static DialogEvent intent(const std::string& name) {
        DialogEvent e;
        e.name = Events::RecognizedIntent;
        e.intent = name;
        return e;
    }

    static DialogEvent named(const std::string& name) {
        DialogEvent e;
        e.name = name;
        return e;
    }

    RuleMatch select(const DialogEvent& event, const MatchOptions& options = MatchOptions()) {
        return selectRule(bot.findDialog("main"), event, memory(), evaluator, options);
    }
};

} // namespace

TEST_F(MatcherTest, NoMatchIsNotAnError) {
    load(R"([ { "kind": "intent", "intent": "A" } ])");
    RuleMatch m = select(intent("B"));
    EXPECT_FALSE(m.matched());
    EXPECT_FALSE(m.failed());
}

TEST_F(MatcherTest, TriggerKinds) {
    load(R"([
        { "kind": "intent", "intent": "A" },
        { "kind": "unknownIntent" },
        { "kind": "event", "events": ["CustomEvent"] }
    ])");
    EXPECT_EQ(select(intent("A")).index, 0);
    EXPECT_EQ(select(named(Events::UnknownIntent)).index, 1);
    EXPECT_EQ(select(named("CustomEvent")).index, 2);
    // 인텐트 이름은 recognizedIntent 이벤트에서만 비교
    EXPECT_FALSE(select(named("A")).matched());
}

TEST_F(MatcherTest, PriorityBeatsSpecificity) {
    load(R"([
        { "kind": "intent", "intent": "A", "condition": "true" },
        { "kind": "intent", "intent": "A", "priority": 5 }
    ])");
    EXPECT_EQ(select(intent("A")).index, 1);
}

TEST_F(MatcherTest, SpecificityBreaksPriorityTie) {
    load(R"([
        { "kind": "intent", "intent": "A" },
        { "kind": "intent", "intent": "A", "condition": "user.vip == true" }
    ])");
    // 조건 불충족이면 조건 없는 규칙
    EXPECT_EQ(select(intent("A")).index, 0);
    user["vip"] = true;
    EXPECT_EQ(select(intent("A")).index, 1);
}

TEST_F(MatcherTest, FirstRegisteredWinsFullTie) {
    load(R"([
        { "kind": "event", "events": ["E"], "priority": 1 },
        { "kind": "event", "events": ["E"], "priority": 1 },
        { "kind": "event", "events": ["E"], "priority": 1 }
    ])");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(select(named("E")).index, 0);
    }
}

TEST_F(MatcherTest, CatchAllOutrankedByConcreteRule) {
    load(R"([
        { "kind": "unknownIntent", "condition": "true" },
        { "kind": "event", "events": ["unknownIntent"] }
    ])");
    EXPECT_EQ(select(named(Events::UnknownIntent)).index, 1);
}

TEST_F(MatcherTest, ExcludeCatchAllOption) {
    load(R"([ { "kind": "unknownIntent" } ])");
    MatchOptions options;
    options.excludeCatchAll = true;
    EXPECT_TRUE(select(named(Events::UnknownIntent)).matched());
    EXPECT_FALSE(select(named(Events::UnknownIntent), options).matched());
}

TEST_F(MatcherTest, ConditionErrorIsReported) {
    load(R"([ { "kind": "event", "events": ["E"], "condition": "'a' - 1" } ])");
    RuleMatch m = select(named("E"));
    EXPECT_FALSE(m.matched());
    EXPECT_TRUE(m.failed());
    EXPECT_NE(m.error.find("rule condition"), std::string::npos);
}

TEST_F(MatcherTest, SpecificityScores) {
    load(R"([
        { "kind": "unknownIntent" },
        { "kind": "unknownIntent", "condition": "true" },
        { "kind": "intent", "intent": "A" },
        { "kind": "intent", "intent": "A", "condition": "true" }
    ])");
    const auto* rules = bot.findDialog("main")->rules();
    EXPECT_EQ(ruleSpecificity(rules->Get(0)), 0);
    EXPECT_EQ(ruleSpecificity(rules->Get(1)), 1);
    EXPECT_EQ(ruleSpecificity(rules->Get(2)), 2);
    EXPECT_EQ(ruleSpecificity(rules->Get(3)), 3);
    EXPECT_TRUE(isCatchAllRule(rules->Get(0)));
    EXPECT_FALSE(isCatchAllRule(rules->Get(2)));
}
