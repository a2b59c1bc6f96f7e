#include <gtest/gtest.h>
#include "test_helpers.h"
#include "daehwa_compiler.h"
#include "daehwa_bot.h"
#include "daehwa_generated.h"
#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace Daehwa;
using namespace ICPDev::Daehwa::Schema;

namespace {

bool hasMessage(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

} // namespace

// --- 기본 파싱 ---

TEST(CompilerTest, MinimalBot) {
    Compiler compiler;
    ASSERT_TRUE(compiler.parseString(R"({
        "dialogs": [
            { "id": "main", "steps": [ { "kind": "sendActivity", "text": "Hi" } ] }
        ]
    })"));
    EXPECT_FALSE(compiler.hasErrors());
    EXPECT_EQ(compiler.getBot().root_dialog, "main");
    ASSERT_EQ(compiler.getBot().dialogs.size(), 1u);
    EXPECT_EQ(compiler.getBot().dialogs[0]->steps_list, 0);
}

TEST(CompilerTest, NestedListsGoToArena) {
    Compiler compiler;
    ASSERT_TRUE(compiler.parseString(R"({
        "root": "main",
        "dialogs": [
            { "id": "main", "steps": [
                { "kind": "ifCondition", "condition": "true",
                  "steps": [ { "kind": "sendActivity", "text": "yes" } ],
                  "elseSteps": [ { "kind": "sendActivity", "text": "no" } ] },
                { "kind": "sendActivity", "text": "after" }
            ] }
        ]
    })"));

    const auto& dialog = *compiler.getBot().dialogs[0];
    ASSERT_EQ(dialog.lists.size(), 3u);
    EXPECT_EQ(dialog.steps_list, 0);
    ASSERT_EQ(dialog.lists[0]->steps.size(), 2u);

    const auto* cond = dialog.lists[0]->steps[0]->data.AsIfCondition();
    ASSERT_NE(cond, nullptr);
    EXPECT_EQ(cond->steps_list, 1);
    EXPECT_EQ(cond->else_list, 2);
    EXPECT_EQ(dialog.lists[1]->steps[0]->data.AsSendActivity()->text, "yes");
    EXPECT_EQ(dialog.lists[2]->steps[0]->data.AsSendActivity()->text, "no");
}

TEST(CompilerTest, RulesAndRecognizer) {
    Compiler compiler;
    ASSERT_TRUE(compiler.parseString(R"({
        "dialogs": [
            { "id": "main",
              "recognizer": { "intents": [
                  { "intent": "JokeIntent", "pattern": "(?i)joke" },
                  { "intent": "HelpIntent", "pattern": "(?i)help" }
              ] },
              "rules": [
                  { "kind": "intent", "intent": "JokeIntent", "priority": 2,
                    "steps": [ { "kind": "sendActivity", "text": "joke" } ] },
                  { "kind": "unknownIntent", "condition": "user.name == null",
                    "steps": [ { "kind": "sendActivity", "text": "?" } ] },
                  { "kind": "event", "events": ["CustomEvent", "Other"],
                    "steps": [ { "kind": "sendActivity", "text": "event" } ] }
              ] }
        ]
    })"));

    const auto& dialog = *compiler.getBot().dialogs[0];
    ASSERT_EQ(dialog.intents.size(), 2u);
    EXPECT_EQ(dialog.intents[0]->intent, "JokeIntent");
    EXPECT_EQ(dialog.intents[1]->intent, "HelpIntent");

    ASSERT_EQ(dialog.rules.size(), 3u);
    EXPECT_EQ(dialog.rules[0]->kind, RuleKind::Intent);
    EXPECT_EQ(dialog.rules[0]->priority, 2);
    EXPECT_EQ(dialog.rules[0]->names[0], "JokeIntent");
    EXPECT_EQ(dialog.rules[1]->kind, RuleKind::UnknownIntent);
    EXPECT_EQ(dialog.rules[1]->condition, "user.name == null");
    EXPECT_EQ(dialog.rules[2]->kind, RuleKind::Event);
    EXPECT_EQ(dialog.rules[2]->names.size(), 2u);
}

TEST(CompilerTest, NonStringExpressionValues) {
    Compiler compiler;
    ASSERT_TRUE(compiler.parseString(R"({
        "dialogs": [
            { "id": "main", "steps": [
                { "kind": "setProperty", "property": "user.age", "value": 22 },
                { "kind": "setProperty", "property": "dialog.list", "value": [1, "it's"] }
            ] }
        ]
    })"));
    const auto& steps = compiler.getBot().dialogs[0]->lists[0]->steps;
    EXPECT_EQ(steps[0]->data.AsSetProperty()->value, "22");
    EXPECT_EQ(steps[1]->data.AsSetProperty()->value, "json('[1,\"it\\'s\"]')");
}

// --- 에러 수집 ---

TEST(CompilerTest, ReportsConfigurationErrors) {
    Compiler compiler;
    EXPECT_FALSE(compiler.parseString(R"({
        "root": "main",
        "dialogs": [
            { "id": "main", "steps": [
                { "kind": "teleport" },
                { "kind": "sendActivity" },
                { "kind": "beginDialog", "dialog": "nowhere" },
                { "kind": "setProperty", "property": "galaxy.name", "value": "1" },
                { "kind": "foreachPage", "itemsProperty": "user.list", "pageSize": 0 },
                { "kind": "editSteps", "changeType": "shuffle" },
                { "kind": "setProperty", "property": "settings.x", "value": "1" }
            ] },
            { "id": "main", "steps": [ { "kind": "endTurn" } ] },
            { "id": "bad", "recognizer": { "intents": { "Broken": "(unclosed" } },
              "steps": [ { "kind": "endTurn" } ] }
        ]
    })", "test.json"));

    const auto& errors = compiler.getErrors();
    EXPECT_TRUE(hasMessage(errors, "unknown step kind 'teleport'"));
    EXPECT_TRUE(hasMessage(errors, "missing required field 'text'"));
    EXPECT_TRUE(hasMessage(errors, "dialog 'nowhere' does not exist"));
    EXPECT_TRUE(hasMessage(errors, "unknown scope 'galaxy'"));
    EXPECT_TRUE(hasMessage(errors, "pageSize must be a positive integer"));
    EXPECT_TRUE(hasMessage(errors, "unknown edit-steps change 'shuffle'"));
    EXPECT_TRUE(hasMessage(errors, "settings scope is read-only"));
    EXPECT_TRUE(hasMessage(errors, "duplicate dialog id 'main'"));
    EXPECT_TRUE(hasMessage(errors, "invalid recognizer pattern"));

    // 파일명과 JSON 경로 포함
    EXPECT_TRUE(hasMessage(errors, "test.json:dialogs[0].steps[0].kind"));
    EXPECT_TRUE(compiler.compileToBuffer().empty());
}

TEST(CompilerTest, RejectsIntegersWiderThan32Bits) {
    Compiler compiler;
    EXPECT_FALSE(compiler.parseString(R"({
        "dialogs": [ { "id": "main",
            "rules": [ { "kind": "unknownIntent", "priority": 2147483648,
                         "steps": [ { "kind": "endTurn" } ] } ],
            "steps": [
                { "kind": "foreachPage", "itemsProperty": "user.list", "pageSize": 4294967297 },
                { "kind": "numberInput", "property": "user.n", "prompt": "n?",
                  "maxTurnCount": 9999999999 }
            ] } ]
    })", "wide.json"));

    const auto& errors = compiler.getErrors();
    EXPECT_TRUE(hasMessage(errors, "priority must fit in 32 bits"));
    EXPECT_TRUE(hasMessage(errors, "pageSize must fit in 32 bits"));
    EXPECT_TRUE(hasMessage(errors, "maxTurnCount must fit in 32 bits"));

    Compiler ok;
    EXPECT_TRUE(ok.parseString(R"({
        "dialogs": [ { "id": "main",
            "rules": [ { "kind": "unknownIntent", "priority": -2147483648,
                         "steps": [ { "kind": "endTurn" } ] } ],
            "steps": [ { "kind": "foreachPage", "itemsProperty": "user.list", "pageSize": 2147483647 } ]
        } ]
    })"));
    EXPECT_EQ(ok.getBot().dialogs[0]->rules[0]->priority, -2147483648LL);
}

TEST(CompilerTest, MissingRootDialog) {
    Compiler compiler;
    EXPECT_FALSE(compiler.parseString(R"({
        "root": "start",
        "dialogs": [ { "id": "main", "steps": [ { "kind": "endTurn" } ] } ]
    })"));
    EXPECT_TRUE(hasMessage(compiler.getErrors(), "root dialog 'start' does not exist"));
}

TEST(CompilerTest, InvalidJson) {
    Compiler compiler;
    EXPECT_FALSE(compiler.parseString("{ \"dialogs\": [ "));
    ASSERT_EQ(compiler.getErrors().size(), 1u);
    EXPECT_TRUE(hasMessage(compiler.getErrors(), "invalid JSON"));
}

TEST(CompilerTest, ChoiceInputNeedsChoices) {
    Compiler compiler;
    EXPECT_FALSE(compiler.parseString(R"({
        "dialogs": [ { "id": "main", "steps": [
            { "kind": "choiceInput", "property": "user.color", "prompt": "Pick" }
        ] } ]
    })"));
    EXPECT_TRUE(hasMessage(compiler.getErrors(), "needs 'choices' or 'choicesProperty'"));
}

// --- 경고 ---

TEST(CompilerTest, WarnsAboutEmptyAndUnreachableDialogs) {
    Compiler compiler;
    ASSERT_TRUE(compiler.parseString(R"({
        "root": "main",
        "dialogs": [
            { "id": "main", "steps": [ { "kind": "beginDialog", "dialog": "child" } ] },
            { "id": "child", "steps": [ { "kind": "sendActivity", "text": "child" } ] },
            { "id": "orphan", "steps": [ { "kind": "sendActivity", "text": "orphan" } ] },
            { "id": "empty" }
        ]
    })"));
    const auto& warnings = compiler.getWarnings();
    EXPECT_TRUE(hasMessage(warnings, "dialog 'empty' has neither steps nor rules"));
    EXPECT_TRUE(hasMessage(warnings, "dialog 'orphan' is not reachable"));
    EXPECT_FALSE(hasMessage(warnings, "dialog 'child' is not reachable"));
}

// --- 파일 출력 / Bot 로드 ---

TEST(CompilerTest, CompileToFileAndLoad) {
    std::string inPath = "test_tmp_bot.json";
    std::string outPath = "test_tmp_bot.dhb";
    {
        std::ofstream ofs(inPath);
        ofs << R"({ "version": "2.3", "dialogs": [
            { "id": "main", "steps": [ { "kind": "sendActivity", "text": "Hi" } ] },
            { "id": "other", "rules": [ { "kind": "unknownIntent" } ] } ] })";
    }

    Compiler compiler;
    ASSERT_TRUE(compiler.parse(inPath));
    ASSERT_TRUE(compiler.compile(outPath));

    Bot bot;
    ASSERT_TRUE(bot.loadFromFile(outPath));
    EXPECT_EQ(bot.version(), "2.3");
    EXPECT_EQ(bot.rootDialogId(), "main");
    EXPECT_NE(bot.findDialog("other"), nullptr);
    EXPECT_EQ(bot.findDialog("missing"), nullptr);
    EXPECT_EQ(bot.getDialogIds().size(), 2u);

    std::remove(inPath.c_str());
    std::remove(outPath.c_str());
}

TEST(BotTest, RejectsInvalidBuffer) {
    std::vector<uint8_t> garbage = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    Bot bot;
    EXPECT_FALSE(bot.loadFromBuffer(garbage.data(), garbage.size()));
    EXPECT_FALSE(bot.isLoaded());
}

TEST(BotTest, StepListLookupIsBoundsChecked) {
    Bot bot;
    ASSERT_TRUE(DaehwaTest::loadBot(bot, R"({ "dialogs": [
        { "id": "main", "steps": [ { "kind": "endTurn" } ] } ] })"));
    const auto* dialog = bot.findDialog("main");
    ASSERT_NE(dialog, nullptr);
    EXPECT_NE(getStepList(dialog, 0), nullptr);
    EXPECT_EQ(getStepList(dialog, -1), nullptr);
    EXPECT_EQ(getStepList(dialog, 5), nullptr);
}
