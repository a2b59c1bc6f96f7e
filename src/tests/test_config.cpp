#include <gtest/gtest.h>
#include "daehwa_config.h"
#include "daehwa_executor.h"
#include <cstdio>
#include <fstream>

using namespace Daehwa;

TEST(ConfigTest, Defaults) {
    EngineConfig config = EngineConfig::defaults();
    EXPECT_EQ(config.defaultLocale, "en-us");
    EXPECT_DOUBLE_EQ(config.recognizerThreshold, 0.5);
    EXPECT_EQ(config.maxStepsPerTurn, 1000u);
    EXPECT_TRUE(config.settings.is_object());
    EXPECT_EQ(config.confirmWordsFor("en-us").yesLabel, "Yes");
}

TEST(ConfigTest, NormalizeLocale) {
    EXPECT_EQ(normalizeLocale("en_US"), "en-us");
    EXPECT_EQ(normalizeLocale("PT-br"), "pt-br");
    EXPECT_EQ(normalizeLocale(""), "");
}

TEST(ConfigTest, LocaleFallbackChain) {
    EngineConfig config = EngineConfig::defaults();

    // 정확한 키가 없으면 언어 접두어
    EXPECT_EQ(config.choiceFormatFor("fr-CA").inlineOr, " ou ");
    EXPECT_EQ(config.confirmWordsFor("de_AT").yesLabel, "Ja");

    // 모르는 로케일은 defaultLocale → en
    EXPECT_EQ(config.choiceFormatFor("xx-yy").inlineOr, " or ");

    config.defaultLocale = "de-de";
    EXPECT_EQ(config.choiceFormatFor("xx").inlineOr, " oder ");
}

TEST(ConfigTest, EmptyTablesUseBuiltInFallback) {
    EngineConfig config;
    EXPECT_EQ(config.choiceFormatFor("en").inlineOrMore, ", or ");
    EXPECT_EQ(config.confirmWordsFor("en").yes, std::vector<std::string>{"yes"});
}

TEST(ConfigTest, OverlayFromString) {
    EngineConfig config = EngineConfig::defaults();
    std::string error;
    ASSERT_TRUE(loadConfigString(R"({
        "defaultLocale": "fr_FR",
        "maxStepsPerTurn": 20,
        "choiceFormats": { "en": { "orMore": " or finally ", "includeNumbers": false } },
        "confirmWords": { "ko": { "yes": ["네", "예"], "no": ["아니요"], "yesLabel": "네", "noLabel": "아니요" } },
        "settings": { "botName": "Daehwa" }
    })", config, error)) << error;

    EXPECT_EQ(config.defaultLocale, "fr-fr");
    EXPECT_EQ(config.maxStepsPerTurn, 20u);
    EXPECT_EQ(config.settings["botName"], "Daehwa");

    // 덮어쓰지 않은 필드는 기존 값 유지
    const ChoiceFormat& en = config.choiceFormatFor("en");
    EXPECT_EQ(en.inlineOrMore, " or finally ");
    EXPECT_EQ(en.inlineOr, " or ");
    EXPECT_FALSE(en.includeNumbers);

    EXPECT_EQ(config.confirmWordsFor("ko-KR").noLabel, "아니요");
    EXPECT_EQ(config.confirmWordsFor("ja").yesLabel, "はい");
}

TEST(ConfigTest, InvalidConfigLeavesConfigUntouched) {
    EngineConfig config = EngineConfig::defaults();
    std::string error;

    EXPECT_FALSE(loadConfigString("{ broken", config, error));
    EXPECT_NE(error.find("invalid config"), std::string::npos);

    EXPECT_FALSE(loadConfigString(R"({ "defaultLocale": "de", "maxStepsPerTurn": 0 })", config, error));
    EXPECT_EQ(error, "maxStepsPerTurn must be positive");
    EXPECT_EQ(config.defaultLocale, "en-us");

    EXPECT_FALSE(loadConfigString(R"({ "confirmWords": { "ko": { "yes": ["네"] } } })", config, error));
    EXPECT_FALSE(loadConfigString(R"({ "settings": 3 })", config, error));
    EXPECT_FALSE(loadConfigString(R"({ "maxStepsPerTurn": "many" })", config, error));
    EXPECT_FALSE(loadConfigString("[]", config, error));
    EXPECT_EQ(config.maxStepsPerTurn, 1000u);
}

TEST(ConfigTest, LoadFromFile) {
    const char* path = "test_tmp_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({ "recognizerThreshold": 0.8 })";
    }
    EngineConfig config = EngineConfig::defaults();
    std::string error;
    EXPECT_TRUE(loadConfigFile(path, config, error)) << error;
    EXPECT_DOUBLE_EQ(config.recognizerThreshold, 0.8);
    std::remove(path);

    EXPECT_FALSE(loadConfigFile("does_not_exist.json", config, error));
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST(ConfigTest, FormatChoices) {
    std::vector<std::string> three = {"red", "green", "blue"};
    EXPECT_EQ(StepExecutor::formatChoices(three, ", ", " or ", ", or ", true),
              "(1) red, (2) green, or (3) blue");
    EXPECT_EQ(StepExecutor::formatChoices(three, ", ", " or ", ", or ", false),
              "red, green, or blue");
    EXPECT_EQ(StepExecutor::formatChoices({"Yes", "No"}, ", ", " or ", ", or ", true),
              "(1) Yes or (2) No");
    EXPECT_EQ(StepExecutor::formatChoices({"only"}, ", ", " or ", ", or ", true), "(1) only");
    EXPECT_EQ(StepExecutor::formatChoices({}, ", ", " or ", ", or ", true), "");
}
