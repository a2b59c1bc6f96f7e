#include <gtest/gtest.h>
#include "daehwa_expression.h"
#include "daehwa_template.h"
#include <cstdint>

using namespace Daehwa;

namespace {

class ExpressionTest : public ::testing::Test {
protected:
    Value user = Value::object();
    Value conversation = Value::object();
    Value dialog = Value::object();
    Value turn = Value::object();
    Value step = Value::object();
    Value settings = Value::object();
    SimpleEvaluator evaluator;

    Memory memory() {
        return Memory(&user, &conversation, &dialog, &turn, &step, &settings);
    }

    Value eval(const std::string& expr) {
        Value out;
        std::string error;
        EXPECT_TRUE(evaluator.evaluate(expr, memory(), out, error)) << expr << ": " << error;
        return out;
    }

    std::string evalError(const std::string& expr) {
        Value out;
        std::string error;
        EXPECT_FALSE(evaluator.evaluate(expr, memory(), out, error)) << expr;
        return error;
    }
};

} // namespace

// --- 리터럴 / 산술 ---

TEST_F(ExpressionTest, Literals) {
    EXPECT_EQ(eval("42"), 42);
    EXPECT_DOUBLE_EQ(eval("1.5").get<double>(), 1.5);
    EXPECT_EQ(eval("'single'"), "single");
    EXPECT_EQ(eval("\"double\""), "double");
    EXPECT_EQ(eval("true"), true);
    EXPECT_TRUE(eval("null").is_null());
}

TEST_F(ExpressionTest, ArithmeticPrecedence) {
    EXPECT_EQ(eval("1 + 2 * 3"), 7);
    EXPECT_EQ(eval("(1 + 2) * 3"), 9);
    EXPECT_EQ(eval("7 / 2"), 3);
    EXPECT_DOUBLE_EQ(eval("7.0 / 2").get<double>(), 3.5);
    EXPECT_EQ(eval("7 % 3"), 1);
    EXPECT_EQ(eval("-3 + 5"), 2);
    EXPECT_EQ(eval("2 - -1"), 3);
}

TEST_F(ExpressionTest, StringConcatenation) {
    user["name"] = "Carlos";
    EXPECT_EQ(eval("'Hello ' + user.name"), "Hello Carlos");
    EXPECT_EQ(eval("'n=' + 3"), "n=3");
}

TEST_F(ExpressionTest, ComparisonAndLogic) {
    user["age"] = 22;
    EXPECT_EQ(eval("user.age == 22"), true);
    EXPECT_EQ(eval("user.age != 22"), false);
    EXPECT_EQ(eval("user.age > 0 && user.age < 150"), true);
    EXPECT_EQ(eval("user.age < 18 || user.age > 21"), true);
    EXPECT_EQ(eval("!(user.age >= 22)"), false);
    EXPECT_EQ(eval("'abc' < 'abd'"), true);
    EXPECT_EQ(eval("user.name == null"), true);
}

TEST_F(ExpressionTest, OrderingAgainstNullIsFalse) {
    EXPECT_EQ(eval("user.missing > 3"), false);
    EXPECT_EQ(eval("user.missing < 3"), false);
}

TEST_F(ExpressionTest, PathsIntoCollections) {
    user["list"] = Value::array({10, 20, 30});
    user["map"] = Value::object();
    user["map"]["a key"] = "v";
    EXPECT_EQ(eval("user.list[1]"), 20);
    EXPECT_EQ(eval("user.map['a key']"), "v");
}

// --- 함수 ---

TEST_F(ExpressionTest, BuiltinFunctions) {
    user["list"] = Value::array({1, 2, 3});
    EXPECT_EQ(eval("length(user.list)"), 3);
    EXPECT_EQ(eval("count('abcd')"), 4);
    EXPECT_EQ(eval("count(user.none)"), 0);
    EXPECT_EQ(eval("exists(user.list)"), true);
    EXPECT_EQ(eval("exists(user.none)"), false);
    EXPECT_EQ(eval("string(12)"), "12");
    EXPECT_EQ(eval("int('15')"), 15);
    EXPECT_EQ(eval("int(15.7)"), 15);
    EXPECT_EQ(eval("concat('a', 1, true)"), "a1true");

    Value parsed = eval("json('[1, 2, {\"k\": \"v\"}]')");
    ASSERT_TRUE(parsed.is_array());
    EXPECT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[2]["k"], "v");
}

// --- 에러 ---

TEST_F(ExpressionTest, EvaluationErrors) {
    EXPECT_FALSE(evalError("'a' - 1").empty());
    EXPECT_FALSE(evalError("'a' < 1").empty());
    EXPECT_FALSE(evalError("user.none + 1").empty());
    EXPECT_NE(evalError("1 / 0").find("division by zero"), std::string::npos);
    EXPECT_NE(evalError("nosuch(1)").find("unknown function"), std::string::npos);
    EXPECT_FALSE(evalError("1 +").empty());
    EXPECT_FALSE(evalError("(1 + 2").empty());
    EXPECT_FALSE(evalError("'unterminated").empty());
    EXPECT_FALSE(evalError("galaxy.name").empty());
    EXPECT_FALSE(evalError("json('{bad')").empty());
    EXPECT_FALSE(evalError("").empty());
}

TEST_F(ExpressionTest, IntegerOverflowIsAnError) {
    auto overflows = [&](const std::string& expr) {
        EXPECT_NE(evalError(expr).find("integer overflow"), std::string::npos) << expr;
    };
    overflows("9223372036854775807 + 1");
    overflows("-9223372036854775807 - 2");
    overflows("4611686018427387904 * 2");
    overflows("(-9223372036854775807 - 1) / -1");
    overflows("-(-9223372036854775807 - 1)");

    EXPECT_EQ(eval("(-9223372036854775807 - 1) % -1"), 0);
    EXPECT_EQ(eval("7 % -1"), 0);
    EXPECT_EQ(eval("9223372036854775806 + 1"), INT64_MAX);
}

TEST_F(ExpressionTest, OutOfRangeConversionsFail) {
    EXPECT_NE(evalError("99999999999999999999").find("out of range"), std::string::npos);
    EXPECT_NE(evalError("int(1000000000000000000000.0)").find("out of range"), std::string::npos);
    EXPECT_NE(evalError("int('99999999999999999999')").find("out of range"), std::string::npos);

    user["huge"] = 1e30;
    EXPECT_FALSE(evalError("int(user.huge)").empty());
    user["big"] = static_cast<uint64_t>(18446744073709551615ull);
    EXPECT_FALSE(evalError("int(user.big)").empty());
    EXPECT_EQ(eval("int(-9223372036854775807 - 1)"), INT64_MIN);
}

TEST_F(ExpressionTest, Truthiness) {
    EXPECT_FALSE(ExpressionEvaluator::isTruthy(Value()));
    EXPECT_FALSE(ExpressionEvaluator::isTruthy(false));
    EXPECT_FALSE(ExpressionEvaluator::isTruthy(0));
    EXPECT_FALSE(ExpressionEvaluator::isTruthy(""));
    EXPECT_FALSE(ExpressionEvaluator::isTruthy(Value::array()));
    EXPECT_TRUE(ExpressionEvaluator::isTruthy(1));
    EXPECT_TRUE(ExpressionEvaluator::isTruthy("x"));
    EXPECT_TRUE(ExpressionEvaluator::isTruthy(Value::array({1})));
}

TEST(ValueTextTest, RendersForDisplay) {
    EXPECT_EQ(valueToText(Value()), "");
    EXPECT_EQ(valueToText(true), "true");
    EXPECT_EQ(valueToText(10.0), "10");
    EXPECT_EQ(valueToText(15), "15");
    EXPECT_EQ(valueToText(Value::array({1, "a"})), "1, a");
}

// --- 템플릿 ---

TEST_F(ExpressionTest, TemplateSubstitution) {
    TemplateEngine engine(evaluator);
    user["name"] = "Carlos";
    std::string out;
    std::string error;
    ASSERT_TRUE(engine.resolve("Hello {user.name}, nice to meet you!", memory(), out, error));
    EXPECT_EQ(out, "Hello Carlos, nice to meet you!");

    ASSERT_TRUE(engine.resolve("{{literal}} {1 + 1}", memory(), out, error));
    EXPECT_EQ(out, "{literal} 2");

    ASSERT_TRUE(engine.resolve("[{user.missing}]", memory(), out, error));
    EXPECT_EQ(out, "[]");
}

TEST_F(ExpressionTest, TemplateErrorsPropagate) {
    TemplateEngine engine(evaluator);
    std::string out;
    std::string error;
    EXPECT_FALSE(engine.resolve("value {1 / 0}", memory(), out, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(engine.resolve("open {user.name", memory(), out, error));
}
