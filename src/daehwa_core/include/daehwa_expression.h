#pragma once
#include "daehwa_memory.h"
#include <cstdint>
#include <string>

namespace Daehwa {

// --- 표현식 평가기 인터페이스 ---
class ExpressionEvaluator {
public:
    virtual ~ExpressionEvaluator() = default;

    // 실패 시 false + error (EvaluationError)
    virtual bool evaluate(const std::string& expression, const Memory& memory,
                          Value& out, std::string& error) const = 0;

    // false / null / 0 / "" / 빈 컨테이너 → false
    static bool isTruthy(const Value& v);
};

// 값 → 표시용 텍스트 (정수값 실수는 소수점 없이, bool은 true/false)
std::string valueToText(const Value& v);

// 실수 → int64. 범위 밖이면 false.
bool doubleToInt64(double d, int64_t& out);

// --- 기본 구현: 토크나이저 + Shunting-yard → RPN 스택 머신 ---
class SimpleEvaluator : public ExpressionEvaluator {
public:
    bool evaluate(const std::string& expression, const Memory& memory,
                  Value& out, std::string& error) const override;
};

} // namespace Daehwa
