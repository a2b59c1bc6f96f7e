#pragma once
#include "daehwa_expression.h"
#include <string>

namespace Daehwa {

// --- 텍스트 생성 인터페이스 ---
class TemplateResolver {
public:
    virtual ~TemplateResolver() = default;
    virtual bool resolve(const std::string& text, const Memory& memory,
                         std::string& out, std::string& error) const = 0;
};

// {expr} 치환. {{ / }} 는 중괄호 리터럴.
class TemplateEngine : public TemplateResolver {
public:
    explicit TemplateEngine(const ExpressionEvaluator& evaluator) : evaluator_(evaluator) {}

    bool resolve(const std::string& text, const Memory& memory,
                 std::string& out, std::string& error) const override;

private:
    const ExpressionEvaluator& evaluator_;
};

} // namespace Daehwa
