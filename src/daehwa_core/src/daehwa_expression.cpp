#include "daehwa_expression.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <limits>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace Daehwa {

// --- 진리값 / 텍스트 변환 ---
bool ExpressionEvaluator::isTruthy(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:            return false;
        case Value::value_t::boolean:         return v.get<bool>();
        case Value::value_t::number_integer:  return v.get<int64_t>() != 0;
        case Value::value_t::number_unsigned: return v.get<uint64_t>() != 0;
        case Value::value_t::number_float:    return v.get<double>() != 0.0;
        case Value::value_t::string:          return !v.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object:          return !v.empty();
        default:                              return true;
    }
}

bool doubleToInt64(double d, int64_t& out) {
    // [-2^63, 2^63) 밖이거나 NaN/inf 면 변환 불가
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
    out = static_cast<int64_t>(d);
    return true;
}

std::string valueToText(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return "";
        case Value::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case Value::value_t::string:
            return v.get<std::string>();
        case Value::value_t::number_integer:
            return std::to_string(v.get<int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(v.get<uint64_t>());
        case Value::value_t::number_float: {
            double d = v.get<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
                return std::to_string(static_cast<int64_t>(d));
            }
            return v.dump();
        }
        case Value::value_t::array: {
            std::string result;
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += valueToText(v[i]);
            }
            return result;
        }
        default:
            return v.dump();
    }
}

// --- 토큰 ---
namespace {

enum class TokType { LITERAL, PATH, FUNC, OP, LPAREN, RPAREN, COMMA };

enum class Op {
    Add, Sub, Mul, Div, Mod,
    Negate, Not,
    Eq, Ne, Lt, Gt, Le, Ge,
    And, Or
};

struct Token {
    TokType type = TokType::LITERAL;
    Value literal;
    std::string text;   // PATH: 경로, FUNC: 함수 이름
    Op op = Op::Add;
    int argc = 0;       // FUNC 인자 수
};

int precedence(Op op) {
    switch (op) {
        case Op::Or:  return 1;
        case Op::And: return 2;
        case Op::Eq: case Op::Ne: return 3;
        case Op::Lt: case Op::Gt: case Op::Le: case Op::Ge: return 4;
        case Op::Add: case Op::Sub: return 5;
        case Op::Mul: case Op::Div: case Op::Mod: return 6;
        case Op::Negate: case Op::Not: return 7;
    }
    return 0;
}

bool isUnary(Op op) { return op == Op::Negate || op == Op::Not; }

bool isNumber(const Value& v) { return v.is_number(); }
// int64 범위를 넘는 unsigned 값은 실수로 취급
bool isInteger(const Value& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return v.is_number_integer();
}

// --- 토크나이저 ---
bool tokenize(const std::string& text, std::vector<Token>& tokens, std::string& error) {
    size_t pos = 0;
    bool expectOperand = true;

    auto isIdentStart = [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '@';
    };
    auto isIdentChar = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '@';
    };

    while (pos < text.size()) {
        char c = text[pos];
        if (std::isspace(static_cast<unsigned char>(c))) { pos++; continue; }

        if (c == '(') {
            if (!expectOperand) { error = "unexpected '('"; return false; }
            Token t; t.type = TokType::LPAREN;
            tokens.push_back(t);
            pos++;
            continue;
        }
        if (c == ')') {
            // 인자 없는 호출 "f()" 허용
            bool emptyCall = !tokens.empty() && tokens.back().type == TokType::LPAREN;
            if (expectOperand && !emptyCall) { error = "unexpected ')'"; return false; }
            Token t; t.type = TokType::RPAREN;
            tokens.push_back(t);
            pos++;
            expectOperand = false;
            continue;
        }
        if (c == ',') {
            if (expectOperand) { error = "unexpected ','"; return false; }
            Token t; t.type = TokType::COMMA;
            tokens.push_back(t);
            pos++;
            expectOperand = true;
            continue;
        }

        // 연산자
        auto two = text.substr(pos, 2);
        Token opTok; opTok.type = TokType::OP;
        size_t opLen = 0;
        if (two == "==") { opTok.op = Op::Eq; opLen = 2; }
        else if (two == "!=") { opTok.op = Op::Ne; opLen = 2; }
        else if (two == "<=") { opTok.op = Op::Le; opLen = 2; }
        else if (two == ">=") { opTok.op = Op::Ge; opLen = 2; }
        else if (two == "&&") { opTok.op = Op::And; opLen = 2; }
        else if (two == "||") { opTok.op = Op::Or; opLen = 2; }
        else if (c == '<') { opTok.op = Op::Lt; opLen = 1; }
        else if (c == '>') { opTok.op = Op::Gt; opLen = 1; }
        else if (c == '+') { opTok.op = Op::Add; opLen = 1; }
        else if (c == '-') { opTok.op = expectOperand ? Op::Negate : Op::Sub; opLen = 1; }
        else if (c == '*') { opTok.op = Op::Mul; opLen = 1; }
        else if (c == '/') { opTok.op = Op::Div; opLen = 1; }
        else if (c == '%') { opTok.op = Op::Mod; opLen = 1; }
        else if (c == '!') { opTok.op = Op::Not; opLen = 1; }

        if (opLen > 0) {
            bool unary = isUnary(opTok.op);
            if (unary != expectOperand) {
                error = "unexpected operator '" + text.substr(pos, opLen) + "'";
                return false;
            }
            tokens.push_back(opTok);
            pos += opLen;
            expectOperand = true;
            continue;
        }

        if (!expectOperand) {
            error = std::string("unexpected '") + c + "' at " + std::to_string(pos);
            return false;
        }

        // 문자열 리터럴
        if (c == '\'' || c == '"') {
            char quote = c;
            pos++;
            std::string str;
            bool closed = false;
            while (pos < text.size()) {
                char ch = text[pos];
                if (ch == '\\' && pos + 1 < text.size()) {
                    char next = text[pos + 1];
                    switch (next) {
                        case 'n': str += '\n'; break;
                        case 't': str += '\t'; break;
                        default: str += next; break;
                    }
                    pos += 2;
                    continue;
                }
                if (ch == quote) { closed = true; pos++; break; }
                str += ch;
                pos++;
            }
            if (!closed) { error = "unterminated string literal"; return false; }
            Token t; t.type = TokType::LITERAL; t.literal = str;
            tokens.push_back(std::move(t));
            expectOperand = false;
            continue;
        }

        // 숫자
        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = pos;
            bool hasDot = false;
            while (pos < text.size()) {
                char ch = text[pos];
                if (ch == '.' && !hasDot && pos + 1 < text.size() &&
                    std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
                    hasDot = true;
                    pos++;
                } else if (std::isdigit(static_cast<unsigned char>(ch))) {
                    pos++;
                } else {
                    break;
                }
            }
            std::string numStr = text.substr(start, pos - start);
            Token t; t.type = TokType::LITERAL;
            if (hasDot) {
                t.literal = std::strtod(numStr.c_str(), nullptr);
            } else {
                errno = 0;
                long long value = std::strtoll(numStr.c_str(), nullptr, 10);
                if (errno == ERANGE) {
                    error = "integer literal out of range: " + numStr;
                    return false;
                }
                t.literal = static_cast<int64_t>(value);
            }
            tokens.push_back(std::move(t));
            expectOperand = false;
            continue;
        }

        // 식별자: 키워드 / 함수 / 메모리 경로
        if (isIdentStart(c)) {
            size_t start = pos;
            while (pos < text.size() && isIdentChar(text[pos])) pos++;
            std::string word = text.substr(start, pos - start);

            size_t look = pos;
            while (look < text.size() && std::isspace(static_cast<unsigned char>(text[look]))) look++;

            Token t;
            if (word == "true" || word == "false") {
                t.type = TokType::LITERAL;
                t.literal = (word == "true");
            } else if (word == "null") {
                t.type = TokType::LITERAL;
                t.literal = nullptr;
            } else if (look < text.size() && text[look] == '(') {
                t.type = TokType::FUNC;
                t.text = word;
                pos = look;
                tokens.push_back(std::move(t));
                // FUNC 다음은 '(' 가 바로 온다
                continue;
            } else {
                // 경로 세그먼트 (.key / [n] / ['k'])
                while (pos < text.size()) {
                    if (text[pos] == '.') {
                        pos++;
                        while (pos < text.size() && isIdentChar(text[pos])) pos++;
                    } else if (text[pos] == '[') {
                        char quote = 0;
                        while (pos < text.size()) {
                            char ch = text[pos];
                            if (quote) {
                                if (ch == quote) quote = 0;
                            } else if (ch == '\'' || ch == '"') {
                                quote = ch;
                            } else if (ch == ']') {
                                break;
                            }
                            pos++;
                        }
                        if (pos < text.size()) pos++; // ']'
                    } else {
                        break;
                    }
                }
                t.type = TokType::PATH;
                t.text = text.substr(start, pos - start);
                ParsedPath parsed;
                std::string pathError;
                if (!Memory::parsePath(t.text, parsed, &pathError)) {
                    error = pathError;
                    return false;
                }
            }
            tokens.push_back(std::move(t));
            expectOperand = false;
            continue;
        }

        error = std::string("unexpected character '") + c + "'";
        return false;
    }

    if (tokens.empty()) { error = "empty expression"; return false; }
    if (expectOperand) { error = "unexpected end of expression"; return false; }
    return true;
}

// --- Shunting-yard: infix → RPN ---
bool toRpn(std::vector<Token>& tokens, std::vector<Token>& output, std::string& error) {
    struct ParenFrame {
        bool isCall = false;
        int commas = 0;
    };

    std::vector<Token> opStack;
    std::vector<ParenFrame> parens;
    TokType prevType = TokType::OP;

    for (auto& tok : tokens) {
        TokType curType = tok.type;
        switch (tok.type) {
            case TokType::LITERAL:
            case TokType::PATH:
                output.push_back(std::move(tok));
                break;

            case TokType::FUNC:
                opStack.push_back(std::move(tok));
                break;

            case TokType::OP:
                if (!isUnary(tok.op)) {
                    while (!opStack.empty()) {
                        auto& top = opStack.back();
                        if (top.type != TokType::OP) break;
                        if (precedence(top.op) >= precedence(tok.op)) {
                            output.push_back(std::move(top));
                            opStack.pop_back();
                        } else {
                            break;
                        }
                    }
                }
                opStack.push_back(std::move(tok));
                break;

            case TokType::LPAREN: {
                ParenFrame frame;
                frame.isCall = prevType == TokType::FUNC;
                parens.push_back(frame);
                opStack.push_back(std::move(tok));
                break;
            }

            case TokType::COMMA:
                if (parens.empty() || !parens.back().isCall) {
                    error = "',' outside of function call";
                    return false;
                }
                while (!opStack.empty() && opStack.back().type != TokType::LPAREN) {
                    output.push_back(std::move(opStack.back()));
                    opStack.pop_back();
                }
                parens.back().commas++;
                break;

            case TokType::RPAREN: {
                while (!opStack.empty() && opStack.back().type != TokType::LPAREN) {
                    output.push_back(std::move(opStack.back()));
                    opStack.pop_back();
                }
                if (opStack.empty() || parens.empty()) {
                    error = "unbalanced ')'";
                    return false;
                }
                opStack.pop_back(); // LPAREN 제거
                ParenFrame frame = parens.back();
                parens.pop_back();
                if (frame.isCall) {
                    Token fn = std::move(opStack.back());
                    opStack.pop_back();
                    fn.argc = (prevType == TokType::LPAREN) ? 0 : frame.commas + 1;
                    output.push_back(std::move(fn));
                } else if (prevType == TokType::LPAREN) {
                    error = "empty parentheses";
                    return false;
                }
                break;
            }
        }
        prevType = curType;
    }

    while (!opStack.empty()) {
        if (opStack.back().type == TokType::LPAREN || opStack.back().type == TokType::FUNC) {
            error = "unbalanced '('";
            return false;
        }
        output.push_back(std::move(opStack.back()));
        opStack.pop_back();
    }
    return true;
}

// --- 연산 ---
const char* typeName(const Value& v) {
    return v.type_name();
}

bool applyArithmetic(const Value& lhs, Op op, const Value& rhs, Value& out, std::string& error) {
    // 문자열 결합
    if (op == Op::Add && (lhs.is_string() || rhs.is_string())) {
        out = valueToText(lhs) + valueToText(rhs);
        return true;
    }
    if (!isNumber(lhs) || !isNumber(rhs)) {
        error = std::string("cannot apply arithmetic to ") + typeName(lhs) + " and " + typeName(rhs);
        return false;
    }

    if (isInteger(lhs) && isInteger(rhs)) {
        int64_t a = lhs.get<int64_t>();
        int64_t b = rhs.get<int64_t>();
        int64_t r = 0;
        switch (op) {
            case Op::Add:
                if (__builtin_add_overflow(a, b, &r)) { error = "integer overflow"; return false; }
                out = r;
                return true;
            case Op::Sub:
                if (__builtin_sub_overflow(a, b, &r)) { error = "integer overflow"; return false; }
                out = r;
                return true;
            case Op::Mul:
                if (__builtin_mul_overflow(a, b, &r)) { error = "integer overflow"; return false; }
                out = r;
                return true;
            case Op::Div:
                if (b == 0) { error = "division by zero"; return false; }
                if (b == -1 && a == std::numeric_limits<int64_t>::min()) {
                    error = "integer overflow";
                    return false;
                }
                out = a / b;
                return true;
            case Op::Mod:
                if (b == 0) { error = "division by zero"; return false; }
                // x % -1 == 0 (INT64_MIN % -1 은 하드웨어 예외)
                out = (b == -1) ? int64_t(0) : a % b;
                return true;
            default: break;
        }
    } else {
        double a = lhs.get<double>();
        double b = rhs.get<double>();
        switch (op) {
            case Op::Add: out = a + b; return true;
            case Op::Sub: out = a - b; return true;
            case Op::Mul: out = a * b; return true;
            case Op::Div:
                if (b == 0.0) { error = "division by zero"; return false; }
                out = a / b;
                return true;
            case Op::Mod:
                if (b == 0.0) { error = "division by zero"; return false; }
                out = std::fmod(a, b);
                return true;
            default: break;
        }
    }
    error = "invalid arithmetic operator";
    return false;
}

bool applyComparison(const Value& lhs, Op op, const Value& rhs, Value& out, std::string& error) {
    if (op == Op::Eq) { out = (lhs == rhs); return true; }
    if (op == Op::Ne) { out = (lhs != rhs); return true; }

    // 없는 값과의 대소 비교는 false
    if (lhs.is_null() || rhs.is_null()) {
        out = false;
        return true;
    }

    int cmp = 0;
    if (isNumber(lhs) && isNumber(rhs)) {
        double a = lhs.get<double>();
        double b = rhs.get<double>();
        cmp = (a < b) ? -1 : (a > b ? 1 : 0);
    } else if (lhs.is_string() && rhs.is_string()) {
        cmp = lhs.get_ref<const std::string&>().compare(rhs.get_ref<const std::string&>());
    } else {
        error = std::string("cannot compare ") + typeName(lhs) + " with " + typeName(rhs);
        return false;
    }

    switch (op) {
        case Op::Lt: out = cmp < 0; return true;
        case Op::Gt: out = cmp > 0; return true;
        case Op::Le: out = cmp <= 0; return true;
        case Op::Ge: out = cmp >= 0; return true;
        default: break;
    }
    error = "invalid comparison operator";
    return false;
}

// --- 내장 함수 ---
bool callFunction(const std::string& name, const std::vector<Value>& args,
                  Value& out, std::string& error) {
    auto expectArgs = [&](size_t n) {
        if (args.size() != n) {
            error = name + "() expects " + std::to_string(n) + " argument(s), got " +
                    std::to_string(args.size());
            return false;
        }
        return true;
    };

    if (name == "length" || name == "count") {
        if (!expectArgs(1)) return false;
        const Value& v = args[0];
        if (v.is_string()) {
            out = static_cast<int64_t>(v.get_ref<const std::string&>().size());
        } else if (v.is_array() || v.is_object()) {
            out = static_cast<int64_t>(v.size());
        } else if (v.is_null()) {
            out = 0;
        } else {
            error = name + "() expects a string or collection, got " + typeName(v);
            return false;
        }
        return true;
    }
    if (name == "exists") {
        if (!expectArgs(1)) return false;
        out = !args[0].is_null();
        return true;
    }
    if (name == "json") {
        if (!expectArgs(1)) return false;
        if (!args[0].is_string()) {
            error = "json() expects a string";
            return false;
        }
        try {
            out = Value::parse(args[0].get<std::string>());
        } catch (const Value::parse_error& e) {
            error = std::string("json(): ") + e.what();
            return false;
        }
        return true;
    }
    if (name == "string") {
        if (!expectArgs(1)) return false;
        out = valueToText(args[0]);
        return true;
    }
    if (name == "int") {
        if (!expectArgs(1)) return false;
        const Value& v = args[0];
        if (isInteger(v)) {
            out = v.get<int64_t>();
        } else if (v.is_number()) {
            int64_t i = 0;
            if (!doubleToInt64(v.get<double>(), i)) {
                error = "int(): " + valueToText(v) + " is out of range";
                return false;
            }
            out = i;
        } else if (v.is_boolean()) {
            out = v.get<bool>() ? 1 : 0;
        } else if (v.is_string()) {
            const std::string& s = v.get_ref<const std::string&>();
            char* end = nullptr;
            errno = 0;
            long long i = std::strtoll(s.c_str(), &end, 10);
            if (s.empty() || end == s.c_str() || *end != '\0') {
                error = "int(): cannot convert '" + s + "'";
                return false;
            }
            if (errno == ERANGE) {
                error = "int(): '" + s + "' is out of range";
                return false;
            }
            out = static_cast<int64_t>(i);
        } else {
            error = std::string("int(): cannot convert ") + typeName(v);
            return false;
        }
        return true;
    }
    if (name == "concat") {
        std::string result;
        for (const auto& a : args) result += valueToText(a);
        out = result;
        return true;
    }

    error = "unknown function '" + name + "'";
    return false;
}

} // namespace

// --- 평가 ---
bool SimpleEvaluator::evaluate(const std::string& expression, const Memory& memory,
                               Value& out, std::string& error) const {
    std::vector<Token> tokens;
    std::vector<Token> rpn;
    std::string detail;

    if (!tokenize(expression, tokens, detail) || !toRpn(tokens, rpn, detail)) {
        error = "expression '" + expression + "': " + detail;
        return false;
    }

    std::vector<Value> stack;
    auto fail = [&](const std::string& msg) {
        error = "expression '" + expression + "': " + msg;
        return false;
    };

    for (const auto& tok : rpn) {
        switch (tok.type) {
            case TokType::LITERAL:
                stack.push_back(tok.literal);
                break;

            case TokType::PATH:
                stack.push_back(memory.get(tok.text));
                break;

            case TokType::FUNC: {
                if (stack.size() < static_cast<size_t>(tok.argc)) return fail("stack underflow");
                std::vector<Value> args(stack.end() - tok.argc, stack.end());
                stack.resize(stack.size() - static_cast<size_t>(tok.argc));
                Value result;
                if (!callFunction(tok.text, args, result, detail)) return fail(detail);
                stack.push_back(std::move(result));
                break;
            }

            case TokType::OP: {
                if (isUnary(tok.op)) {
                    if (stack.empty()) return fail("stack underflow");
                    Value val = std::move(stack.back());
                    stack.pop_back();
                    if (tok.op == Op::Not) {
                        stack.push_back(!isTruthy(val));
                    } else if (isInteger(val)) {
                        int64_t i = val.get<int64_t>();
                        if (i == std::numeric_limits<int64_t>::min()) return fail("integer overflow");
                        stack.push_back(-i);
                    } else if (isNumber(val)) {
                        stack.push_back(-val.get<double>());
                    } else {
                        return fail(std::string("cannot negate ") + typeName(val));
                    }
                    break;
                }

                if (stack.size() < 2) return fail("stack underflow");
                Value rhs = std::move(stack.back()); stack.pop_back();
                Value lhs = std::move(stack.back()); stack.pop_back();
                Value result;

                switch (tok.op) {
                    case Op::Add: case Op::Sub: case Op::Mul: case Op::Div: case Op::Mod:
                        if (!applyArithmetic(lhs, tok.op, rhs, result, detail)) return fail(detail);
                        break;
                    case Op::Eq: case Op::Ne: case Op::Lt: case Op::Gt: case Op::Le: case Op::Ge:
                        if (!applyComparison(lhs, tok.op, rhs, result, detail)) return fail(detail);
                        break;
                    case Op::And:
                        result = isTruthy(lhs) && isTruthy(rhs);
                        break;
                    case Op::Or:
                        result = isTruthy(lhs) || isTruthy(rhs);
                        break;
                    default:
                        return fail("invalid operator");
                }
                stack.push_back(std::move(result));
                break;
            }

            default:
                return fail("malformed expression");
        }
    }

    if (stack.size() != 1) return fail("malformed expression");
    out = std::move(stack.back());
    return true;
}

} // namespace Daehwa
