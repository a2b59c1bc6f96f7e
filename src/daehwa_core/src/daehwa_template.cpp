#include "daehwa_template.h"

namespace Daehwa {

bool TemplateEngine::resolve(const std::string& text, const Memory& memory,
                             std::string& out, std::string& error) const {
    out.clear();
    size_t pos = 0;

    while (pos < text.size()) {
        char c = text[pos];

        if (c == '{') {
            if (pos + 1 < text.size() && text[pos + 1] == '{') {
                out += '{';
                pos += 2;
                continue;
            }
            size_t close = text.find('}', pos + 1);
            if (close == std::string::npos) {
                error = "unterminated '{' in template: " + text;
                return false;
            }
            std::string expr = text.substr(pos + 1, close - pos - 1);

            Value value;
            if (!evaluator_.evaluate(expr, memory, value, error)) return false;
            out += valueToText(value);
            pos = close + 1;
            continue;
        }

        if (c == '}' && pos + 1 < text.size() && text[pos + 1] == '}') {
            out += '}';
            pos += 2;
            continue;
        }

        out += c;
        pos++;
    }
    return true;
}

} // namespace Daehwa
