#include "daehwa_recognizer.h"

namespace Daehwa {

bool RegexRecognizer::compilePattern(const std::string& pattern, std::regex& out, std::string* error) {
    std::string body = pattern;
    auto flags = std::regex::ECMAScript;
    if (body.compare(0, 4, "(?i)") == 0) {
        body = body.substr(4);
        flags |= std::regex::icase;
    }
    try {
        out = std::regex(body, flags);
    } catch (const std::regex_error& e) {
        if (error) *error = "invalid pattern '" + pattern + "': " + e.what();
        return false;
    }
    return true;
}

bool RegexRecognizer::addIntent(const std::string& intent, const std::string& pattern, std::string* error) {
    std::regex re;
    if (!compilePattern(pattern, re, error)) return false;
    patterns_.emplace_back(intent, std::move(re));
    return true;
}

RecognizerResult RegexRecognizer::recognize(const std::string& utterance,
                                            const std::string& /*locale*/) const {
    RecognizerResult result;
    for (const auto& entry : patterns_) {
        std::smatch match;
        if (std::regex_search(utterance, match, entry.second)) {
            result.intent = entry.first;
            result.score = 1.0;
            result.entities["text"] = match.str(0);
            return result;
        }
    }
    return result;
}

} // namespace Daehwa
