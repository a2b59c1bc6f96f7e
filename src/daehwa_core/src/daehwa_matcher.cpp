#include "daehwa_matcher.h"
#include "daehwa_generated.h"

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

Value DialogEvent::toJson() const {
    Value j = Value::object();
    j["name"] = name;
    if (!intent.empty()) j["intent"] = intent;
    j["value"] = value;
    j["bubble"] = bubble;
    return j;
}

static bool namesContain(const Schema::Rule* rule, const std::string& name) {
    if (!rule->names()) return false;
    for (const auto* n : *rule->names()) {
        if (n->str() == name) return true;
    }
    return false;
}

bool ruleAcceptsEvent(const Schema::Rule* rule, const DialogEvent& event) {
    switch (rule->kind()) {
        case RuleKind::Intent:
            return event.name == Events::RecognizedIntent && namesContain(rule, event.intent);
        case RuleKind::UnknownIntent:
            return event.name == Events::UnknownIntent;
        case RuleKind::Event:
            return namesContain(rule, event.name);
    }
    return false;
}

bool isCatchAllRule(const Schema::Rule* rule) {
    return rule->kind() == RuleKind::UnknownIntent;
}

int ruleSpecificity(const Schema::Rule* rule) {
    int score = 0;
    if (!isCatchAllRule(rule) && rule->names() && rule->names()->size() > 0) score += 2;
    if (rule->condition() && rule->condition()->size() > 0) score += 1;
    return score;
}

RuleMatch selectRule(const Schema::Dialog* dialog, const DialogEvent& event,
                     const Memory& memory, const ExpressionEvaluator& evaluator,
                     const MatchOptions& options) {
    RuleMatch best;
    if (!dialog || !dialog->rules()) return best;

    int32_t bestPriority = 0;
    int bestSpecificity = 0;

    for (flatbuffers::uoffset_t i = 0; i < dialog->rules()->size(); ++i) {
        const auto* rule = dialog->rules()->Get(i);
        if (options.excludeCatchAll && isCatchAllRule(rule)) continue;
        if (!ruleAcceptsEvent(rule, event)) continue;

        if (rule->condition() && rule->condition()->size() > 0) {
            Value result;
            std::string error;
            if (!evaluator.evaluate(rule->condition()->str(), memory, result, error)) {
                RuleMatch failed;
                failed.error = "rule condition: " + error;
                return failed;
            }
            if (!ExpressionEvaluator::isTruthy(result)) continue;
        }

        int32_t priority = rule->priority();
        int specificity = ruleSpecificity(rule);

        // 동점이면 먼저 등록된 규칙 유지
        bool better = !best.matched() ||
                      priority > bestPriority ||
                      (priority == bestPriority && specificity > bestSpecificity);
        if (better) {
            best.index = static_cast<int32_t>(i);
            best.list = rule->list();
            bestPriority = priority;
            bestSpecificity = specificity;
        }
    }
    return best;
}

} // namespace Daehwa
