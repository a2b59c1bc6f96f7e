#include "daehwa_compiler.h"
#include "daehwa_memory.h"
#include "daehwa_recognizer.h"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

static const char* BOT_FORMAT_VERSION = "1.0";

// --- 유틸리티 ---
// 32비트 필드에 들어가는 정수인지
static bool fitsInt32(const json& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
    }
    if (!v.is_number_integer()) return false;
    int64_t i = v.get<int64_t>();
    return i >= std::numeric_limits<int32_t>::min() && i <= std::numeric_limits<int32_t>::max();
}

void Compiler::reset() {
    bot_ = BotT();
    error_.clear();
    errors_.clear();
    warnings_.clear();
    dialogRefs_.clear();
    currentDialogId_.clear();
}

void Compiler::addError(const std::string& path, const std::string& msg) {
    std::string formatted = filename_ + ":" + path + ": " + msg;
    errors_.push_back(formatted);
    if (error_.empty()) {
        error_ = formatted;
    }
}

void Compiler::addWarning(const std::string& path, const std::string& msg) {
    warnings_.push_back(filename_ + ":" + path + ": " + msg);
}

bool Compiler::requireString(const json& j, const char* key, const std::string& path, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        addError(path, std::string("missing required field '") + key + "'");
        return false;
    }
    if (!it->is_string()) {
        addError(path + "." + key, "expected a string");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

std::string Compiler::optionalString(const json& j, const char* key, const std::string& path) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (!it->is_string()) {
        addError(path + "." + key, "expected a string");
        return "";
    }
    return it->get<std::string>();
}

// 표현식 필드: 문자열은 그대로, 스칼라 리터럴은 텍스트로, 배열/객체는 json('...') 호출로
std::string Compiler::expressionField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_array() || it->is_object()) {
        std::string text = it->dump();
        std::string escaped;
        for (char c : text) {
            if (c == '\\' || c == '\'') escaped += '\\';
            escaped += c;
        }
        return "json('" + escaped + "')";
    }
    return it->dump();
}

bool Compiler::propertyField(const json& j, const char* key, const std::string& path, bool required,
                             std::string& out) {
    out.clear();
    if (required) {
        if (!requireString(j, key, path, out)) return false;
    } else {
        out = optionalString(j, key, path);
        if (out.empty()) return true;
    }

    ParsedPath parsed;
    std::string error;
    if (!Memory::parsePath(out, parsed, &error)) {
        addError(path + "." + key, error);
        return false;
    }
    if (parsed.scope == "settings") {
        addError(path + "." + key, "settings scope is read-only");
        return false;
    }
    return true;
}

// =================================================================
// 파싱
// =================================================================
bool Compiler::parse(const std::string& filepath) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        reset();
        filename_ = filepath;
        error_ = "Failed to open file: " + filepath;
        errors_.push_back(error_);
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return parseString(ss.str(), filepath);
}

bool Compiler::parseString(const std::string& source, const std::string& filename) {
    reset();
    filename_ = filename;

    json root;
    try {
        root = json::parse(source);
    } catch (const json::parse_error& e) {
        addError("$", std::string("invalid JSON: ") + e.what());
        return false;
    }

    if (!parseRoot(root)) return false;

    validateDialogRefs();
    checkReachability();
    return errors_.empty();
}

bool Compiler::parseRoot(const json& root) {
    if (!root.is_object()) {
        addError("$", "bot definition must be a JSON object");
        return false;
    }

    bot_.version = BOT_FORMAT_VERSION;
    std::string version = optionalString(root, "version", "$");
    if (!version.empty()) bot_.version = version;

    auto dialogs = root.find("dialogs");
    if (dialogs == root.end() || !dialogs->is_array() || dialogs->empty()) {
        addError("$", "'dialogs' must be a non-empty array");
        return false;
    }

    for (size_t i = 0; i < dialogs->size(); ++i) {
        parseDialog((*dialogs)[i], "dialogs[" + std::to_string(i) + "]");
    }

    // 루트 다이얼로그: 'root' 가 없으면 첫 번째 다이얼로그
    bot_.root_dialog = optionalString(root, "root", "$");
    if (bot_.root_dialog.empty() && !bot_.dialogs.empty()) {
        bot_.root_dialog = bot_.dialogs[0]->id;
    }
    bool rootFound = false;
    for (const auto& d : bot_.dialogs) {
        if (d->id == bot_.root_dialog) rootFound = true;
    }
    if (!rootFound) {
        addError("$.root", "root dialog '" + bot_.root_dialog + "' does not exist");
    }
    return true;
}

void Compiler::parseDialog(const json& j, const std::string& path) {
    if (!j.is_object()) {
        addError(path, "dialog must be an object");
        return;
    }

    auto dialog = std::make_unique<DialogT>();
    if (!requireString(j, "id", path, dialog->id)) return;
    if (dialog->id.empty()) {
        addError(path + ".id", "dialog id must not be empty");
        return;
    }
    for (const auto& existing : bot_.dialogs) {
        if (existing->id == dialog->id) {
            addError(path + ".id", "duplicate dialog id '" + dialog->id + "'");
            return;
        }
    }
    currentDialogId_ = dialog->id;

    auto autoEnd = j.find("autoEndDialog");
    if (autoEnd != j.end()) {
        if (autoEnd->is_boolean()) {
            dialog->auto_end_dialog = autoEnd->get<bool>();
        } else {
            addError(path + ".autoEndDialog", "expected a boolean");
        }
    }

    auto recognizer = j.find("recognizer");
    if (recognizer != j.end()) {
        parseRecognizer(*dialog, *recognizer, path + ".recognizer");
    }

    auto steps = j.find("steps");
    if (steps != j.end()) {
        dialog->steps_list = parseStepList(*dialog, *steps, path + ".steps");
    }

    auto rules = j.find("rules");
    if (rules != j.end()) {
        if (!rules->is_array()) {
            addError(path + ".rules", "expected an array");
        } else {
            for (size_t i = 0; i < rules->size(); ++i) {
                parseRule(*dialog, (*rules)[i], path + ".rules[" + std::to_string(i) + "]");
            }
        }
    }

    if (dialog->steps_list < 0 && dialog->rules.empty()) {
        addWarning(path, "dialog '" + dialog->id + "' has neither steps nor rules");
    }

    bot_.dialogs.push_back(std::move(dialog));
}

void Compiler::parseRecognizer(DialogT& dialog, const json& j, const std::string& path) {
    auto intents = j.is_object() ? j.find("intents") : j.end();
    if (!j.is_object() || intents == j.end()) {
        addError(path, "recognizer needs an 'intents' list");
        return;
    }

    auto addPattern = [&](const std::string& name, const json& pattern, const std::string& entryPath) {
        if (!pattern.is_string()) {
            addError(entryPath, "pattern must be a string");
            return;
        }
        std::regex compiled;
        std::string error;
        if (!RegexRecognizer::compilePattern(pattern.get<std::string>(), compiled, &error)) {
            addError(entryPath, "invalid recognizer pattern: " + error);
            return;
        }
        auto intent = std::make_unique<IntentPatternT>();
        intent->intent = name;
        intent->pattern = pattern.get<std::string>();
        dialog.intents.push_back(std::move(intent));
    };

    // 배열은 작성 순서 유지, 객체 맵은 키 이름 순
    if (intents->is_array()) {
        for (size_t i = 0; i < intents->size(); ++i) {
            const json& entry = (*intents)[i];
            std::string entryPath = path + ".intents[" + std::to_string(i) + "]";
            if (!entry.is_object() || !entry.contains("intent") || !entry["intent"].is_string() ||
                !entry.contains("pattern")) {
                addError(entryPath, "expected { \"intent\": ..., \"pattern\": ... }");
                continue;
            }
            addPattern(entry["intent"].get<std::string>(), entry["pattern"], entryPath);
        }
    } else if (intents->is_object()) {
        for (auto it = intents->begin(); it != intents->end(); ++it) {
            addPattern(it.key(), it.value(), path + ".intents." + it.key());
        }
    } else {
        addError(path + ".intents", "expected an array or an object");
    }
}

void Compiler::parseRule(DialogT& dialog, const json& j, const std::string& path) {
    if (!j.is_object()) {
        addError(path, "rule must be an object");
        return;
    }

    auto rule = std::make_unique<RuleT>();
    std::string kind;
    if (!requireString(j, "kind", path, kind)) return;

    if (kind == "intent") {
        rule->kind = RuleKind::Intent;
        std::string intent;
        if (!requireString(j, "intent", path, intent)) return;
        rule->names.push_back(intent);
    } else if (kind == "unknownIntent") {
        rule->kind = RuleKind::UnknownIntent;
    } else if (kind == "event") {
        rule->kind = RuleKind::Event;
        auto events = j.find("events");
        auto single = j.find("event");
        if (events != j.end() && events->is_array()) {
            for (size_t i = 0; i < events->size(); ++i) {
                if (!(*events)[i].is_string()) {
                    addError(path + ".events[" + std::to_string(i) + "]", "expected a string");
                    continue;
                }
                rule->names.push_back((*events)[i].get<std::string>());
            }
        } else if (single != j.end() && single->is_string()) {
            rule->names.push_back(single->get<std::string>());
        }
        if (rule->names.empty()) {
            addError(path, "event rule needs 'events' (array) or 'event'");
            return;
        }
    } else {
        addError(path + ".kind", "unknown rule kind '" + kind + "'");
        return;
    }

    rule->condition = expressionField(j, "condition");

    auto priority = j.find("priority");
    if (priority != j.end()) {
        if (!priority->is_number_integer()) {
            addError(path + ".priority", "expected an integer");
        } else if (!fitsInt32(*priority)) {
            addError(path + ".priority", "priority must fit in 32 bits");
        } else {
            rule->priority = priority->get<int32_t>();
        }
    }

    auto steps = j.find("steps");
    if (steps != j.end()) {
        rule->list = parseStepList(dialog, *steps, path + ".steps");
    }
    dialog.rules.push_back(std::move(rule));
}

// =================================================================
// 스텝
// =================================================================
int32_t Compiler::parseStepList(DialogT& dialog, const json& j, const std::string& path) {
    if (!j.is_array()) {
        addError(path, "expected an array of steps");
        return -1;
    }
    if (j.empty()) return -1;

    // 중첩 리스트보다 먼저 인덱스 예약
    int32_t index = static_cast<int32_t>(dialog.lists.size());
    dialog.lists.push_back(std::make_unique<StepListT>());

    std::vector<std::unique_ptr<StepT>> steps;
    for (size_t i = 0; i < j.size(); ++i) {
        auto step = parseStep(dialog, j[i], path + "[" + std::to_string(i) + "]");
        if (step) steps.push_back(std::move(step));
    }
    dialog.lists[static_cast<size_t>(index)]->steps = std::move(steps);
    return index;
}

static bool parseArrayChange(const std::string& text, ArrayChange& out) {
    if (text == "push") { out = ArrayChange::Push; return true; }
    if (text == "pop") { out = ArrayChange::Pop; return true; }
    if (text == "take") { out = ArrayChange::Take; return true; }
    if (text == "remove") { out = ArrayChange::Remove; return true; }
    if (text == "clear") { out = ArrayChange::Clear; return true; }
    return false;
}

static bool parseStepChange(const std::string& text, StepChange& out) {
    if (text == "insertSteps") { out = StepChange::InsertSteps; return true; }
    if (text == "appendSteps") { out = StepChange::AppendSteps; return true; }
    if (text == "endSequence") { out = StepChange::EndSequence; return true; }
    if (text == "replaceSequence") { out = StepChange::ReplaceSequence; return true; }
    return false;
}

std::unique_ptr<StepT> Compiler::parseStep(DialogT& dialog, const json& j, const std::string& path) {
    if (!j.is_object()) {
        addError(path, "step must be an object");
        return nullptr;
    }
    std::string kind;
    if (!requireString(j, "kind", path, kind)) return nullptr;

    auto step = std::make_unique<StepT>();

    if (kind == "sendActivity") {
        SendActivityT s;
        if (!requireString(j, "text", path, s.text)) return nullptr;
        step->data.Set(std::move(s));
    } else if (kind == "traceActivity") {
        TraceActivityT s;
        s.name = optionalString(j, "name", path);
        s.value_type = optionalString(j, "valueType", path);
        s.value = expressionField(j, "value");
        step->data.Set(std::move(s));
    } else if (kind == "setProperty") {
        SetPropertyT s;
        if (!propertyField(j, "property", path, true, s.property)) return nullptr;
        s.value = expressionField(j, "value");
        if (s.value.empty()) {
            addError(path, "missing required field 'value'");
            return nullptr;
        }
        step->data.Set(std::move(s));
    } else if (kind == "initProperty") {
        InitPropertyT s;
        if (!propertyField(j, "property", path, true, s.property)) return nullptr;
        std::string type = optionalString(j, "type", path);
        if (type.empty() || type == "object") {
            s.type = PropertyType::Object;
        } else if (type == "array") {
            s.type = PropertyType::Array;
        } else {
            addError(path + ".type", "unknown property type '" + type + "' (expected object or array)");
            return nullptr;
        }
        step->data.Set(std::move(s));
    } else if (kind == "deleteProperty") {
        DeletePropertyT s;
        if (!propertyField(j, "property", path, true, s.property)) return nullptr;
        step->data.Set(std::move(s));
    } else if (kind == "editArray") {
        EditArrayT s;
        std::string change;
        if (!requireString(j, "changeType", path, change)) return nullptr;
        if (!parseArrayChange(change, s.change)) {
            addError(path + ".changeType", "unknown array change '" + change + "'");
            return nullptr;
        }
        if (!propertyField(j, "itemsProperty", path, true, s.array_property)) return nullptr;
        if (!propertyField(j, "resultProperty", path, false, s.result_property)) return nullptr;
        s.value = expressionField(j, "value");
        if ((s.change == ArrayChange::Push || s.change == ArrayChange::Remove) && s.value.empty()) {
            addError(path, "'" + change + "' needs a 'value'");
            return nullptr;
        }
        step->data.Set(std::move(s));
    } else if (kind == "ifCondition") {
        IfConditionT s;
        s.condition = expressionField(j, "condition");
        if (s.condition.empty()) {
            addError(path, "missing required field 'condition'");
            return nullptr;
        }
        auto steps = j.find("steps");
        if (steps != j.end()) s.steps_list = parseStepList(dialog, *steps, path + ".steps");
        auto elseSteps = j.find("elseSteps");
        if (elseSteps != j.end()) s.else_list = parseStepList(dialog, *elseSteps, path + ".elseSteps");
        step->data.Set(std::move(s));
    } else if (kind == "switchCondition") {
        SwitchConditionT s;
        s.condition = expressionField(j, "condition");
        if (s.condition.empty()) {
            addError(path, "missing required field 'condition'");
            return nullptr;
        }
        auto cases = j.find("cases");
        if (cases != j.end()) {
            if (!cases->is_array()) {
                addError(path + ".cases", "expected an array");
                return nullptr;
            }
            for (size_t i = 0; i < cases->size(); ++i) {
                const json& c = (*cases)[i];
                std::string casePath = path + ".cases[" + std::to_string(i) + "]";
                auto value = c.find("value");
                if (!c.is_object() || value == c.end()) {
                    addError(casePath, "case needs a 'value'");
                    continue;
                }
                auto entry = std::make_unique<CaseT>();
                entry->value = value->is_string() ? value->get<std::string>() : value->dump();
                auto caseSteps = c.find("steps");
                if (caseSteps != c.end()) entry->list = parseStepList(dialog, *caseSteps, casePath + ".steps");
                s.cases.push_back(std::move(entry));
            }
        }
        auto defaultSteps = j.find("default");
        if (defaultSteps != j.end()) s.default_list = parseStepList(dialog, *defaultSteps, path + ".default");
        step->data.Set(std::move(s));
    } else if (kind == "foreach") {
        ForeachT s;
        if (!propertyField(j, "itemsProperty", path, true, s.list_property)) return nullptr;
        if (!propertyField(j, "index", path, false, s.index_property)) return nullptr;
        if (!propertyField(j, "value", path, false, s.value_property)) return nullptr;
        auto steps = j.find("steps");
        if (steps != j.end()) s.body_list = parseStepList(dialog, *steps, path + ".steps");
        step->data.Set(std::move(s));
    } else if (kind == "foreachPage") {
        ForeachPageT s;
        if (!propertyField(j, "itemsProperty", path, true, s.list_property)) return nullptr;
        if (!propertyField(j, "page", path, false, s.value_property)) return nullptr;
        auto pageSize = j.find("pageSize");
        if (pageSize == j.end() || !pageSize->is_number_integer() || pageSize->get<int64_t>() <= 0) {
            addError(path + ".pageSize", "pageSize must be a positive integer");
            return nullptr;
        }
        if (!fitsInt32(*pageSize)) {
            addError(path + ".pageSize", "pageSize must fit in 32 bits");
            return nullptr;
        }
        s.page_size = pageSize->get<int32_t>();
        auto steps = j.find("steps");
        if (steps != j.end()) s.body_list = parseStepList(dialog, *steps, path + ".steps");
        step->data.Set(std::move(s));
    } else if (kind == "beginDialog") {
        BeginDialogT s;
        if (!requireString(j, "dialog", path, s.dialog)) return nullptr;
        s.options = expressionField(j, "options");
        if (!propertyField(j, "resultProperty", path, false, s.result_property)) return nullptr;
        dialogRefs_.push_back({s.dialog, path + ".dialog", currentDialogId_});
        step->data.Set(std::move(s));
    } else if (kind == "replaceDialog") {
        ReplaceDialogT s;
        if (!requireString(j, "dialog", path, s.dialog)) return nullptr;
        s.options = expressionField(j, "options");
        dialogRefs_.push_back({s.dialog, path + ".dialog", currentDialogId_});
        step->data.Set(std::move(s));
    } else if (kind == "endDialog") {
        EndDialogT s;
        s.result = expressionField(j, "value");
        step->data.Set(std::move(s));
    } else if (kind == "repeatDialog") {
        step->data.Set(RepeatDialogT());
    } else if (kind == "endTurn") {
        step->data.Set(EndTurnT());
    } else if (kind == "emitEvent") {
        EmitEventT s;
        if (!requireString(j, "eventName", path, s.event_name)) return nullptr;
        s.value = expressionField(j, "eventValue");
        auto bubble = j.find("bubbleEvent");
        if (bubble != j.end()) {
            if (!bubble->is_boolean()) {
                addError(path + ".bubbleEvent", "expected a boolean");
                return nullptr;
            }
            s.bubble = bubble->get<bool>();
        }
        step->data.Set(std::move(s));
    } else if (kind == "editSteps") {
        EditStepsT s;
        std::string change;
        if (!requireString(j, "changeType", path, change)) return nullptr;
        if (!parseStepChange(change, s.change)) {
            addError(path + ".changeType", "unknown edit-steps change '" + change + "'");
            return nullptr;
        }
        auto steps = j.find("steps");
        if (steps != j.end()) s.list = parseStepList(dialog, *steps, path + ".steps");
        if ((s.change == StepChange::InsertSteps || s.change == StepChange::AppendSteps ||
             s.change == StepChange::ReplaceSequence) && steps == j.end()) {
            addWarning(path, "'" + change + "' without steps");
        }
        step->data.Set(std::move(s));
    } else if (kind == "textInput" || kind == "numberInput" ||
               kind == "confirmInput" || kind == "choiceInput") {
        InputT s;
        if (!parseInput(kind, j, path, s)) return nullptr;
        step->data.Set(std::move(s));
    } else {
        addError(path + ".kind", "unknown step kind '" + kind + "'");
        return nullptr;
    }
    return step;
}

bool Compiler::parseInput(const std::string& kind, const json& j, const std::string& path, InputT& out) {
    if (kind == "textInput") out.kind = InputKind::Text;
    else if (kind == "numberInput") out.kind = InputKind::Number;
    else if (kind == "confirmInput") out.kind = InputKind::Confirm;
    else if (kind == "choiceInput") out.kind = InputKind::Choice;
    else {
        addError(path + ".kind", "unknown input kind '" + kind + "'");
        return false;
    }

    if (!propertyField(j, "property", path, true, out.property)) return false;
    out.prompt = optionalString(j, "prompt", path);
    out.unrecognized_prompt = optionalString(j, "unrecognizedPrompt", path);
    out.invalid_prompt = optionalString(j, "invalidPrompt", path);
    out.default_value = expressionField(j, "defaultValue");

    auto validations = j.find("validations");
    if (validations != j.end()) {
        if (!validations->is_array()) {
            addError(path + ".validations", "expected an array of expressions");
            return false;
        }
        for (size_t i = 0; i < validations->size(); ++i) {
            if (!(*validations)[i].is_string()) {
                addError(path + ".validations[" + std::to_string(i) + "]", "expected a string");
                return false;
            }
            out.validations.push_back((*validations)[i].get<std::string>());
        }
    }

    auto maxTurnCount = j.find("maxTurnCount");
    if (maxTurnCount != j.end()) {
        if (!maxTurnCount->is_number_integer() || maxTurnCount->get<int64_t>() < 0) {
            addError(path + ".maxTurnCount", "expected a non-negative integer");
            return false;
        }
        if (!fitsInt32(*maxTurnCount)) {
            addError(path + ".maxTurnCount", "maxTurnCount must fit in 32 bits");
            return false;
        }
        out.max_turn_count = maxTurnCount->get<int32_t>();
    }

    auto alwaysPrompt = j.find("alwaysPrompt");
    if (alwaysPrompt != j.end() && alwaysPrompt->is_boolean()) {
        out.always_prompt = alwaysPrompt->get<bool>();
    }

    if (out.kind == InputKind::Number) {
        std::string format = optionalString(j, "outputFormat", path);
        if (format == "integer") {
            out.output_integer = true;
        } else if (!format.empty() && format != "float") {
            addError(path + ".outputFormat", "unknown number output format '" + format + "'");
            return false;
        }
    }

    if (out.kind == InputKind::Choice) {
        auto choices = j.find("choices");
        if (choices != j.end()) {
            if (!choices->is_array()) {
                addError(path + ".choices", "expected an array");
                return false;
            }
            for (size_t i = 0; i < choices->size(); ++i) {
                const json& c = (*choices)[i];
                if (c.is_string()) {
                    out.choices.push_back(c.get<std::string>());
                } else if (c.is_object() && c.contains("value") && c["value"].is_string()) {
                    out.choices.push_back(c["value"].get<std::string>());
                } else {
                    addError(path + ".choices[" + std::to_string(i) + "]",
                             "choice must be a string or an object with 'value'");
                    return false;
                }
            }
        }
        if (!propertyField(j, "choicesProperty", path, false, out.choices_property)) return false;
        if (out.choices.empty() && out.choices_property.empty()) {
            addError(path, "choiceInput needs 'choices' or 'choicesProperty'");
            return false;
        }
    }
    return true;
}

// =================================================================
// 검증 패스
// =================================================================
void Compiler::validateDialogRefs() {
    std::unordered_set<std::string> ids;
    for (const auto& d : bot_.dialogs) ids.insert(d->id);

    for (const auto& ref : dialogRefs_) {
        if (ids.find(ref.target) == ids.end()) {
            addError(ref.path, "dialog '" + ref.target + "' does not exist");
        }
    }
}

void Compiler::checkReachability() {
    std::unordered_map<std::string, std::vector<std::string>> edges;
    for (const auto& ref : dialogRefs_) {
        edges[ref.from].push_back(ref.target);
    }

    std::unordered_set<std::string> visited;
    std::vector<std::string> pending{bot_.root_dialog};
    while (!pending.empty()) {
        std::string id = pending.back();
        pending.pop_back();
        if (!visited.insert(id).second) continue;
        auto it = edges.find(id);
        if (it == edges.end()) continue;
        for (const auto& target : it->second) pending.push_back(target);
    }

    for (size_t i = 0; i < bot_.dialogs.size(); ++i) {
        const auto& id = bot_.dialogs[i]->id;
        if (visited.find(id) == visited.end()) {
            addWarning("dialogs[" + std::to_string(i) + "]",
                       "dialog '" + id + "' is not reachable from root '" + bot_.root_dialog + "'");
        }
    }
}

// =================================================================
// 컴파일 (.dhb 출력)
// =================================================================
std::vector<uint8_t> Compiler::compileToBuffer() {
    if (hasErrors()) return {};

    flatbuffers::FlatBufferBuilder builder;
    auto rootOffset = CreateBot(builder, &bot_);
    FinishBotBuffer(builder, rootOffset);
    return std::vector<uint8_t>(builder.GetBufferPointer(),
                                builder.GetBufferPointer() + builder.GetSize());
}

bool Compiler::compile(const std::string& outputPath) {
    if (hasErrors()) {
        if (error_.empty()) error_ = "Cannot compile: parse errors exist";
        return false;
    }

    std::vector<uint8_t> buffer = compileToBuffer();

    std::ofstream ofs(outputPath, std::ios::binary);
    if (!ofs.is_open()) {
        error_ = "Failed to write: " + outputPath;
        errors_.push_back(error_);
        return false;
    }
    ofs.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    ofs.close();

    std::cout << "Compiled: " << outputPath
              << " (" << buffer.size() << " bytes, "
              << bot_.dialogs.size() << " dialogs)" << std::endl;
    return true;
}

} // namespace Daehwa
