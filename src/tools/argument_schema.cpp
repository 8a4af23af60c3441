#include "tools/argument_schema.hpp"
#include <cmath>

namespace {

ArgumentRule makeRule(const std::string& name, ArgumentType type, const std::string& description) {
    ArgumentRule rule;
    rule.name = name;
    rule.type = type;
    rule.description = description;
    return rule;
}

const char* typeName(ArgumentType type) {
    switch (type) {
        case ArgumentType::String:      return "string";
        case ArgumentType::Number:      return "number";
        case ArgumentType::Boolean:     return "boolean";
        case ArgumentType::StringArray: return "array";
    }
    return "string";
}

bool isIntegral(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (!value.is_number_float()) {
        return false;
    }
    const double number = value.get<double>();
    return std::isfinite(number) && std::floor(number) == number;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

// Appends the violations of one present, non-null value.
void checkValue(const ArgumentRule& rule, const nlohmann::json& value, std::vector<std::string>& out) {
    switch (rule.type) {
        case ArgumentType::String: {
            if (!value.is_string()) {
                out.push_back(rule.name + " must be a string");
                return;
            }
            const auto& text = value.get_ref<const std::string&>();
            if (rule.minLength && text.size() < *rule.minLength) {
                out.push_back(rule.name + " must be at least " + std::to_string(*rule.minLength) + " characters");
            }
            if (rule.maxLength && text.size() > *rule.maxLength) {
                out.push_back(rule.name + " must be at most " + std::to_string(*rule.maxLength) + " characters");
            }
            if (!rule.allowedValues.empty()) {
                bool allowed = false;
                for (const auto& candidate : rule.allowedValues) {
                    allowed = allowed || candidate == text;
                }
                if (!allowed) {
                    out.push_back(rule.name + " must be one of: " + join(rule.allowedValues, ", "));
                }
            }
            break;
        }
        case ArgumentType::Number: {
            if (!isIntegral(value)) {
                out.push_back(rule.name + " must be an integer");
                return;
            }
            const double number = value.get<double>();
            if (rule.minimum && number < static_cast<double>(*rule.minimum)) {
                out.push_back(rule.name + " must be >= " + std::to_string(*rule.minimum));
            }
            if (rule.maximum && number > static_cast<double>(*rule.maximum)) {
                out.push_back(rule.name + " must be <= " + std::to_string(*rule.maximum));
            }
            break;
        }
        case ArgumentType::Boolean:
            if (!value.is_boolean()) {
                out.push_back(rule.name + " must be a boolean");
                return;
            }
            break;
        case ArgumentType::StringArray: {
            if (!value.is_array()) {
                out.push_back(rule.name + " must be an array of strings");
                return;
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    out.push_back(rule.name + " must be an array of strings");
                    return;
                }
            }
            if (rule.minLength && value.size() < *rule.minLength) {
                out.push_back(rule.name + " must contain at least " + std::to_string(*rule.minLength) + " item(s)");
            }
            if (rule.maxLength && value.size() > *rule.maxLength) {
                out.push_back(rule.name + " must contain at most " + std::to_string(*rule.maxLength) + " item(s)");
            }
            break;
        }
    }

    if (rule.check && !rule.check(value)) {
        out.push_back(rule.name + " " + rule.checkMessage);
    }
}

} // namespace

ArgumentRule ArgumentRule::string(const std::string& name, const std::string& description) {
    return makeRule(name, ArgumentType::String, description);
}

ArgumentRule ArgumentRule::number(const std::string& name, const std::string& description) {
    return makeRule(name, ArgumentType::Number, description);
}

ArgumentRule ArgumentRule::boolean(const std::string& name, const std::string& description) {
    return makeRule(name, ArgumentType::Boolean, description);
}

ArgumentRule ArgumentRule::stringArray(const std::string& name, const std::string& description) {
    return makeRule(name, ArgumentType::StringArray, description);
}

ArgumentRule& ArgumentRule::require() {
    required = true;
    return *this;
}

ArgumentRule& ArgumentRule::length(size_t min, size_t max) {
    minLength = min;
    maxLength = max;
    return *this;
}

ArgumentRule& ArgumentRule::nonEmpty() {
    minLength = 1;
    return *this;
}

ArgumentRule& ArgumentRule::range(long long min, long long max) {
    minimum = min;
    maximum = max;
    return *this;
}

ArgumentRule& ArgumentRule::oneOf(std::vector<std::string> values) {
    allowedValues = std::move(values);
    return *this;
}

ArgumentRule& ArgumentRule::satisfies(std::function<bool(const nlohmann::json&)> predicate, std::string message) {
    check = std::move(predicate);
    checkMessage = std::move(message);
    return *this;
}

ArgumentRule& ArgumentRule::defaultsTo(nlohmann::json value) {
    defaultValue = std::move(value);
    return *this;
}

ArgumentSchema& ArgumentSchema::add(ArgumentRule rule) {
    rules_.push_back(std::move(rule));
    return *this;
}

std::vector<std::string> ArgumentSchema::violations(const nlohmann::json& args) const {
    std::vector<std::string> found;
    if (!args.is_null() && !args.is_object()) {
        found.push_back("arguments must be an object");
        return found;
    }

    for (const auto& rule : rules_) {
        const bool present = args.is_object() && args.contains(rule.name) && !args.at(rule.name).is_null();
        if (!present) {
            if (rule.required) {
                found.push_back(rule.name + " is required");
            }
            continue;
        }
        checkValue(rule, args.at(rule.name), found);
    }
    return found;
}

std::optional<std::string> ArgumentSchema::validate(const nlohmann::json& args) const {
    const auto found = violations(args);
    if (found.empty()) {
        return std::nullopt;
    }
    return "Invalid arguments: " + join(found, "; ");
}

nlohmann::json ArgumentSchema::toJsonSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& rule : rules_) {
        nlohmann::json property = {{"type", typeName(rule.type)}};
        if (!rule.description.empty()) {
            property["description"] = rule.description;
        }
        if (rule.type == ArgumentType::StringArray) {
            property["items"] = {{"type", "string"}};
            if (rule.minLength) property["minItems"] = *rule.minLength;
            if (rule.maxLength) property["maxItems"] = *rule.maxLength;
        } else {
            if (rule.minLength) property["minLength"] = *rule.minLength;
            if (rule.maxLength) property["maxLength"] = *rule.maxLength;
        }
        if (rule.minimum) property["minimum"] = *rule.minimum;
        if (rule.maximum) property["maximum"] = *rule.maximum;
        if (!rule.allowedValues.empty()) property["enum"] = rule.allowedValues;
        if (rule.defaultValue) property["default"] = *rule.defaultValue;

        properties[rule.name] = property;
        if (rule.required) {
            required.push_back(rule.name);
        }
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

std::string stringArg(const nlohmann::json& args, const std::string& name, const std::string& fallback) {
    if (args.is_object() && args.contains(name) && args.at(name).is_string()) {
        return args.at(name).get<std::string>();
    }
    return fallback;
}

bool boolArg(const nlohmann::json& args, const std::string& name, bool fallback) {
    if (args.is_object() && args.contains(name) && args.at(name).is_boolean()) {
        return args.at(name).get<bool>();
    }
    return fallback;
}

std::optional<long long> intArg(const nlohmann::json& args, const std::string& name) {
    if (!args.is_object() || !args.contains(name)) {
        return std::nullopt;
    }
    const auto& value = args.at(name);
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (isIntegral(value)) {
        return static_cast<long long>(value.get<double>());
    }
    return std::nullopt;
}

std::vector<std::string> stringArrayArg(const nlohmann::json& args, const std::string& name) {
    std::vector<std::string> items;
    if (args.is_object() && args.contains(name) && args.at(name).is_array()) {
        for (const auto& item : args.at(name)) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            }
        }
    }
    return items;
}
