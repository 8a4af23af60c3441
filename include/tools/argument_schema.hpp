#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class ArgumentType {
    String,
    Number,         // integer-valued
    Boolean,
    StringArray
};

// One named argument and the constraints it must satisfy. Built fluently:
//
//   ArgumentRule::string("vmId", "VM name or UUID").require().length(1, 200)
struct ArgumentRule {
    std::string name;
    ArgumentType type = ArgumentType::String;
    std::string description;
    bool required = false;
    std::optional<size_t> minLength;        // characters, or items for arrays
    std::optional<size_t> maxLength;
    std::optional<long long> minimum;
    std::optional<long long> maximum;
    std::vector<std::string> allowedValues;
    std::function<bool(const nlohmann::json&)> check;
    std::string checkMessage;
    std::optional<nlohmann::json> defaultValue;   // advertised only, never injected

    static ArgumentRule string(const std::string& name, const std::string& description);
    static ArgumentRule number(const std::string& name, const std::string& description);
    static ArgumentRule boolean(const std::string& name, const std::string& description);
    static ArgumentRule stringArray(const std::string& name, const std::string& description);

    ArgumentRule& require();
    ArgumentRule& length(size_t min, size_t max);
    ArgumentRule& nonEmpty();
    ArgumentRule& range(long long min, long long max);
    ArgumentRule& oneOf(std::vector<std::string> values);
    ArgumentRule& satisfies(std::function<bool(const nlohmann::json&)> predicate, std::string message);
    ArgumentRule& defaultsTo(nlohmann::json value);
};

class ArgumentSchema {
public:
    ArgumentSchema& add(ArgumentRule rule);

    // Every violation, in rule order. null arguments count as {}; unknown keys
    // are ignored.
    std::vector<std::string> violations(const nlohmann::json& args) const;

    // "Invalid arguments: a; b", or nullopt when args are acceptable.
    std::optional<std::string> validate(const nlohmann::json& args) const;

    // JSON Schema object advertised by tools/list.
    nlohmann::json toJsonSchema() const;

private:
    std::vector<ArgumentRule> rules_;
};

// Accessors for arguments that already passed validation.
std::string stringArg(const nlohmann::json& args, const std::string& name,
                      const std::string& fallback = "");
bool boolArg(const nlohmann::json& args, const std::string& name, bool fallback);
std::optional<long long> intArg(const nlohmann::json& args, const std::string& name);
std::vector<std::string> stringArrayArg(const nlohmann::json& args, const std::string& name);
