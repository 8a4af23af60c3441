#include <gtest/gtest.h>
#include "tools/argument_schema.hpp"

using nlohmann::json;

class ArgumentSchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_.add(ArgumentRule::string("vmId", "VM").require().length(1, 10))
               .add(ArgumentRule::number("cpus", "CPUs").range(1, 16))
               .add(ArgumentRule::boolean("force", "Force").defaultsTo(false))
               .add(ArgumentRule::string("os", "OS").oneOf({"ubuntu", "debian"}))
               .add(ArgumentRule::stringArray("targets", "Targets").nonEmpty())
               .add(ArgumentRule::string("even", "Even length")
                        .satisfies([](const json& v) { return v.get<std::string>().size() % 2 == 0; },
                                   "must have an even length"));
    }

    ArgumentSchema schema_;
};

// Test that well-formed arguments pass, including unknown extra keys
TEST_F(ArgumentSchemaTest, AcceptsValidArguments) {
    json args = {{"vmId", "vm1"}, {"cpus", 4}, {"force", true}, {"os", "ubuntu"},
                 {"targets", {"a", "b"}}, {"even", "ab"}, {"extra", 1}};
    EXPECT_FALSE(schema_.validate(args).has_value());
}

// Test that null arguments are validated as an empty object
TEST_F(ArgumentSchemaTest, NullArgumentsCountAsEmptyObject) {
    auto message = schema_.validate(json());
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "Invalid arguments: vmId is required");
}

// Test that every violated rule is reported in rule order
TEST_F(ArgumentSchemaTest, CollectsEveryViolation) {
    json args = {{"vmId", ""}, {"cpus", 32}, {"force", "yes"}, {"os", "arch"},
                 {"targets", json::array()}, {"even", "abc"}};
    const auto violations = schema_.violations(args);
    ASSERT_EQ(violations.size(), 6u);
    EXPECT_EQ(violations[0], "vmId must be at least 1 characters");
    EXPECT_EQ(violations[1], "cpus must be <= 16");
    EXPECT_EQ(violations[2], "force must be a boolean");
    EXPECT_EQ(violations[3], "os must be one of: ubuntu, debian");
    EXPECT_EQ(violations[4], "targets must contain at least 1 item(s)");
    EXPECT_EQ(violations[5], "even must have an even length");
}

// Test the combined validation message format
TEST_F(ArgumentSchemaTest, JoinsViolationsWithSemicolons) {
    auto message = schema_.validate({{"vmId", 5}, {"cpus", 0}});
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "Invalid arguments: vmId must be a string; cpus must be >= 1");
}

// Test that fractional numbers are rejected for integer fields
TEST_F(ArgumentSchemaTest, NumbersMustBeIntegral) {
    EXPECT_FALSE(schema_.validate({{"vmId", "a"}, {"cpus", 2.0}}).has_value());
    auto message = schema_.validate({{"vmId", "a"}, {"cpus", 2.5}});
    ASSERT_TRUE(message.has_value());
    EXPECT_NE(message->find("cpus must be an integer"), std::string::npos);
}

// Test that string arrays reject non-string items
TEST_F(ArgumentSchemaTest, ArraysMustHoldStrings) {
    auto message = schema_.validate({{"vmId", "a"}, {"targets", {"a", 1}}});
    ASSERT_TRUE(message.has_value());
    EXPECT_NE(message->find("targets must be an array of strings"), std::string::npos);
}

// Test that a non-object argument payload is rejected
TEST_F(ArgumentSchemaTest, NonObjectArgumentsRejected) {
    auto message = schema_.validate(json::array());
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "Invalid arguments: arguments must be an object");
}

// Test that an explicit null satisfies no required field
TEST_F(ArgumentSchemaTest, NullValueCountsAsMissing) {
    auto message = schema_.validate({{"vmId", nullptr}});
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "Invalid arguments: vmId is required");
}

// Test JSON Schema generation from the rules
TEST_F(ArgumentSchemaTest, GeneratesJsonSchema) {
    const json schema = schema_.toJsonSchema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["required"], json::array({"vmId"}));
    EXPECT_EQ(schema["properties"]["vmId"]["type"], "string");
    EXPECT_EQ(schema["properties"]["vmId"]["maxLength"], 10);
    EXPECT_EQ(schema["properties"]["cpus"]["minimum"], 1);
    EXPECT_EQ(schema["properties"]["force"]["default"], false);
    EXPECT_EQ(schema["properties"]["os"]["enum"], json::array({"ubuntu", "debian"}));
    EXPECT_EQ(schema["properties"]["targets"]["items"]["type"], "string");
    EXPECT_EQ(schema["properties"]["targets"]["minItems"], 1);
}

// Test the typed argument accessors and their fallbacks
TEST(ArgumentAccessorsTest, ReadValuesWithFallbacks) {
    json args = {{"name", "vm"}, {"flag", true}, {"count", 3}, {"list", {"a", "b"}}};
    EXPECT_EQ(stringArg(args, "name"), "vm");
    EXPECT_EQ(stringArg(args, "missing", "dflt"), "dflt");
    EXPECT_TRUE(boolArg(args, "flag", false));
    EXPECT_TRUE(boolArg(args, "missing", true));
    EXPECT_EQ(intArg(args, "count"), 3);
    EXPECT_FALSE(intArg(args, "missing").has_value());
    EXPECT_EQ(stringArrayArg(args, "list"), (std::vector<std::string>{"a", "b"}));
}

// Test that a schema without rules accepts any object
TEST(ArgumentAccessorsTest, EmptySchemaAcceptsAnything) {
    ArgumentSchema empty;
    EXPECT_FALSE(empty.validate(json::object()).has_value());
    EXPECT_FALSE(empty.validate(json()).has_value());
    EXPECT_EQ(empty.toJsonSchema()["properties"], json::object());
    EXPECT_FALSE(empty.toJsonSchema().contains("required"));
}
