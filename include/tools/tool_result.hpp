#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ToolContent {
    std::string type = "text";
    std::string text;
};

// What every tool handler returns. Failures are values, not exceptions.
struct ToolResult {
    std::vector<ToolContent> content;
    bool isError = false;

    static ToolResult text(const std::string& text);
    // "❌ **title**\n\nmessage"
    static ToolResult error(const std::string& title, const std::string& message);

    std::string firstText() const;
    nlohmann::json toJson() const;
};

// "**Output:**\n```\n<text>\n```"
std::string formatOutputBlock(const std::string& text);
