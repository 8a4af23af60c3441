#include "tools/tool_result.hpp"

ToolResult ToolResult::text(const std::string& text) {
    ToolResult result;
    result.content.push_back(ToolContent{"text", text});
    return result;
}

ToolResult ToolResult::error(const std::string& title, const std::string& message) {
    ToolResult result = text("❌ **" + title + "**\n\n" + message);
    result.isError = true;
    return result;
}

std::string ToolResult::firstText() const {
    return content.empty() ? std::string() : content.front().text;
}

nlohmann::json ToolResult::toJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : content) {
        items.push_back({{"type", item.type}, {"text", item.text}});
    }
    nlohmann::json result = {{"content", items}};
    if (isError) {
        result["isError"] = true;
    }
    return result;
}

std::string formatOutputBlock(const std::string& text) {
    return "**Output:**\n```\n" + text + "\n```";
}
