#include "mcp/mcp_tools.hpp"

namespace mcp_tools {

// Global tool registry (module-level, not class-based). Filled once at startup.
static std::vector<ToolDefinition> registered_tools;

ToolOutcome tool_success(const json &payload) {
    ToolOutcome outcome;
    outcome.success = true;
    outcome.payload = payload;
    return outcome;
}

ToolOutcome tool_failure(int error_code, const std::string &error_message) {
    ToolOutcome outcome;
    outcome.success = false;
    outcome.error_code = error_code;
    outcome.error_message = error_message;
    return outcome;
}

void register_tool(const ToolDefinition &definition) {
    for (auto &tool : registered_tools) {
        if (tool.name == definition.name) {
            tool = definition;
            return;
        }
    }
    registered_tools.push_back(definition);
}

json describe_tool(const ToolDefinition &definition) {
    json parameters = json::object();
    json properties = json::object();
    for (const auto &parameter : definition.parameters) {
        parameters[parameter.name] = parameter.description;
        properties[parameter.name] = {
            {"type", parameter.name == "parameters" ? "object" : "string"},
            {"description", parameter.description}
        };
    }

    json required = json::array();
    for (const auto &name : definition.required) {
        required.push_back(name);
    }

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = properties;
    input_schema["required"] = required;

    json tool_entry;
    tool_entry["name"] = definition.name;
    tool_entry["description"] = definition.description;
    tool_entry["parameters"] = parameters;
    tool_entry["required"] = required;
    tool_entry["inputSchema"] = input_schema;
    return tool_entry;
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        tools_array.push_back(describe_tool(tool));
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

const ToolDefinition *find_tool(const std::string &tool_name) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
