#ifndef SQLMCPS_TOOL_ARGUMENTS_HPP
#define SQLMCPS_TOOL_ARGUMENTS_HPP

// Typed extraction of tool call arguments.
//
//   tool_arguments::ArgumentReader reader(arguments);
//   std::string database = reader.required_string("database");
//   std::string schema = reader.optional_string("schema", "dbo");
//   if (!reader.ok()) {
//       return reader.failure("Database name is required");
//   }

#include <string>

#include "mcp/mcp_tools.hpp"

namespace tool_arguments {

using json = json_rpc::json;

class ArgumentReader {
public:
    // arguments is params.arguments; anything but an object reads as empty.
    explicit ArgumentReader(const json &arguments);

    // Value of a string argument. Records a failure and returns "" when the
    // argument is missing or not a string.
    std::string required_string(const std::string &key);

    // Value of a string argument, or default_value when it is absent or null.
    // A present non-string value is recorded as a failure.
    std::string optional_string(const std::string &key, const std::string &default_value);

    // Value of an object argument, or an empty object when it is absent or null.
    // A present non-object value is recorded as a failure.
    json optional_object(const std::string &key);

    bool ok() const;

    // InvalidParams outcome. A missing argument reports missing_message;
    // a mistyped one reports which argument had the wrong type.
    mcp_tools::ToolOutcome failure(const std::string &missing_message) const;

private:
    const json *find(const std::string &key) const;

    const json &arguments_;
    bool missing_ = false;
    std::string wrong_type_message_;
};

} // namespace tool_arguments

#endif // SQLMCPS_TOOL_ARGUMENTS_HPP
