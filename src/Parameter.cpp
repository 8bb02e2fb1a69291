/**
 * @file Parameter.cpp
 * @brief Implementation of command parameter selection
 */

#include "pathexpr/Parameter.hpp"

namespace pathexpr {

Value resolve_command_parameter(const Value& sender, const Value& event_args,
                                const ParameterOptions& options) {
    if (!options.command_parameter.is_null()) {
        return options.command_parameter;
    }

    const auto& paths = PathExpressionConverter::instance();
    if (!options.event_args_path.empty()) {
        return paths.resolve(event_args, options.event_args_path);
    }
    if (!options.sender_path.empty()) {
        return paths.resolve(sender, options.sender_path);
    }

    if (options.converter != nullptr) {
        return options.converter->convert(event_args, sender);
    }

    return options.pass_event_args ? event_args : Value();
}

} // namespace pathexpr
