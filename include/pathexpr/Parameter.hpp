/**
 * @file Parameter.hpp
 * @brief Command parameter selection for event-to-command bindings
 *
 * When an event fires, the binding must decide what to hand the bound
 * command. Sources are tried in order, first configured one wins:
 * 1. An explicit, non-null command parameter
 * 2. A path resolved against the event arguments (event_args_path)
 * 3. A path resolved against the event sender (sender_path)
 * 4. A converter applied to the event arguments, with the sender as its
 *    parameter
 * 5. The event arguments themselves, if pass_event_args is set
 * 6. Null
 *
 * A configured source that yields null still wins; later sources are not
 * consulted.
 */

#ifndef PATHEXPR_PARAMETER_HPP
#define PATHEXPR_PARAMETER_HPP

#include "pathexpr/Value.hpp"
#include "pathexpr/Converter.hpp"

#include <string>

namespace pathexpr {

/**
 * @brief Parameter sources configured on a binding
 */
struct ParameterOptions {
    Value command_parameter;
    std::string event_args_path;
    std::string sender_path;
    const ValueConverter* converter = nullptr; // non-owning
    bool pass_event_args = false;
};

/**
 * @brief Pick the command parameter for one event
 *
 * @param sender Object that raised the event
 * @param event_args Event argument object
 * @param options Configured sources
 * @return The selected parameter (may be null)
 */
Value resolve_command_parameter(const Value& sender, const Value& event_args,
                                const ParameterOptions& options);

} // namespace pathexpr

#endif // PATHEXPR_PARAMETER_HPP
