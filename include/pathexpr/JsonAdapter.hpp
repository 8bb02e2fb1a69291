/**
 * @file JsonAdapter.hpp
 * @brief Expose nlohmann::json documents as traversable Values
 *
 * JSON objects become PathResolvable (keys are members), JSON arrays become
 * Sequence, scalars map to the matching Value alternative:
 * - null → null
 * - boolean → bool
 * - integer → int64_t (unsigned values beyond int64 range → double)
 * - float → double
 * - string → std::string
 *
 * Objects and arrays are wrapped lazily, without copying: each wrapper
 * shares ownership of the whole document.
 */

#ifndef PATHEXPR_JSONADAPTER_HPP
#define PATHEXPR_JSONADAPTER_HPP

#include "pathexpr/Value.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pathexpr {

/**
 * @brief A JSON object seen as a PathResolvable
 */
class JsonObject : public PathResolvable {
public:
    explicit JsonObject(std::shared_ptr<const nlohmann::json> node)
        : node_(std::move(node)) {}

    std::optional<Value> get_member(std::string_view name) const override;
    std::string type_name() const override { return "object"; }

    const nlohmann::json& node() const noexcept { return *node_; }

private:
    std::shared_ptr<const nlohmann::json> node_;
};

/**
 * @brief A JSON array seen as a Sequence
 */
class JsonArray : public Sequence {
public:
    explicit JsonArray(std::shared_ptr<const nlohmann::json> node)
        : node_(std::move(node)) {}

    std::size_t size() const override { return node_->size(); }
    Value at(std::size_t index) const override;

    const nlohmann::json& node() const noexcept { return *node_; }

private:
    std::shared_ptr<const nlohmann::json> node_;
};

/**
 * @brief Wrap a JSON document as a Value graph
 *
 * @param document Document to take ownership of
 * @return Root value of the graph
 *
 * Examples:
 * ```cpp
 * auto root = from_json({{"items", {{{"title", "a"}}}}});
 * resolve_path(root, "items[0].title");  // "a"
 * ```
 */
Value from_json(nlohmann::json document);

/**
 * @brief Wrap a (sub)node of a shared document
 */
Value from_json(std::shared_ptr<const nlohmann::json> node);

/**
 * @brief Render a Value back to JSON
 *
 * JSON-backed objects and arrays render their subtree, other sequences
 * render element-wise, other objects render as {"$type": <type_name>}.
 */
nlohmann::json to_json(const Value& value);

} // namespace pathexpr

#endif // PATHEXPR_JSONADAPTER_HPP
