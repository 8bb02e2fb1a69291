/**
 * @file JsonAdapter.cpp
 * @brief Implementation of the nlohmann::json adapter
 */

#include "pathexpr/JsonAdapter.hpp"

#include <cstdint>
#include <limits>

namespace pathexpr {

namespace {
    /**
     * @brief Share ownership of the document while pointing at a child
     */
    std::shared_ptr<const nlohmann::json> child_of(const std::shared_ptr<const nlohmann::json>& owner,
                                                   const nlohmann::json& child) {
        return std::shared_ptr<const nlohmann::json>(owner, &child);
    }
}

std::optional<Value> JsonObject::get_member(std::string_view name) const {
    auto it = node_->find(std::string(name));
    if (it == node_->end()) {
        return std::nullopt;
    }
    return from_json(child_of(node_, *it));
}

Value JsonArray::at(std::size_t index) const {
    return from_json(child_of(node_, (*node_)[index]));
}

Value from_json(std::shared_ptr<const nlohmann::json> node) {
    if (!node) {
        return Value();
    }

    switch (node->type()) {
        case nlohmann::json::value_t::object:
            return Value(std::make_shared<const JsonObject>(std::move(node)));

        case nlohmann::json::value_t::array:
            return Value(std::make_shared<const JsonArray>(std::move(node)));

        case nlohmann::json::value_t::string:
            return Value(node->get<std::string>());

        case nlohmann::json::value_t::boolean:
            return Value(node->get<bool>());

        case nlohmann::json::value_t::number_integer:
            return Value(node->get<std::int64_t>());

        case nlohmann::json::value_t::number_unsigned: {
            const auto u = node->get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<std::int64_t>(u));
            }
            // Oversize for int64; fall back to double
            return Value(static_cast<double>(u));
        }

        case nlohmann::json::value_t::number_float:
            return Value(node->get<double>());

        default:
            return Value();
    }
}

Value from_json(nlohmann::json document) {
    return from_json(std::make_shared<const nlohmann::json>(std::move(document)));
}

nlohmann::json to_json(const Value& value) {
    using nlohmann::json;

    if (value.is_null()) {
        return json(nullptr);
    }
    if (const auto* b = value.get_if<bool>()) {
        return json(*b);
    }
    if (const auto* i = value.get_if<std::int64_t>()) {
        return json(*i);
    }
    if (const auto* d = value.get_if<double>()) {
        return json(*d);
    }
    if (const auto* s = value.get_if<std::string>()) {
        return json(*s);
    }

    if (const auto* seq = value.as_sequence()) {
        if (const auto* backed = dynamic_cast<const JsonArray*>(seq)) {
            return backed->node();
        }
        json arr = json::array();
        for (std::size_t i = 0; i < seq->size(); ++i) {
            arr.push_back(to_json(seq->at(i)));
        }
        return arr;
    }

    if (const auto* object = value.as_object()) {
        if (const auto* backed = dynamic_cast<const JsonObject*>(object)) {
            return backed->node();
        }
        return json{{"$type", object->type_name()}};
    }

    return json(nullptr);
}

} // namespace pathexpr
