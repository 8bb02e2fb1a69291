/**
 * @file Properties.hpp
 * @brief Property tables and sequence adapters for exposing C++ types
 *
 * A type joins a traversable graph by registering its public readable
 * properties once, in a PropertyTable, and deriving from Reflected:
 *
 * ```cpp
 * struct Item : pathexpr::Reflected<Item> {
 *     std::string title;
 *
 *     static const pathexpr::PropertyTable<Item>& properties() {
 *         static const auto table = pathexpr::PropertyTable<Item>()
 *             .add("Title", [](const Item& i) { return pathexpr::Value(i.title); });
 *         return table;
 *     }
 * };
 * ```
 *
 * Containers are exposed either as a ValueArray (an owning snapshot) or a
 * SequenceView (a shared view converting elements on access).
 */

#ifndef PATHEXPR_PROPERTIES_HPP
#define PATHEXPR_PROPERTIES_HPP

#include "pathexpr/Value.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pathexpr {

/**
 * @brief Registry of the public readable properties of T
 *
 * Lookups are exact and case-sensitive. Names not registered here do not
 * exist as far as path resolution is concerned.
 */
template <typename T>
class PropertyTable {
public:
    using Getter = std::function<Value(const T&)>;

    /**
     * @brief Register (or replace) a readable property
     * @return *this, for chaining
     */
    PropertyTable& add(std::string name, Getter getter) {
        getters_.insert_or_assign(std::move(name), std::move(getter));
        return *this;
    }

    /**
     * @brief Read a property of an instance
     * @return The property value, or std::nullopt if the name is unknown
     */
    std::optional<Value> get(const T& self, std::string_view name) const {
        auto it = getters_.find(name);
        if (it == getters_.end()) {
            return std::nullopt;
        }
        return it->second(self);
    }

    bool contains(std::string_view name) const {
        return getters_.find(name) != getters_.end();
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(getters_.size());
        for (const auto& entry : getters_) out.push_back(entry.first);
        return out;
    }

private:
    std::map<std::string, Getter, std::less<>> getters_;
};

/**
 * @brief CRTP base wiring Derived::properties() into PathResolvable
 *
 * Derived must provide `static const PropertyTable<Derived>& properties()`.
 */
template <typename Derived>
class Reflected : public PathResolvable {
public:
    std::optional<Value> get_member(std::string_view name) const override {
        return Derived::properties().get(static_cast<const Derived&>(*this), name);
    }
};

/**
 * @brief Owning, contiguous array of values
 */
class ValueArray : public Sequence {
public:
    ValueArray() = default;
    explicit ValueArray(std::vector<Value> items) : items_(std::move(items)) {}

    std::size_t size() const override { return items_.size(); }
    Value at(std::size_t index) const override { return items_.at(index); }

private:
    std::vector<Value> items_;
};

/**
 * @brief Shared view over a random-access container
 *
 * Keeps the container alive and converts the element at a position to a
 * Value on each access. Element type must be convertible to Value.
 */
template <typename Container>
class SequenceView : public Sequence {
public:
    explicit SequenceView(std::shared_ptr<const Container> container)
        : container_(std::move(container)) {}

    std::size_t size() const override { return container_->size(); }
    Value at(std::size_t index) const override { return Value((*container_)[index]); }

private:
    std::shared_ptr<const Container> container_;
};

/**
 * @brief Snapshot a container's elements into a ValueArray
 */
template <typename Container>
Value make_array(const Container& items) {
    std::vector<Value> values;
    values.reserve(items.size());
    for (const auto& item : items) {
        values.emplace_back(item);
    }
    return Value(std::make_shared<const ValueArray>(std::move(values)));
}

/**
 * @brief Expose a shared container as a SequenceView
 * @return A sequence Value, or null if container is null
 */
template <typename Container>
Value make_view(std::shared_ptr<Container> container) {
    if (!container) {
        return Value();
    }
    using Mutable = std::remove_const_t<Container>;
    return Value(std::make_shared<const SequenceView<Mutable>>(
        std::shared_ptr<const Mutable>(std::move(container))));
}

} // namespace pathexpr

#endif // PATHEXPR_PROPERTIES_HPP
