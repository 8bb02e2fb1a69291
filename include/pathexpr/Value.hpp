/**
 * @file Value.hpp
 * @brief Value type for path traversal
 *
 * A Value is a nullable tagged union over the shapes a traversal can meet:
 * - Null
 * - Bool
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Object (shared PathResolvable: exposes named members)
 * - Sequence (shared Sequence: exposes size + positional get)
 *
 * Objects and sequences are capabilities, not concrete types. A traversal
 * only ever asks "does this value have member X" and "can this value be
 * indexed", so any type implementing the interfaces below can sit in the
 * graph.
 */

#ifndef PATHEXPR_VALUE_HPP
#define PATHEXPR_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace pathexpr {

class PathResolvable;
class Sequence;

/**
 * @brief Heterogeneous, nullable value flowing through a path traversal
 *
 * Scalars compare by value; objects and sequences compare by identity.
 * A null shared pointer passed to a constructor yields a null Value.
 */
class Value {
public:
    using Object = std::shared_ptr<const PathResolvable>;
    using List = std::shared_ptr<const Sequence>;
    using Storage = std::variant<std::monostate, bool, std::int64_t, double,
                                 std::string, Object, List>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool v) : storage_(v) {}
    Value(int v) : storage_(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : storage_(v) {}
    Value(double v) : storage_(v) {}
    Value(const char* v);
    Value(std::string v) : storage_(std::move(v)) {}
    Value(std::string_view v) : storage_(std::string(v)) {}

    template <typename T,
              std::enable_if_t<std::is_convertible_v<T*, const PathResolvable*>, int> = 0>
    Value(std::shared_ptr<T> object) {
        if (object) storage_ = Object(std::move(object));
    }

    template <typename T,
              std::enable_if_t<std::is_convertible_v<T*, const Sequence*>, int> = 0>
    Value(std::shared_ptr<T> sequence) {
        if (sequence) storage_ = List(std::move(sequence));
    }

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(storage_); }
    bool is_boolean() const noexcept { return std::holds_alternative<bool>(storage_); }
    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(storage_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(storage_); }
    bool is_number() const noexcept { return is_integer() || is_float(); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(storage_); }
    bool is_object() const noexcept { return std::holds_alternative<Object>(storage_); }
    bool is_sequence() const noexcept { return std::holds_alternative<List>(storage_); }

    /**
     * @brief Typed access to the stored alternative
     * @return Pointer to the alternative, or nullptr if another one is held
     */
    template <typename T>
    const T* get_if() const noexcept {
        return std::get_if<T>(&storage_);
    }

    /**
     * @brief Object capability of this value
     * @return The member-lookup interface, or nullptr if not an object
     */
    const PathResolvable* as_object() const noexcept;

    /**
     * @brief Sequence capability of this value
     * @return The indexer interface, or nullptr if not indexable
     */
    const Sequence* as_sequence() const noexcept;

    const Storage& storage() const noexcept { return storage_; }

    friend bool operator==(const Value& lhs, const Value& rhs) {
        return lhs.storage_ == rhs.storage_;
    }

    friend bool operator!=(const Value& lhs, const Value& rhs) {
        return !(lhs == rhs);
    }

private:
    Storage storage_;
};

/**
 * @brief Capability of an object whose public members can be read by name
 *
 * Implementations decide what counts as a public readable property. The
 * traversal never looks past this interface, so anything not exposed here
 * (private state, plain data fields) is unreachable from a path.
 */
class PathResolvable {
public:
    virtual ~PathResolvable() = default;

    /**
     * @brief Read a public member by exact, case-sensitive name
     * @param name Member name
     * @return The member's current value, or std::nullopt if no such
     *         readable member exists
     */
    virtual std::optional<Value> get_member(std::string_view name) const = 0;

    /**
     * @brief Human-readable type name used in diagnostics
     */
    virtual std::string type_name() const { return "object"; }
};

/**
 * @brief Capability of an ordered, randomly indexable container
 */
class Sequence {
public:
    virtual ~Sequence() = default;

    virtual std::size_t size() const = 0;

    /**
     * @brief Element at a position
     * @pre index < size()
     */
    virtual Value at(std::size_t index) const = 0;
};

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "sequence", or the object's own type name)
 */
std::string type_name(const Value& val);

/**
 * @brief Write a diagnostic rendering of a value
 *
 * Strings are quoted, objects print as <TypeName>, sequences as
 * <sequence[size]>.
 */
std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace pathexpr

#endif // PATHEXPR_VALUE_HPP
