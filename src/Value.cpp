/**
 * @file Value.cpp
 * @brief Implementation of Value helpers
 */

#include "pathexpr/Value.hpp"

#include <iomanip>

namespace pathexpr {

Value::Value(const char* v) {
    if (v != nullptr) storage_ = std::string(v);
}

const PathResolvable* Value::as_object() const noexcept {
    const auto* object = std::get_if<Object>(&storage_);
    return object ? object->get() : nullptr;
}

const Sequence* Value::as_sequence() const noexcept {
    const auto* list = std::get_if<List>(&storage_);
    return list ? list->get() : nullptr;
}

std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_integer()) return "integer";
    if (val.is_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_sequence()) return "sequence";
    if (const auto* object = val.as_object()) return object->type_name();
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    if (val.is_null()) {
        os << "null";
    } else if (const auto* b = val.get_if<bool>()) {
        os << (*b ? "true" : "false");
    } else if (const auto* i = val.get_if<std::int64_t>()) {
        os << *i;
    } else if (const auto* d = val.get_if<double>()) {
        os << *d;
    } else if (const auto* s = val.get_if<std::string>()) {
        os << std::quoted(*s);
    } else if (const auto* seq = val.as_sequence()) {
        os << "<sequence[" << seq->size() << "]>";
    } else if (const auto* object = val.as_object()) {
        os << '<' << object->type_name() << '>';
    }
    return os;
}

} // namespace pathexpr
