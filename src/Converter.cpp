/**
 * @file Converter.cpp
 * @brief Implementation of PathExpressionConverter
 */

#include "pathexpr/Converter.hpp"
#include "pathexpr/Errors.hpp"

#include <string>

namespace pathexpr {

PathExpressionConverter::PathExpressionConverter()
    : cache_(&PathCache::global())
{}

PathExpressionConverter::PathExpressionConverter(PathCache& cache)
    : cache_(&cache)
{}

Value PathExpressionConverter::convert(const Value& value, const Value& parameter) const {
    const auto* path = parameter.get_if<std::string>();
    if (value.is_null() || path == nullptr) {
        return Value();
    }
    return resolve(value, *path);
}

Value PathExpressionConverter::convert_back(const Value&, const Value&) const {
    throw NotSupportedError("convert_back", "PathExpressionConverter");
}

Value PathExpressionConverter::resolve(const Value& source, std::string_view path) const {
    return resolve_path(source, path, *cache_);
}

Resolution PathExpressionConverter::try_resolve(const Value& source, std::string_view path) const {
    return pathexpr::try_resolve(source, path, *cache_);
}

const PathExpressionConverter& PathExpressionConverter::instance() {
    static const PathExpressionConverter converter;
    return converter;
}

} // namespace pathexpr
