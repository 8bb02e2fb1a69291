/**
 * @file Converter.hpp
 * @brief Value-conversion boundary for path expressions
 *
 * UI hosts plug transforms into a generic two-argument hook: a value plus
 * an authored parameter in, a transformed value out. PathExpressionConverter
 * is that hook for path expressions: the parameter is the path.
 */

#ifndef PATHEXPR_CONVERTER_HPP
#define PATHEXPR_CONVERTER_HPP

#include "pathexpr/Value.hpp"
#include "pathexpr/Resolver.hpp"
#include "pathexpr/PathCache.hpp"

#include <string_view>

namespace pathexpr {

/**
 * @brief Two-argument value transform
 */
class ValueConverter {
public:
    virtual ~ValueConverter() = default;

    /**
     * @brief Transform a source value using an external parameter
     */
    virtual Value convert(const Value& value, const Value& parameter) const = 0;

    /**
     * @brief Reverse transform
     * @throws NotSupportedError if the converter is one-way
     */
    virtual Value convert_back(const Value& value, const Value& parameter) const = 0;
};

/**
 * @brief Resolves the parameter (a path string) against the value
 *
 * One-way: convert_back() always throws NotSupportedError.
 */
class PathExpressionConverter : public ValueConverter {
public:
    /// Converter backed by PathCache::global()
    PathExpressionConverter();

    /// Converter backed by a caller-owned cache, which must outlive it
    explicit PathExpressionConverter(PathCache& cache);

    /**
     * @brief Resolve @p parameter as a path against @p value
     * @return The resolved value; null if value is null, parameter is not
     *         a string, or the path misses
     */
    Value convert(const Value& value, const Value& parameter) const override;

    /**
     * @throws NotSupportedError always
     */
    Value convert_back(const Value& value, const Value& parameter) const override;

    /**
     * @brief Resolve a path, collapsing misses to null
     */
    Value resolve(const Value& source, std::string_view path) const;

    /**
     * @brief Resolve a path, keeping the found/not-found distinction
     */
    Resolution try_resolve(const Value& source, std::string_view path) const;

    PathCache& cache() const noexcept { return *cache_; }

    /**
     * @brief Shared converter instance backed by the global cache
     */
    static const PathExpressionConverter& instance();

private:
    PathCache* cache_;
};

} // namespace pathexpr

#endif // PATHEXPR_CONVERTER_HPP
