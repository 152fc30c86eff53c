#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "mwscl/timestamp.hpp"

namespace mwscl
{

/**
 * Scalar parameter value.
 */
using Primitive = std::variant<std::string, std::int64_t, std::uint64_t, double, bool, Timestamp>;

struct ParamValue;

/**
 * User-supplied request parameters, keyed by snake_case identifier.
 */
using ParamMap = std::map<std::string, ParamValue>;

/**
 * A request parameter: either unset, a scalar or a nested map
 * which flattens to dotted `Outer.Inner` keys.
 *
 * Note: ParamMap is a variant alternative while ParamValue is still
 * incomplete. std::map does not guarantee incomplete mapped types before
 * C++26; libstdc++ and libc++ both support it.
 */
struct ParamValue
{
    using Variant = std::variant<
        std::monostate,
        std::string,
        std::int64_t,
        std::uint64_t,
        double,
        bool,
        Timestamp,
        ParamMap>;

    ParamValue() = default;
    ParamValue(std::string v) : value(std::move(v)) {}
    ParamValue(char const* v) : value(std::string(v)) {}
    ParamValue(double v) : value(v) {}
    ParamValue(bool v) : value(v) {}
    ParamValue(Timestamp v) : value(v) {}
    ParamValue(ParamMap v) : value(std::move(v)) {}
    ParamValue(Primitive const& v);

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
    ParamValue(T v) : value(static_cast<std::int64_t>(v)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                               !std::is_same_v<T, bool>, int> = 0>
    ParamValue(T v) : value(static_cast<std::uint64_t>(v)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(value); }
    bool isNested() const { return std::holds_alternative<ParamMap>(value); }

    bool operator==(ParamValue const& other) const { return value == other.value; }
    bool operator!=(ParamValue const& other) const { return !(*this == other); }

    Variant value;
};

/**
 * MWS list parameter: each value becomes `label.N` (1-based).
 * The label is used verbatim, e.g. "MarketplaceId.Id".
 */
struct StructuredList
{
    std::string label;
    std::vector<Primitive> values;
};

using StructuredLists = std::map<std::string, StructuredList>;

/**
 * Flat, normalized request parameters. Keys are unique;
 * std::map keeps them in byte-wise order.
 */
using NormalizedParams = std::map<std::string, std::string>;

/**
 * snake_case -> UpperCamelCase. Segments are split on '_', their first
 * letter is upper-cased and the rest is kept as is.
 * "custom_param" -> "CustomParam", "ASIN_list" -> "ASINList".
 */
std::string camelize(std::string const& identifier);

/**
 * Camelize all keys, including the keys of nested maps.
 */
ParamMap camelizeKeys(ParamMap const& params);

/**
 * Replace all Timestamp values (also in nested maps) by their
 * ISO-8601 rendering.
 */
ParamMap escapeDateTimeParams(ParamMap const& params);

/**
 * Expand structured lists into `label.N` entries appended to params.
 * Entries of params are kept untouched.
 *
 * Throws InvalidParameter if a generated key already exists.
 */
ParamMap makeStructuredLists(ParamMap params, StructuredLists const& lists);

/**
 * Render a scalar: strings verbatim, integers and doubles in plain
 * decimal form without exponent, booleans as true/false, timestamps as ISO-8601.
 */
std::string renderValue(Primitive const& value);

/**
 * Turn user parameters and structured lists into the flat parameter map:
 * keys are camelized, nested maps flattened to `Outer.Inner`, timestamps
 * and scalars rendered, lists expanded and empty values dropped.
 *
 * Throws InvalidParameter for unset values, maps nested deeper than one
 * level and duplicate keys after camelization.
 */
NormalizedParams normalizeParams(ParamMap const& params, StructuredLists const& lists = {});

}
