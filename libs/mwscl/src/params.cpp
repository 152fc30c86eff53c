#include "mwscl/params.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <type_traits>

#include "spdlog/fmt/fmt.h"
#include "stx/format.h"
#include "stx/string.h"

namespace mwscl
{

namespace
{

template <class... _T>
struct Overloaded : _T...
{
    using _T::operator()...;
};

template <class... _T>
Overloaded(_T...) -> Overloaded<_T...>;

/**
 * Shortest round-trip digits of v, spelled out without exponent:
 * 1e+16 -> 10000000000000000, 1e-05 -> 0.00001.
 */
std::string renderDecimal(double v)
{
    auto shortest = fmt::format("{}", v);
    auto exponentPos = shortest.find_first_of("eE");
    if (exponentPos == std::string::npos)
        return shortest;

    auto mantissa = shortest.substr(0, exponentPos);
    const int exponent = std::stoi(shortest.substr(exponentPos + 1));

    std::string sign;
    if (!mantissa.empty() && mantissa.front() == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }

    auto pointPos = mantissa.find('.');
    std::string digits = mantissa;
    if (pointPos == std::string::npos)
        pointPos = mantissa.size();
    else
        digits.erase(pointPos, 1);

    const auto newPointPos = static_cast<long>(pointPos) + exponent;
    if (newPointPos <= 0)
        return sign + "0." + std::string(static_cast<std::size_t>(-newPointPos), '0') + digits;
    if (static_cast<std::size_t>(newPointPos) >= digits.size())
        return sign + digits + std::string(static_cast<std::size_t>(newPointPos) - digits.size(), '0');
    const auto split = static_cast<std::size_t>(newPointPos);
    return sign + digits.substr(0, split) + "." + digits.substr(split);
}

std::string renderScalar(std::string const& field, Primitive const& value)
{
    return std::visit(Overloaded {
        [](std::string const& v) {
            return v;
        },
        [](std::int64_t v) {
            return stx::to_string(v);
        },
        [](std::uint64_t v) {
            return stx::to_string(v);
        },
        [&](double v) {
            if (!std::isfinite(v))
                throw logRuntimeError<InvalidParameter>(
                    stx::format("Parameter '{}' is not a finite number", field), field);
            return renderDecimal(v);
        },
        [](bool v) {
            return std::string(v ? "true" : "false");
        },
        [](Timestamp const& v) {
            return v.iso8601();
        }
    }, value);
}

void insertUnique(ParamMap& target, std::string key, ParamValue value, std::string const& origin)
{
    if (key.empty())
        throw logRuntimeError<InvalidParameter>(
            stx::format("Parameter '{}' has an empty name", origin), origin);

    if (!target.emplace(key, std::move(value)).second)
        throw logRuntimeError<InvalidParameter>(
            stx::format("Parameter '{}' maps to '{}', which is already set", origin, key), origin);
}

void flatten(std::string const& key, ParamValue const& value, bool nestedAllowed, NormalizedParams& out)
{
    std::string rendered;
    std::visit(Overloaded {
        [&](std::monostate) {
            throw logRuntimeError<InvalidParameter>(
                stx::format("Parameter '{}' has no value", key), key);
        },
        [&](ParamMap const& nested) {
            if (!nestedAllowed)
                throw logRuntimeError<InvalidParameter>(
                    stx::format("Parameter '{}' is nested more than one level deep", key), key);
            for (auto const& [nestedKey, nestedValue] : nested)
                flatten(key + "." + nestedKey, nestedValue, false, out);
        },
        [&](auto const& scalar) {
            rendered = renderScalar(
                key, Primitive(std::in_place_type<std::decay_t<decltype(scalar)>>, scalar));
        }
    }, value.value);

    if (rendered.empty())
        return;

    if (!out.emplace(key, std::move(rendered)).second)
        throw logRuntimeError<InvalidParameter>(
            stx::format("Parameter '{}' is set more than once", key), key);
}

}

ParamValue::ParamValue(Primitive const& v)
{
    std::visit([this](auto const& scalar) { value = scalar; }, v);
}

std::string camelize(std::string const& identifier)
{
    std::string result;
    result.reserve(identifier.size());

    for (auto const& segment : stx::split<std::vector<std::string>>(identifier, "_")) {
        if (segment.empty())
            continue;
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(segment.front()))));
        result.append(segment, 1, std::string::npos);
    }

    return result;
}

ParamMap camelizeKeys(ParamMap const& params)
{
    ParamMap result;
    for (auto const& [key, value] : params) {
        if (auto nested = std::get_if<ParamMap>(&value.value))
            insertUnique(result, camelize(key), camelizeKeys(*nested), key);
        else
            insertUnique(result, camelize(key), value, key);
    }
    return result;
}

ParamMap escapeDateTimeParams(ParamMap const& params)
{
    ParamMap result;
    for (auto const& [key, value] : params) {
        if (auto nested = std::get_if<ParamMap>(&value.value))
            result.emplace(key, escapeDateTimeParams(*nested));
        else if (auto time = std::get_if<Timestamp>(&value.value))
            result.emplace(key, time->iso8601());
        else
            result.emplace(key, value);
    }
    return result;
}

ParamMap makeStructuredLists(ParamMap params, StructuredLists const& lists)
{
    for (auto const& [name, list] : lists) {
        if (list.label.empty())
            throw logRuntimeError<InvalidParameter>(
                stx::format("Structured list '{}' has an empty label", name), name);

        std::size_t index = 1;
        for (auto const& value : list.values)
            insertUnique(params, stx::format("{}.{}", list.label, index++), ParamValue(value), name);
    }
    return params;
}

std::string renderValue(Primitive const& value)
{
    return renderScalar("value", value);
}

NormalizedParams normalizeParams(ParamMap const& params, StructuredLists const& lists)
{
    // Labels are taken verbatim, so lists are expanded after camelization.
    auto prepared = escapeDateTimeParams(makeStructuredLists(camelizeKeys(params), lists));

    NormalizedParams result;
    for (auto const& [key, value] : prepared)
        flatten(key, value, true, result);

    log().trace("Normalized {} parameter(s) into {} entries.", params.size() + lists.size(), result.size());
    return result;
}

}
