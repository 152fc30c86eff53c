#include "mwscl/secret.hpp"

#include <utility>

namespace mwscl
{

Secret::Secret(std::string value)
    : value_(std::move(value))
{}

std::string Secret::masked() const
{
    return value_.empty() ? std::string() : std::string("****");
}

std::ostream& operator<<(std::ostream& os, Secret const& secret)
{
    return os << secret.masked();
}

}
