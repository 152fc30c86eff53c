#pragma once

#include <ostream>
#include <string>

namespace mwscl
{

/**
 * Holds a credential which must never end up in a log line,
 * an error message or any generated string. Streaming a Secret
 * prints a mask instead of the value.
 */
class Secret
{
public:
    Secret() = default;
    explicit Secret(std::string value);

    bool empty() const { return value_.empty(); }

    /**
     * Access the plain value. Only the signer should need this.
     */
    std::string const& reveal() const { return value_; }

    /**
     * Returns "****" for a non-empty secret, "" otherwise.
     */
    std::string masked() const;

    bool operator==(Secret const& other) const { return value_ == other.value_; }
    bool operator!=(Secret const& other) const { return value_ != other.value_; }

private:
    std::string value_;
};

std::ostream& operator<<(std::ostream& os, Secret const& secret);

}
