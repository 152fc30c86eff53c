#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mwscl
{

/**
 * Base class of all request construction errors.
 * Every error names the offending input field.
 */
struct RequestError : std::runtime_error
{
    RequestError(std::string const& what, std::string field)
        : std::runtime_error(what), field_(std::move(field))
    {}

    std::string const& field() const noexcept { return field_; }

private:
    std::string field_;
};

/** Access key id or secret access key is empty. */
struct MissingCredential : RequestError {
    using RequestError::RequestError;
};

/** Action, seller id, version, host or uri is empty. */
struct MissingRequired : RequestError {
    using RequestError::RequestError;
};

/** The request uri does not start with '/'. */
struct InvalidUriPath : RequestError {
    using RequestError::RequestError;
};

/** An extra parameter has an unsupported shape or an unparsable value. */
struct InvalidParameter : RequestError {
    using RequestError::RequestError;
};

/** A YAML request profile could not be read. */
struct ConfigError : RequestError {
    using RequestError::RequestError;
};

/** OpenSSL failed while computing the signature. */
struct SigningError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
