#pragma once

#include <optional>
#include <string>

#include "mwscl/params.hpp"
#include "mwscl/secret.hpp"
#include "mwscl/timestamp.hpp"
#include "mwscl/uri.hpp"

namespace mwscl
{

enum class Verb {
    GET,
    POST
};

std::string verbName(Verb verb);

/**
 * Inputs of a signed MWS request. Fields left at their defaults
 * are filled in by Query.
 */
struct RequestOptions
{
    Verb verb = Verb::GET;
    std::string uri = "/";
    std::string host;

    std::string accessKeyId;
    Secret secretAccessKey;

    std::string action;
    std::string sellerId;
    std::string version;

    /** Current time (UTC) is used if unset. */
    std::optional<Timestamp> timestamp;

    /** Omitted from the request if unset or empty. */
    std::optional<std::string> mwsAuthToken;

    /** Operation specific parameters, keyed by snake_case name. */
    ParamMap params;

    /** List parameters, expanded to `label.N`. */
    StructuredLists lists;
};

/**
 * Signed MWS request (AWS signature version 2).
 *
 * All inputs are validated and normalized on construction;
 * afterwards the object is immutable and every accessor is a pure
 * function of it, so a Query may be shared between threads.
 */
class Query
{
public:
    static constexpr char const* SIGNATURE_METHOD = "HmacSHA256";
    static constexpr int SIGNATURE_VERSION = 2;

    /**
     * Throws MissingCredential, MissingRequired, InvalidUriPath or
     * InvalidParameter.
     */
    explicit Query(RequestOptions options);

    Verb verb() const { return verb_; }
    std::string const& uri() const { return endpoint_.path; }
    std::string const& host() const { return endpoint_.host; }
    std::string const& accessKeyId() const { return accessKeyId_; }
    std::string const& action() const { return action_; }
    std::string const& sellerId() const { return sellerId_; }
    std::string const& version() const { return version_; }
    Timestamp const& timestamp() const { return timestamp_; }
    std::optional<std::string> const& mwsAuthToken() const { return mwsAuthToken_; }
    std::string signatureMethod() const { return SIGNATURE_METHOD; }
    int signatureVersion() const { return SIGNATURE_VERSION; }

    /**
     * Normalized request parameters, without Signature.
     */
    NormalizedParams const& params() const { return params_; }

    /**
     * VERB, host, uri and unsigned query, joined by '\n'.
     */
    std::string canonical() const;

    /**
     * Sorted, encoded query without signature.
     */
    std::string buildQuery() const;

    /**
     * Sorted, encoded query with an additional Signature parameter.
     */
    std::string buildQuery(std::string const& signature) const;

    /**
     * Base64 HMAC-SHA256 of canonical(), keyed with the secret
     * access key. Not percent-encoded.
     */
    std::string signature() const;

    /**
     * https://host/uri?<signed query>
     */
    std::string requestUri() const;

    /**
     * https://host/uri, the target of a POST whose body is requestBody().
     */
    std::string endpointUri() const;

    /**
     * Signed query, to be sent as form body of a POST request.
     */
    std::string requestBody() const;

private:
    Verb verb_;
    URIComponents endpoint_;
    std::string accessKeyId_;
    Secret secretAccessKey_;
    std::string action_;
    std::string sellerId_;
    std::string version_;
    Timestamp timestamp_;
    std::optional<std::string> mwsAuthToken_;
    NormalizedParams params_;
};

}
