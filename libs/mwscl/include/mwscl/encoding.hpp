#pragma once

#include <string>

namespace mwscl
{

/**
 * Encoder for MWS query keys and values, used both for the canonical
 * string and for the query sent on the wire.
 *
 * A-Z, a-z, 0-9, '-', '_', '.' and '~' stay literal, a space becomes '+',
 * every other byte becomes %HH with upper-case hex digits.
 */
std::string percentEncode(std::string const& input);

/**
 * Raw HMAC-SHA256 digest of data, keyed with key.
 *
 * Throws SigningError.
 */
std::string hmacSha256(std::string const& key, std::string const& data);

/**
 * Standard base64 with '=' padding and without line breaks.
 *
 * Throws SigningError.
 */
std::string base64Encode(std::string const& bytes);

}
