#include "mwscl/encoding.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace mwscl
{

namespace
{

bool isUnreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~';
}

}

std::string percentEncode(std::string const& input)
{
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (unsigned char c : input) {
        if (isUnreserved(c))
            encoded << c;
        else if (c == ' ')
            encoded << '+';
        else
            encoded << '%' << std::setw(2) << static_cast<int>(c);
    }

    return encoded.str();
}

std::string hmacSha256(std::string const& key, std::string const& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    auto result = HMAC(EVP_sha256(),
                       key.data(), static_cast<int>(key.size()),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       digest, &digestLen);
    if (!result)
        throw logRuntimeError<SigningError>("[hmacSha256] OpenSSL failed to compute HMAC-SHA256");

    return std::string(reinterpret_cast<char*>(digest), digestLen);
}

std::string base64Encode(std::string const& bytes)
{
    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), &BIO_free_all);
    if (!b64)
        throw logRuntimeError<SigningError>("[base64Encode] OpenSSL failed to allocate base64 BIO");

    std::unique_ptr<BIO, decltype(&BIO_free_all)> mem(BIO_new(BIO_s_mem()), &BIO_free_all);
    if (!mem)
        throw logRuntimeError<SigningError>("[base64Encode] OpenSSL failed to allocate memory BIO");

    // The chain owns both BIOs from here on.
    std::unique_ptr<BIO, decltype(&BIO_free_all)> bio(BIO_push(b64.release(), mem.release()), &BIO_free_all);

    BIO_set_flags(bio.get(), BIO_FLAGS_BASE64_NO_NL);

    if (!bytes.empty() && BIO_write(bio.get(), bytes.data(), static_cast<int>(bytes.size())) <= 0)
        throw logRuntimeError<SigningError>("[base64Encode] BIO_write failed");
    if (BIO_flush(bio.get()) != 1)
        throw logRuntimeError<SigningError>("[base64Encode] BIO_flush failed");

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio.get(), &bufferPtr);

    return std::string(bufferPtr->data, bufferPtr->length);
}

}
