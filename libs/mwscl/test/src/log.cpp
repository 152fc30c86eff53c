#include <catch2/catch_all.hpp>

#include "mwscl/log.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/secret.hpp"

#include <sstream>

TEST_CASE("Logger basic functionality", "[mwscl::log]") {
    auto& logger = mwscl::log();
    logger.info("Test log message");
    REQUIRE(logger.name() == "mws-query");
    REQUIRE(&logger == &mwscl::log());
}

TEST_CASE("Logged runtime errors", "[mwscl::log]") {
    auto error = mwscl::logRuntimeError<mwscl::MissingRequired>("Missing action", "action");

    REQUIRE(std::string(error.what()) == "Missing action");
    REQUIRE(error.field() == "action");
}

TEST_CASE("Secrets are masked", "[secret]") {
    mwscl::Secret secret("secret");
    std::ostringstream os;
    os << secret;

    REQUIRE(os.str() == "****");
    REQUIRE(secret.reveal() == "secret");
    REQUIRE(mwscl::Secret().masked().empty());
}
