#include <catch2/catch_all.hpp>

#include "mwscl/config.hpp"
#include "mwscl/errors.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace
{

const char* PROFILE = R"yaml(
host: mws-eu.amazonservices.com
uri: /
version: 2010-01-01
verb: get
seller-id: Seller ID
access-key-id: key
secret-access-key: secret
)yaml";

class ProfileFileFixture {
public:
    ProfileFileFixture() {
        std::random_device rd;
        tempDir = fs::temp_directory_path() / ("mwscl_test_" + std::to_string(rd()));
        fs::create_directories(tempDir);
        tempFile = tempDir / "mws-profile.yml";
    }

    ~ProfileFileFixture() {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    void writeFile(const std::string& content) {
        std::ofstream os(tempFile);
        os << content;
    }

    fs::path tempDir;
    fs::path tempFile;
};

}

TEST_CASE("Parse MWS profiles", "[config]") {
    SECTION("All keys") {
        mwscl::Config config(PROFILE);

        REQUIRE(config.host == "mws-eu.amazonservices.com");
        REQUIRE(config.uri == "/");
        REQUIRE(config.version == "2010-01-01");
        REQUIRE(config.verb == mwscl::Verb::GET);
        REQUIRE(config.sellerId == "Seller ID");
        REQUIRE(config.accessKeyId == "key");
        REQUIRE(config.secretAccessKey == mwscl::Secret("secret"));
        REQUIRE_FALSE(config.mwsAuthToken.has_value());
    }

    SECTION("Empty document") {
        mwscl::Config config("");

        REQUIRE_FALSE(config.host.has_value());
        REQUIRE_FALSE(config.secretAccessKey.has_value());
    }

    SECTION("Invalid documents") {
        REQUIRE_THROWS_AS(mwscl::Config("- a\n- b\n"), mwscl::ConfigError);
        REQUIRE_THROWS_AS(mwscl::Config("host: [a, b]\n"), mwscl::ConfigError);
        REQUIRE_THROWS_AS(mwscl::Config("verb: PUT\n"), mwscl::ConfigError);
        REQUIRE_THROWS_AS(mwscl::Config("host: {\n"), mwscl::ConfigError);
    }
}

TEST_CASE("Apply MWS profiles", "[config]") {
    SECTION("Profile signs the reference request") {
        mwscl::RequestOptions options;
        options.action = "ListOrders";
        options.timestamp = mwscl::Timestamp::fromIso8601("2013-01-01T00:00:00-02:00");
        mwscl::Config(PROFILE).apply(options);

        mwscl::Query query(options);
        REQUIRE(query.signature() == "7XZO1dSv7BHElkee33Rt7L5PNFiBET13pg3pOWKeoo0=");
    }

    SECTION("Merge prefers the other side") {
        mwscl::Config config(PROFILE);
        config |= mwscl::Config("mws-auth-token: auth_token\nhost: mws.amazonservices.com\n");

        REQUIRE(config.host == "mws.amazonservices.com");
        REQUIRE(config.mwsAuthToken == "auth_token");
        REQUIRE(config.sellerId == "Seller ID");
    }

    SECTION("Unset values leave options untouched") {
        mwscl::RequestOptions options;
        options.uri = "/Products/2011-10-01";
        mwscl::Config("host: mws.amazonservices.com\n").apply(options);

        REQUIRE(options.uri == "/Products/2011-10-01");
        REQUIRE(options.host == "mws.amazonservices.com");
    }
}

TEST_CASE("Serialize MWS profiles", "[config]") {
    mwscl::Config config(PROFILE);
    config.mwsAuthToken = "auth_token";
    config.secretAccessKey = mwscl::Secret("s3cr3t-value");

    SECTION("YAML round trip") {
        mwscl::Config reparsed(config.toYaml());

        REQUIRE(reparsed.host == config.host);
        REQUIRE(reparsed.secretAccessKey == config.secretAccessKey);
        REQUIRE(reparsed.mwsAuthToken == config.mwsAuthToken);
        REQUIRE(reparsed.verb == config.verb);
    }

    SECTION("Safe string masks credentials") {
        auto safe = config.toSafeString();

        REQUIRE(safe.find("s3cr3t-value") == std::string::npos);
        REQUIRE(safe.find("auth_token") == std::string::npos);
        REQUIRE(safe.find("****") != std::string::npos);
        REQUIRE(safe.find("mws-eu.amazonservices.com") != std::string::npos);
    }
}

TEST_CASE("Load MWS profiles from files", "[config][file]") {
    ProfileFileFixture fixture;

    SECTION("Existing file") {
        fixture.writeFile(PROFILE);
        auto config = mwscl::Config::fromFile(fixture.tempFile.string());

        REQUIRE(config.accessKeyId == "key");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(
            mwscl::Config::fromFile((fixture.tempDir / "missing.yml").string()),
            mwscl::ConfigError);
    }
}
