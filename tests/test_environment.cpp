#include <catch2/catch_test_macros.hpp>
#include <circuitguard/environment.h>
#include <circuitguard/guard.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

using namespace circuitguard;
using namespace std::chrono_literals;

TEST_CASE("Environment: .env Loading", "[env]") {
    std::string test_file = "test.env";

    std::ofstream out(test_file);
    out << "KEY1=VALUE1\n";
    out << "  KEY2 = VALUE2  \n";
    out << "# COMMENT=BLAH\n";
    out << "KEY3=\"QUOTED VALUE\"\n";
    out << "export KEY4=exported\n";
    out << "KEY5=plain # trailing note\n";
    out << "KEY6=\"keep # this\"\n";
    out.close();

    SECTION("Loading and Parsing") {
        REQUIRE(load_env(test_file) == true);

        CHECK(std::string(std::getenv("KEY1")) == "VALUE1");
        CHECK(std::string(std::getenv("KEY2")) == "VALUE2");
        CHECK(std::getenv("COMMENT") == nullptr);
        CHECK(std::string(std::getenv("KEY3")) == "QUOTED VALUE");
        CHECK(std::string(std::getenv("KEY4")) == "exported");
        CHECK(std::string(std::getenv("KEY5")) == "plain");
        CHECK(std::string(std::getenv("KEY6")) == "keep # this");
    }

    SECTION("Existing variables win without overwrite") {
        setenv("KEY1", "FROM_SHELL", 1);
        REQUIRE(load_env(test_file, false) == true);
        CHECK(std::string(std::getenv("KEY1")) == "FROM_SHELL");
    }

    SECTION("Non-existent file") {
        CHECK(load_env("missing.env") == false);
    }

    std::remove(test_file.c_str());
}

TEST_CASE("Environment: Typed Lookup", "[env]") {
    setenv("CG_TEST_INT", "17", 1);
    setenv("CG_TEST_FLAG", "yes", 1);
    unsetenv("CG_TEST_MISSING");

    CHECK(env<int>("CG_TEST_INT") == 17);
    CHECK(env<bool>("CG_TEST_FLAG") == true);
    CHECK(env<std::chrono::milliseconds>("CG_TEST_INT") == 17ms);
    CHECK(env<std::string>("CG_TEST_MISSING", "fallback") == "fallback");
    CHECK_THROWS(env<int>("CG_TEST_MISSING"));

    setenv("CG_TEST_BAD", "soon", 1);
    CHECK_THROWS_AS(env<int>("CG_TEST_BAD"), std::invalid_argument);

    SECTION("Trailing characters are rejected") {
        setenv("CG_TEST_PARTIAL", "3x", 1);
        setenv("CG_TEST_UNITS", "30s", 1);
        setenv("CG_TEST_RATIO", "0.5x", 1);

        CHECK_THROWS_AS(env<int>("CG_TEST_PARTIAL"), std::invalid_argument);
        CHECK_THROWS_AS(env<std::chrono::milliseconds>("CG_TEST_UNITS"), std::invalid_argument);
        CHECK_THROWS_AS(env<double>("CG_TEST_RATIO"), std::invalid_argument);
    }

    SECTION("Out of range values are rejected") {
        setenv("CG_TEST_BIG", "99999999999", 1);
        setenv("CG_TEST_HUGE", "99999999999999999999999", 1);

        CHECK_THROWS_AS(env<int>("CG_TEST_BIG"), std::invalid_argument);
        CHECK_THROWS_AS(env<std::chrono::milliseconds>("CG_TEST_HUGE"), std::invalid_argument);
    }

    SECTION("Empty values are rejected") {
        setenv("CG_TEST_EMPTY", "", 1);
        CHECK_THROWS_AS(env<int>("CG_TEST_EMPTY"), std::invalid_argument);
    }
}

TEST_CASE("Environment: Guard Configuration", "[env][guard]") {
    SECTION("Values from the environment") {
        setenv("PAYMENTS_THRESHOLD", "3", 1);
        setenv("PAYMENTS_TIMEOUT_MS", "1500", 1);

        auto config = GuardConfig::from_env("PAYMENTS");
        CHECK(config.threshold == 3);
        CHECK(config.timeout == 1500ms);
        CHECK(config.name == "PAYMENTS");

        Guard guard(config);
        CHECK(guard.threshold() == 3);
        CHECK(guard.timeout() == 1500ms);
    }

    SECTION("Malformed values fail loudly") {
        setenv("ORDERS_THRESHOLD", "3x", 1);
        setenv("ORDERS_TIMEOUT_MS", "1500", 1);
        CHECK_THROWS_AS(GuardConfig::from_env("ORDERS"), std::invalid_argument);

        setenv("ORDERS_THRESHOLD", "3", 1);
        setenv("ORDERS_TIMEOUT_MS", "30s", 1);
        CHECK_THROWS_AS(GuardConfig::from_env("ORDERS"), std::invalid_argument);
    }

    SECTION("Defaults when unset") {
        unsetenv("SEARCH_THRESHOLD");
        unsetenv("SEARCH_TIMEOUT_MS");

        auto config = GuardConfig::from_env("SEARCH");
        CHECK(config.threshold == 5);
        CHECK(config.timeout == 30000ms);
    }
}
