#include "./environ.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Get an environment variable") {
    auto path = mux::getenv("PATH");
    CHECK(path);
    CHECK_FALSE(path->empty());

    CHECK_FALSE(mux::getenv("MUX_THIS_VARIABLE_IS_NEVER_SET"));
}

TEST_CASE("Render environment strings") {
    mux::environment_map env = {{"ZED", "last"}, {"ALPHA", "first"}, {"EMPTY", ""}};
    auto                 strs = mux::environment_strings(env);
    REQUIRE(strs.size() == 3);
    CHECK(strs[0] == "ALPHA=first");
    CHECK(strs[1] == "EMPTY=");
    CHECK(strs[2] == "ZED=last");
}
