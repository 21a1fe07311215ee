#include "./async_result.hpp"

#include <catch2/catch.hpp>

#include <cerrno>
#include <string>

TEST_CASE("A completion produces its value once") {
    mux::async_completion<int> done;
    auto                       res = done.result();
    CHECK_FALSE(res.ready());
    CHECK_FALSE(done.finished());

    done.complete(42);
    CHECK(res.ready());
    CHECK(done.finished());
    CHECK_FALSE(res.failed());
    CHECK(res.get() == 42);

    // Copies observe the same outcome
    auto copy = res;
    CHECK(copy.get() == 42);
}

TEST_CASE("A void completion") {
    mux::async_completion<void> done;
    auto                        res = done.result();
    CHECK_FALSE(res.ready());
    done.complete();
    CHECK(res.ready());
    CHECK_NOTHROW(res.get());
}

TEST_CASE("A failed completion rethrows as a system_error") {
    mux::async_completion<std::string> done;
    auto                               res = done.result();
    done.fail(EPIPE, "the peer went away");
    REQUIRE(res.ready());
    CHECK(res.failed());
    CHECK(res.error() == mux::make_system_error_code(EPIPE));
    try {
        res.get();
        FAIL_CHECK("No exception was thrown");
    } catch (const std::system_error& e) {
        CHECK(e.code() == mux::make_system_error_code(EPIPE));
        CHECK(std::string(e.what()).find("the peer went away") != std::string::npos);
    }
}

TEST_CASE("Ready-made results") {
    auto ok = mux::ready_result<std::size_t>(std::size_t(7));
    CHECK(ok.ready());
    CHECK(ok.get() == 7);

    auto bad = mux::failed_result<void>(EBADF, "closed");
    CHECK(bad.failed());
    CHECK(bad.error() == mux::make_system_error_code(EBADF));
}
