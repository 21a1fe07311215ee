#include "./poll_reactor.hpp"

#include "./pipe.hpp"

#include <catch2/catch.hpp>

#if !_WIN32

#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("Dispatch read readiness") {
    mux::poll_reactor loop;
    auto              raw = mux::create_pipe();
    const int         rfd = raw.reader.get();
    loop.register_handle(rfd);
    CHECK(loop.is_registered(rfd));
    CHECK_FALSE(loop.has_pending());

    int n_calls = 0;
    loop.add_read_ready(rfd, [&](int fd) {
        CHECK(fd == rfd);
        ++n_calls;
        return true;
    });
    CHECK(loop.has_pending());

    // Nothing to read yet
    CHECK(loop.run_once(10ms) == 0);
    CHECK(n_calls == 0);

    REQUIRE(::write(raw.writer.get(), "x", 1) == 1);
    CHECK(loop.run_once(1000ms) == 1);
    CHECK(n_calls == 1);
    // Finished callbacks are disarmed
    CHECK_FALSE(loop.has_pending());
    CHECK(loop.run_once(0ms) == 0);
    CHECK(n_calls == 1);
}

TEST_CASE("A callback that is not finished stays armed") {
    mux::poll_reactor loop;
    auto              raw = mux::create_pipe();
    const int         rfd = raw.reader.get();
    loop.register_handle(rfd);
    REQUIRE(::write(raw.writer.get(), "ab", 2) == 2);

    int n_calls = 0;
    loop.add_read_ready(rfd, [&](int fd) {
        char c = 0;
        REQUIRE(::read(fd, &c, 1) == 1);
        return ++n_calls == 2;
    });
    loop.run_once(1000ms);
    CHECK(n_calls == 1);
    CHECK(loop.has_pending());
    loop.run_once(1000ms);
    CHECK(n_calls == 2);
    CHECK_FALSE(loop.has_pending());
}

TEST_CASE("Write readiness and unregistration") {
    mux::poll_reactor loop;
    auto              raw = mux::create_pipe();
    const int         wfd = raw.writer.get();
    loop.register_handle(wfd);

    bool called = false;
    loop.add_write_ready(wfd, [&](int) {
        called = true;
        return true;
    });
    CHECK(loop.run_once(1000ms) == 1);
    CHECK(called);

    called = false;
    loop.add_write_ready(wfd, [&](int) {
        called = true;
        return true;
    });
    // Unregistering drops the armed callback
    loop.unregister_handle(wfd);
    CHECK_FALSE(loop.is_registered(wfd));
    CHECK_FALSE(loop.has_pending());
    CHECK(loop.run_once(10ms) == 0);
    CHECK_FALSE(called);
}

TEST_CASE("A hang-up wakes a pending reader") {
    mux::poll_reactor loop;
    auto              raw = mux::create_pipe();
    const int         rfd = raw.reader.get();
    loop.register_handle(rfd);

    ssize_t got = -1;
    loop.add_read_ready(rfd, [&](int fd) {
        char c = 0;
        got    = ::read(fd, &c, 1);
        return true;
    });
    raw.writer.close();
    CHECK(loop.run_once(1000ms) == 1);
    CHECK(got == 0);
}

#endif
