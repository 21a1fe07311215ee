#include "./mailbox.hpp"

#include "./event_loop.hpp"

#include <catch2/catch.hpp>

#include <neo/ufmt.hpp>

#include <chrono>
#include <cstdlib>
#include <string>

#if !_WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace std::chrono_literals;

namespace {

std::string unique_name(std::string_view tag) {
    return neo::ufmt("test-{}-{}",
                     tag,
                     std::chrono::steady_clock::now().time_since_epoch().count());
}

std::string make_message(std::size_t size, int seed) {
    std::string ret;
    ret.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        ret.push_back(static_cast<char>('A' + (i + static_cast<std::size_t>(seed)) % 26));
    }
    return ret;
}

constexpr std::size_t test_capacity = 8192;

}  // namespace

TEST_CASE("Create and destroy a mailbox") {
    auto name = unique_name("create");
    auto box  = mux::mailbox::create(name, test_capacity);
    CHECK(box.name() == name);
    CHECK(box.capacity() == test_capacity);
    CHECK_FALSE(box.is_destroyed());

    // A second owner of the same name is refused
    CHECK_THROWS_AS(mux::mailbox::create(name, test_capacity), std::system_error);

    box.destroy();
    CHECK(box.is_destroyed());

    // The name is free again
    auto again = mux::mailbox::create(name, test_capacity);
    again.destroy();
}

TEST_CASE("Opening a mailbox that does not exist fails") {
    mux::event_loop loop;
    CHECK_THROWS_AS(mux::mailbox_endpoint::open(loop,
                                                unique_name("missing"),
                                                mux::mailbox_side::reader),
                    std::system_error);
}

TEST_CASE("A destroyed mailbox cannot be opened") {
    mux::event_loop loop;
    auto            name = unique_name("destroyed");
    auto            box  = mux::mailbox::create(name, test_capacity);
    box.destroy();
    CHECK_THROWS_AS(mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer),
                    std::system_error);
}

TEST_CASE("Endpoints advertise their roles") {
    mux::event_loop loop;
    auto            name = unique_name("roles");
    auto            box  = mux::mailbox::create(name, test_capacity);

    auto reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    CHECK(reader.is_open());
    CHECK(reader.side() == mux::mailbox_side::reader);
    CHECK(reader.capacity() == test_capacity);
    CHECK(reader.attached_roles() == 1u);

    auto writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);
    CHECK(writer.attached_roles() == 3u);
    CHECK(reader.attached_roles() == 3u);

    reader.close();
    CHECK_FALSE(reader.is_open());
    CHECK(writer.attached_roles() == 2u);

    writer.close();
    box.destroy();
}

TEST_CASE("A message passes from writer to reader") {
    mux::event_loop loop;
    auto            name   = unique_name("simple");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    auto            writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);

    auto wr = writer.write(std::string("Hello, mailbox"));
    // The slot was empty, so the message is already deposited
    CHECK(wr.ready());
    wr.get();

    std::string buf(test_capacity, '\0');
    auto        n = mux::wait(loop, reader.read_some(neo::as_buffer(buf)));
    CHECK(std::string(buf.data(), n) == "Hello, mailbox");

    reader.close();
    writer.close();
    box.destroy();
}

TEST_CASE("A pending read completes when a message arrives") {
    mux::event_loop loop;
    auto            name   = unique_name("pending-read");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    auto            writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);

    std::string buf(test_capacity, '\0');
    auto        rd = reader.read_some(neo::as_buffer(buf));
    loop.run_for(10ms);
    CHECK_FALSE(rd.ready());

    const std::string msg = "wake up";
    mux::wait(loop, writer.write(neo::as_buffer(msg)));
    auto n = mux::wait(loop, rd);
    CHECK(std::string(buf.data(), n) == msg);

    reader.close();
    writer.close();
    box.destroy();
}

TEST_CASE("A full mailbox holds back the next write until it is drained") {
    mux::event_loop loop;
    auto            name   = unique_name("backpressure");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    auto            writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);

    mux::wait(loop, writer.write(std::string("first")));
    auto second = writer.write(std::string("second"));
    loop.run_for(20ms);
    CHECK_FALSE(second.ready());

    std::string buf(test_capacity, '\0');
    auto        n = mux::wait(loop, reader.read_some(neo::as_buffer(buf)));
    CHECK(std::string(buf.data(), n) == "first");

    mux::wait(loop, second);
    n = mux::wait(loop, reader.read_some(neo::as_buffer(buf)));
    CHECK(std::string(buf.data(), n) == "second");

    reader.close();
    writer.close();
    box.destroy();
}

TEST_CASE("Repeated messages of varying sizes arrive whole and in order") {
    mux::event_loop loop;
    auto            name   = unique_name("cycles");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    auto            writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);

    std::string buf(test_capacity, '\0');
    for (int i = 0; i < 64; ++i) {
        const auto size = (static_cast<std::size_t>(i) * 997) % test_capacity + 1;
        auto       msg  = make_message(size, i);
        auto       wr   = writer.write(msg);
        auto       rd   = reader.read_some(neo::as_buffer(buf));
        mux::wait(loop, wr);
        auto n = mux::wait(loop, rd);
        REQUIRE(n == size);
        CHECK(std::string(buf.data(), n) == msg);
    }
    // The largest message fits exactly
    auto msg = make_message(test_capacity, 7);
    mux::wait(loop, writer.write(msg));
    auto n = mux::wait(loop, reader.read_some(neo::as_buffer(buf)));
    CHECK(n == test_capacity);
    CHECK(buf == msg);

    reader.close();
    writer.close();
    box.destroy();
}

TEST_CASE("A short read buffer truncates the message") {
    mux::event_loop loop;
    auto            name   = unique_name("truncate");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    auto            writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);

    mux::wait(loop, writer.write(std::string("0123456789")));
    std::string small(4, '\0');
    auto        n = mux::wait(loop, reader.read_some(neo::as_buffer(small)));
    CHECK(n == 4);
    CHECK(small == "0123");

    // The slot is empty again
    CHECK(writer.write(std::string("next")).ready());

    reader.close();
    writer.close();
    box.destroy();
}

TEST_CASE("Closing an endpoint fails its pending operation") {
    mux::event_loop loop;
    auto            name   = unique_name("close-pending");
    auto            box    = mux::mailbox::create(name, test_capacity);
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);

    std::string buf(test_capacity, '\0');
    auto        rd = reader.read_some(neo::as_buffer(buf));
    loop.run_for(5ms);
    REQUIRE_FALSE(rd.ready());
    reader.close();
    REQUIRE(rd.ready());
    CHECK(rd.failed());
    // Let the reactor release anything still tied to the wait
    loop.run_for(5ms);
    box.destroy();
}

#if !_WIN32

TEST_CASE("Messages cross a process boundary") {
    auto name = unique_name("fork");
    auto box  = mux::mailbox::create(name, test_capacity);

    auto child = ::fork();
    REQUIRE(child != -1);
    if (child == 0) {
        int rc = 0;
        try {
            mux::event_loop loop;
            auto writer = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::writer);
            for (int i = 0; i < 10; ++i) {
                mux::wait(loop, writer.write(make_message(100 + static_cast<std::size_t>(i), i)));
            }
            writer.close();
        } catch (const std::system_error&) {
            rc = 1;
        }
        std::_Exit(rc);
    }

    mux::event_loop loop;
    auto            reader = mux::mailbox_endpoint::open(loop, name, mux::mailbox_side::reader);
    std::string     buf(test_capacity, '\0');
    for (int i = 0; i < 10; ++i) {
        auto n = mux::wait(loop, reader.read_some(neo::as_buffer(buf)));
        CHECK(std::string(buf.data(), n) == make_message(100 + static_cast<std::size_t>(i), i));
    }
    int status = 0;
    ::waitpid(child, &status, 0);
    CHECK(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 0);
    reader.close();
    box.destroy();
}

#endif
