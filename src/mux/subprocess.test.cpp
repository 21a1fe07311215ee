#include "./subprocess.hpp"

#include "./event_loop.hpp"

#include <catch2/catch.hpp>

#include <neo/platform.hpp>

#include <filesystem>
#include <optional>
#include <thread>

#if !_WIN32
#include <signal.h>
#include <unistd.h>
#endif

using namespace std::chrono_literals;

namespace {

/// Read until end-of-stream, returning everything that arrived
std::string read_all(mux::event_loop& loop, mux::async_pipe& pipe) {
    std::string acc;
    std::string buf(1024, '\0');
    while (true) {
        auto n = mux::wait(loop, pipe.read_some(neo::as_buffer(buf)));
        if (n == 0) {
            return acc;
        }
        acc.append(buf.data(), n);
    }
}

/// Poll until the process exits, then return its exit code
int wait_exit(mux::subprocess& proc) {
    while (proc.peek_exit_code() == -1) {
        std::this_thread::sleep_for(5ms);
    }
    return proc.peek_exit_code();
}

}  // namespace

TEST_CASE("Quote arguments for a Windows command line") {
    CHECK(mux::quote_argv_windows("plain") == "plain");
    CHECK(mux::quote_argv_windows("") == "\"\"");
    CHECK(mux::quote_argv_windows("two words") == "\"two words\"");
    CHECK(mux::quote_argv_windows("tab\there") == "\"tab\there\"");
    CHECK(mux::quote_argv_windows("say \"hi\"") == "\"say \\\"hi\\\"\"");
    CHECK(mux::quote_argv_windows("a\\b") == "a\\b");
    CHECK(mux::quote_argv_windows("a\\\"b") == "a\\\\\\\"b");
    CHECK(mux::quote_argv_windows("C:\\Program Files\\") == "\"C:\\Program Files\\\\\"");
    CHECK(mux::quote_argv_windows("trailing\\") == "trailing\\");
}

TEST_CASE("Quote arguments for a POSIX shell") {
    CHECK(mux::quote_shell_posix("") == "''");
    CHECK(mux::quote_shell_posix("simple") == "simple");
    CHECK(mux::quote_shell_posix("a/b.c_d-e+f%g:h=i@j") == "a/b.c_d-e+f%g:h=i@j");
    CHECK(mux::quote_shell_posix("two words") == "'two words'");
    CHECK(mux::quote_shell_posix("$HOME") == "'$HOME'");
    CHECK(mux::quote_shell_posix("it's") == "'it'\"'\"'s'");
    CHECK(mux::quote_shell_posix("a,b") == "'a,b'");
}

TEST_CASE("Join a quoted command line") {
    std::vector<std::string> argv = {"prog", "a b", "c"};
    if (neo::os_is_windows) {
        CHECK(mux::quote_command_line(argv) == "prog \"a b\" c");
    } else {
        CHECK(mux::quote_command_line(argv) == "prog 'a b' c");
    }
    CHECK(mux::quote_command_line(std::vector<std::string>{}) == "");
}

TEST_CASE("Process flags combine") {
    auto flags = mux::process_flags::use_path | mux::process_flags::interactive;
    CHECK(mux::has_flag(flags, mux::process_flags::use_path));
    CHECK(mux::has_flag(flags, mux::process_flags::interactive));
    CHECK_FALSE(mux::has_flag(flags, mux::process_flags::stderr_to_stdout));
    CHECK(mux::subprocess_spawn_options{}.flags == mux::process_flags::stderr_to_stdout);
}

#if !_WIN32

TEST_CASE("Read the output of a child to end-of-stream") {
    mux::event_loop loop;
    auto proc = mux::subprocess::spawn(loop, {.command = "/bin/echo", .args = {"hello"}});
    CHECK(proc.pid() > 0);
    CHECK(read_all(loop, proc.output_pipe()) == "hello\n");
    CHECK(wait_exit(proc) == 0);
    CHECK(proc.exit_result()->successful());
    proc.close();
}

TEST_CASE("The exit code is observed and cached") {
    mux::event_loop loop;
    auto            proc
        = mux::subprocess::spawn(loop, {.command = "/bin/sh", .args = {"-c", "exit 42"}});
    while (proc.running()) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(proc.peek_exit_code() == 42);
    // The child is reaped. This answer comes from the cache.
    CHECK(proc.peek_exit_code() == 42);
    REQUIRE(proc.exit_result().has_value());
    CHECK(proc.exit_result()->exit_code == 42);
    CHECK(proc.exit_result()->signal_number == 0);
    CHECK_FALSE(proc.running());

    try {
        proc.exit_result()->throw_if_error();
        FAIL_CHECK("No exception was thrown");
    } catch (const mux::subprocess_failure& e) {
        CHECK(e.exit_code() == 42);
        CHECK(e.signal_number() == 0);
    }

    // Neither does anything once the exit is known
    proc.terminate();
    proc.kill();
}

TEST_CASE("Terminate a running child") {
    mux::event_loop loop;
    auto proc = mux::subprocess::spawn(loop, {.command = "/bin/sleep", .args = {"10"}});
    CHECK(proc.running());
    CHECK(proc.peek_exit_code() == -1);
    proc.terminate();
    CHECK(wait_exit(proc) == 128 + SIGTERM);
    CHECK(proc.exit_result()->signal_number == SIGTERM);
}

TEST_CASE("Kill a running child") {
    mux::event_loop loop;
    auto proc = mux::subprocess::spawn(loop, {.command = "/bin/sleep", .args = {"10"}});
    proc.kill();
    CHECK(wait_exit(proc) == 128 + SIGKILL);
    proc.kill();
}

TEST_CASE("Feed a child through its stdin") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop, {.command = "/bin/cat"});
    REQUIRE(proc.input_pipe().has_writer());
    CHECK_FALSE(proc.input_pipe().has_reader());
    mux::wait(loop, proc.input_pipe().write(std::string("Hello!")));
    proc.input_pipe().close_write();
    CHECK(read_all(loop, proc.output_pipe()) == "Hello!");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("Feed a child through its stdin while our own stdin is closed") {
    mux::event_loop loop;
    // The child's stdin pipe will be handed descriptor 0
    const int saved_stdin = ::dup(STDIN_FILENO);
    REQUIRE(saved_stdin != -1);
    ::close(STDIN_FILENO);
    std::optional<mux::subprocess> proc;
    try {
        proc.emplace(mux::subprocess::spawn(loop, {.command = "/bin/cat"}));
    } catch (const std::system_error&) {
        ::dup2(saved_stdin, STDIN_FILENO);
        ::close(saved_stdin);
        throw;
    }
    ::dup2(saved_stdin, STDIN_FILENO);
    ::close(saved_stdin);

    mux::wait(loop, proc->input_pipe().write(std::string("hello")));
    proc->input_pipe().close_write();
    CHECK(read_all(loop, proc->output_pipe()) == "hello");
    CHECK(wait_exit(*proc) == 0);
}

TEST_CASE("Merged and separate stderr") {
    mux::event_loop loop;
    const std::vector<std::string> args = {"-c", "echo out; echo err 1>&2"};

    SECTION("Merged by default") {
        auto proc = mux::subprocess::spawn(loop, {.command = "/bin/sh", .args = args});
        CHECK(&proc.error_pipe() == &proc.output_pipe());
        CHECK(read_all(loop, proc.output_pipe()) == "out\nerr\n");
        wait_exit(proc);
        // Closing skips the shared pipe the second time around
        proc.close();
        proc.close();
    }

    SECTION("Separate streams") {
        auto proc = mux::subprocess::spawn(loop,
                                           {
                                               .command = "/bin/sh",
                                               .args    = args,
                                               .flags   = mux::process_flags::none,
                                           });
        CHECK(&proc.error_pipe() != &proc.output_pipe());
        CHECK(read_all(loop, proc.output_pipe()) == "out\n");
        CHECK(read_all(loop, proc.error_pipe()) == "err\n");
        wait_exit(proc);
    }
}

TEST_CASE("Give a child its own environment") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command     = "/bin/sh",
                                           .args        = {"-c", "echo \"$MUX_TEST_VAR\""},
                                           .environment = mux::environment_map{
                                               {"MUX_TEST_VAR", "forty-two"},
                                           },
                                       });
    CHECK(read_all(loop, proc.output_pipe()) == "forty-two\n");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("Start a child in another directory") {
    mux::event_loop loop;
    auto            dir  = std::filesystem::canonical(std::filesystem::temp_directory_path());
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command           = "/bin/sh",
                                           .args              = {"-c", "pwd -P"},
                                           .working_directory = dir,
                                       });
    CHECK(read_all(loop, proc.output_pipe()) == dir.string() + "\n");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("Find a program on the PATH") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command = "echo",
                                           .args    = {"found"},
                                           .flags   = mux::process_flags::use_path
                                               | mux::process_flags::stderr_to_stdout,
                                       });
    CHECK(read_all(loop, proc.output_pipe()) == "found\n");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("Run a command through the shell") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command = "echo $((6 * 7))",
                                           .args    = {"a b"},
                                           .flags   = mux::process_flags::eval_command
                                               | mux::process_flags::stderr_to_stdout,
                                       });
    CHECK(read_all(loop, proc.output_pipe()) == "42 a b\n");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("Spawn failures are reported to the caller") {
    mux::event_loop loop;
    try {
        auto proc = mux::subprocess::spawn(loop, {.command = "/this-exe-does-not-exist"});
        FAIL_CHECK("No-executable test did not fail");
    } catch (const std::system_error& e) {
        CHECK(e.code() == std::errc::no_such_file_or_directory);
    }

    // Without PATH lookup, a bare name is not searched for
    CHECK_THROWS_AS(mux::subprocess::spawn(loop, {.command = "echo"}), std::system_error);

    CHECK_THROWS_AS(mux::subprocess::spawn(loop,
                                           {
                                               .command           = "/bin/echo",
                                               .working_directory = "/this/dir/does/not/exist",
                                           }),
                    std::system_error);
}

TEST_CASE("Use the parent's streams") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command = "/bin/sh",
                                           .args    = {"-c", "exit 3"},
                                           .flags   = mux::process_flags::parent_streams,
                                       });
    CHECK_FALSE(proc.input_pipe().has_writer());
    CHECK_FALSE(proc.output_pipe().has_reader());
    CHECK_FALSE(proc.error_pipe().has_reader());
    CHECK(wait_exit(proc) == 3);
}

TEST_CASE("Use caller-provided stdio handles") {
    mux::event_loop loop;
    auto            raw  = mux::create_pipe();
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command       = "/bin/echo",
                                           .args          = {"redirected"},
                                           .stdout_handle = raw.writer.get(),
                                       });
    CHECK_FALSE(proc.output_pipe().has_reader());
    raw.writer.close();
    CHECK(wait_exit(proc) == 0);

    auto pipe = mux::async_pipe::wrap(loop, raw.reader.release(), mux::null_native_handle);
    CHECK(read_all(loop, pipe) == "redirected\n");
}

TEST_CASE("Suspend and resume a child") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(
        loop,
        {
            .command = "/bin/sh",
            .args    = {"-c", "while true; do echo tick; sleep 0.05; done"},
            .flags = mux::process_flags::interactive | mux::process_flags::stderr_to_stdout,
        });
    auto&       out = proc.output_pipe();
    std::string buf(256, '\0');

    auto rd = out.read_some(neo::as_buffer(buf));
    REQUIRE(mux::wait_for(loop, rd, 5000ms));
    CHECK(rd.get() > 0);

    proc.suspend();
    // Drain anything written before the suspension took hold
    rd = out.read_some(neo::as_buffer(buf));
    while (mux::wait_for(loop, rd, 200ms)) {
        REQUIRE(rd.get() > 0);
        rd = out.read_some(neo::as_buffer(buf));
    }
    CHECK_FALSE(mux::wait_for(loop, rd, 300ms));
    CHECK(proc.running());

    proc.resume();
    REQUIRE(mux::wait_for(loop, rd, 5000ms));
    CHECK(rd.get() > 0);

    proc.kill();
    CHECK(wait_exit(proc) == 128 + SIGKILL);
}

#else

TEST_CASE("Read the output of a child to end-of-stream") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command = "cmd.exe",
                                           .args    = {"/c", "echo hello"},
                                           .flags   = mux::process_flags::use_path
                                               | mux::process_flags::stderr_to_stdout
                                               | mux::process_flags::no_window,
                                       });
    CHECK(read_all(loop, proc.output_pipe()) == "hello\r\n");
    CHECK(wait_exit(proc) == 0);
}

TEST_CASE("The exit code is observed and cached") {
    mux::event_loop loop;
    auto            proc = mux::subprocess::spawn(loop,
                                       {
                                           .command = "cmd.exe",
                                           .args    = {"/c", "exit 42"},
                                           .flags   = mux::process_flags::use_path,
                                       });
    while (proc.running()) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(proc.peek_exit_code() == 42);
    CHECK(proc.peek_exit_code() == 42);
    proc.kill();
}

#endif
