#pragma once

#include "./environ.hpp"
#include "./native_handle.hpp"
#include "./pipe.hpp"
#include "./reactor.hpp"
#include "./subprocess_fwd.hpp"

#include <neo/assert.hpp>
#include <neo/platform.hpp>

#include <concepts>
#include <filesystem>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mux {

/**
 * @brief Options that control how a subprocess is started. Combine with `|`.
 */
enum class process_flags : unsigned {
    none = 0,
    /// Print the command line to stdout before starting the process
    echo_command = 1 << 0,
    /// Search the PATH for the executable
    use_path = 1 << 1,
    /// Give the command to the system shell verbatim. The caller must trust the command string.
    eval_command = 1 << 2,
    /// Send the child's stderr into its stdout stream
    stderr_to_stdout = 1 << 3,
    /// The child uses the parent's stdio streams. No pipes are created.
    parent_streams = 1 << 4,
    /// Use small pipe buffers, trading throughput for responsiveness
    interactive = 1 << 5,
    /// Do not create a console window for the child (Windows)
    no_window = 1 << 6,
};

constexpr process_flags operator|(process_flags a, process_flags b) noexcept {
    return static_cast<process_flags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr process_flags operator&(process_flags a, process_flags b) noexcept {
    return static_cast<process_flags>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

/// Determine whether `flags` contains every flag in `f`
constexpr bool has_flag(process_flags flags, process_flags f) noexcept {
    return (flags & f) == f;
}

/// The pipe buffer size requested for the `interactive` flag
inline constexpr std::size_t interactive_pipe_buffer_size = 4096;

class subprocess_failure : public std::runtime_error {
    int _exit_code;
    int _signal_number;

public:
    /**
     * @brief Construct a new subprocess failure exception
     *
     * @param exit_code The exit code of the subprocess
     * @param signal_number The signal number that caused the subprocess to terminate, or zero if it
     * exited normally
     */
    explicit subprocess_failure(int exit_code, int signal_number) noexcept;

    /**
     * @brief The exit code of the associated process
     */
    int exit_code() const noexcept { return _exit_code; }

    /**
     * @brief The terminating signal number of the associated process
     */
    int signal_number() const noexcept { return _signal_number; }
};

struct subprocess_exit {
    /// The return value of `main()`, or the parameter given to a process 'exit' function. 128 + N
    /// if the process was terminated by signal N.
    int exit_code = 0;
    /// The signal number that caused the process to terminate. Zero if the process exited normally
    int signal_number = 0;

    /// Whether the process exited normally with exit_code of zero
    bool successful() const noexcept { return signal_number == 0 and exit_code == 0; }

    /// If the exit result is not a succcess, throws a @see subprocess_failure
    void throw_if_error() const {
        if (not successful()) {
            throw subprocess_failure(exit_code, signal_number);
        }
    }

    friend void do_repr(auto out, const subprocess_exit* self) noexcept {
        out.type("mux::subprocess_exit");
        if (self) {
            if (self->signal_number != 0) {
                out.bracket_value("signal_number={}", self->signal_number);
            } else if (self->exit_code) {
                out.bracket_value("exit_code={}", self->exit_code);
            } else {
                out.bracket_value("exited zero");
            }
        }
    }
};

struct subprocess_spawn_options {
    /**
     * @brief The program to execute.
     *
     * With `process_flags::eval_command`, this is a shell command line instead, given to the
     * system shell unchanged.
     */
    std::string command;

    /**
     * @brief Arguments passed to the program after its name.
     *
     * With `process_flags::eval_command`, these are quoted and appended to the command line.
     */
    std::vector<std::string> args{};

    /**
     * @brief The working directory of the new subprocess, or nullopt.
     *
     * If not provided, the child process will inherit the working directory of
     * the caller.
     */
    std::optional<std::filesystem::path> working_directory{};

    /**
     * @brief The complete environment of the new subprocess, or nullopt to inherit the caller's
     */
    std::optional<environment_map> environment{};

    /// Startup options
    process_flags flags = process_flags::stderr_to_stdout;

    /**
     * @brief Handles to use as the child's stdio streams in place of new pipes.
     *
     * The caller keeps ownership. No pipe is created for a stream given here, and the matching
     * pipe accessor of the subprocess returns a pipe with no open ends. A given stderr handle
     * takes precedence over `process_flags::stderr_to_stdout`.
     */
    native_handle_t stdin_handle  = null_native_handle;
    native_handle_t stdout_handle = null_native_handle;
    native_handle_t stderr_handle = null_native_handle;

    friend void do_repr(auto out, const subprocess_spawn_options* self) noexcept {
        out.type("mux::subprocess_spawn_options");
        if (self) {
            out.append("{command={}, args={}",
                       out.repr_value(self->command),
                       out.repr_value(self->args));
            if (self->working_directory) {
                out.append(", working_directory={}", out.repr_value(self->working_directory));
            }
            out.append(", flags={}}", static_cast<unsigned>(self->flags));
        }
    }
};

/**
 * @brief Supervise a child process and own the parent ends of its stdio pipes.
 *
 * The pipes are async_pipe objects driven by the reactor given to spawn(). Lifecycle queries and
 * controls act on the OS process directly.
 */
class subprocess {
    /// The per-platform implementation of the subprocess
    struct impl;
    impl* _impl = nullptr;

    /// The exit result, once the subprocess has been reaped
    std::optional<subprocess_exit> _exit_result;

    /// Construct a subprocess that adopts the given per-platform impl data
    explicit subprocess(impl* h) noexcept
        : _impl(h) {}

    /// Close and release the impl, if any
    void _destroy() noexcept;

    /// Per-platform impl of running()
    bool _do_is_running() const;
    /// Per-platform: reap the process if it has exited, setting _exit_result
    void _do_try_reap();
    /// Per-platform impl of suspend()
    void _do_suspend();
    /// Per-platform impl of resume()
    void _do_resume();
    /// Per-platform impl of terminate() and kill()
    void _do_stop(bool force);

    void _expect_open() const noexcept {
        neo_assert(expects,
                   _impl != nullptr,
                   "A lifecycle operation was used on a moved-from mux::subprocess");
    }

public:
    /// Closes all pipes and handles. Does not wait for or stop the child.
    ~subprocess() { _destroy(); }

    /// Move construct
    subprocess(subprocess&& o) noexcept { *this = std::move(o); }

    /// Move-assign
    subprocess& operator=(subprocess&& o) noexcept {
        _destroy();
        _impl        = std::exchange(o._impl, nullptr);
        _exit_result = std::exchange(o._exit_result, std::nullopt);
        return *this;
    }

    /**
     * @brief Spawn a new subprocess and return a handle to that process
     *
     * @param r The reactor that will drive the subprocess's pipes
     * @param opts The startup parameters for the subprocess
     *
     * @throws std::system_error if the process cannot be started, including when the executable
     * cannot be found or the working directory does not exist
     */
    [[nodiscard]] static subprocess spawn(reactor& r, const subprocess_spawn_options& opts);

    /**
     * @brief The parent end of the child's stdin. Writing to it feeds the child.
     */
    [[nodiscard]] async_pipe& input_pipe() noexcept;

    /**
     * @brief The parent end of the child's stdout.
     */
    [[nodiscard]] async_pipe& output_pipe() noexcept;

    /**
     * @brief The parent end of the child's stderr. The same object as output_pipe() when stderr
     * is merged into stdout.
     */
    [[nodiscard]] async_pipe& error_pipe() noexcept;

    /// Check whether the child is still running. Does not reap it.
    [[nodiscard]] bool running() const;

    /**
     * @brief Get the exit code of the child without blocking.
     *
     * @return -1 while the child runs. Afterwards, its exit code, which is 128 + N if it was
     * terminated by signal N. Once known, the exit code is cached and no OS query is made.
     */
    [[nodiscard]] int peek_exit_code();

    /**
     * @brief Obtain the subprocess_exit result of this process, or nullopt if it has not yet
     * been observed to exit.
     */
    [[nodiscard]] const std::optional<subprocess_exit>& exit_result() const noexcept {
        return _exit_result;
    }

    /// Stop the child from running until resume() is called
    void suspend();
    /// Let a suspended child continue
    void resume();
    /// Ask the child to stop. Does nothing if it is no longer running.
    void terminate();
    /// Forcibly stop the child. Does nothing once its exit has been observed.
    void kill();

    /// Release the pipes and OS handles. Safe to call more than once.
    void close() noexcept;

    /// The OS process ID of the child
    [[nodiscard]] long pid() const noexcept;
};

/**
 * @brief Quote an argument for a Windows command line, as parsed by the C runtime.
 *
 * Arguments that are empty or contain a space or tab are wrapped in double quotes. Embedded
 * double quotes are escaped, with any backslashes before them doubled.
 */
std::string quote_argv_windows(std::string_view arg);

/**
 * @brief Quote an argument for a POSIX shell.
 *
 * An argument made only of letters, digits and `%+-./_:=@` is returned unchanged. Any other is
 * wrapped in single quotes.
 */
std::string quote_shell_posix(std::string_view arg);

/// Quote an argument for the shell of the current platform
inline std::string quote_shell(std::string_view arg) {
    return neo::os_is_windows ? quote_argv_windows(arg) : quote_shell_posix(arg);
}

/**
 * @brief Quote each argument for the current platform and join them with spaces
 */
template <std::ranges::input_range R>
requires std::convertible_to<std::ranges::range_value_t<R>, std::string_view>  //
    std::string quote_command_line(R&& r) {
    std::string acc;
    for (std::string_view arg : r) {
        acc.append(quote_shell(arg));
        acc.push_back(' ');
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

}  // namespace mux
