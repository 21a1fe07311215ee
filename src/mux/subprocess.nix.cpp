#include "./subprocess.hpp"

#include "./log.hpp"
#include "./pipe.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#if !_WIN32

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>

extern char** environ;

using namespace mux;

namespace {

/// Read until `size` bytes arrive or the writer closes. Returns the number of bytes read.
std::size_t read_fully(int fd, void* data, std::size_t size) {
    auto        out   = static_cast<char*>(data);
    std::size_t total = 0;
    while (total < size) {
        auto nread = ::read(fd, out + total, size - total);
        if (nread == 0) {
            break;
        }
        if (nread < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_current_error("Failed to read the spawn status of a child process");
        }
        total += static_cast<std::size_t>(nread);
    }
    return total;
}

void throw_if_error_on_pipe(int error_fd, ::pid_t child) {
    int  child_errno = 0;
    auto nread       = read_fully(error_fd, &child_errno, sizeof child_errno);
    if (nread == 0) {
        // No error
        return;
    }
    std::string message;
    message.resize(1024);
    message.resize(read_fully(error_fd, message.data(), message.size()));
    // The child has already exited. Reap it so it does not linger.
    ::waitpid(child, nullptr, 0);
    throw_for_system_error_code(child_errno, message);
}

/// Write all of `data` from the child. Only async-signal-safe calls are made.
void child_write(int fd, const void* data, std::size_t size) noexcept {
    auto ptr = static_cast<const char*>(data);
    while (size != 0) {
        auto n = ::write(fd, ptr, size);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            return;
        }
        ptr += n;
        size -= static_cast<std::size_t>(n);
    }
}

/**
 * @brief Move a descriptor of the child above the standard streams.
 *
 * A descriptor numbered 0, 1 or 2 would be clobbered by the dup2() of another stream, or left
 * close-on-exec by a dup2() onto itself. The copy is close-on-exec, and replaces `fd`.
 *
 * @return false if the descriptor could not be duplicated
 */
bool lift_above_stdio(int& fd) noexcept {
    if (fd == null_native_handle || fd > STDERR_FILENO) {
        return true;
    }
    const int lifted = ::fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    if (lifted == -1) {
        return false;
    }
    fd = lifted;
    return true;
}

}  // namespace

struct subprocess::impl {
    ::pid_t pid = -1;
    /// Whether the child's stderr was sent into its stdout
    bool stderr_merged = false;

    async_pipe input;
    async_pipe output;
    async_pipe error;
};

subprocess subprocess::spawn(reactor& r, const subprocess_spawn_options& opts) {
    neo_assert(expects,
               !opts.command.empty(),
               "mux::subprocess::spawn(): opts.command cannot be empty",
               opts);
    const auto flags = opts.flags;

    // Everything the child needs is built before fork()
    std::vector<std::string> argv_strings;
    if (has_flag(flags, process_flags::eval_command)) {
        std::string script = opts.command;
        for (auto& arg : opts.args) {
            script.push_back(' ');
            script.append(quote_shell_posix(arg));
        }
        argv_strings = {"/bin/sh", "-c", std::move(script)};
    } else {
        argv_strings.push_back(opts.command);
        argv_strings.insert(argv_strings.end(), opts.args.begin(), opts.args.end());
    }
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*>       envp;
    if (opts.environment) {
        env_strings = environment_strings(*opts.environment);
        for (auto& s : env_strings) {
            envp.push_back(s.data());
        }
        envp.push_back(nullptr);
    }

    const auto cmdline = has_flag(flags, process_flags::eval_command)
        ? argv_strings.back()
        : quote_command_line(argv_strings);
    if (has_flag(flags, process_flags::echo_command)) {
        std::cout << cmdline << std::endl;
    }
    log().debug("Spawning process: {}", cmdline);

    std::string workdir;
    if (opts.working_directory) {
        workdir = opts.working_directory->string();
    }
    std::string chdir_error_message = neo::ufmt("Failed to chdir() into directory [{}]", workdir);
    std::string exec_error_message  = neo::ufmt("exec() failed for executable [{}]", argv_strings[0]);

    // Pipes are created blocking. The child's ends must stay that way, and O_NONBLOCK would be
    // shared with the child through its copy of the descriptor.
    const bool inherit_all = has_flag(flags, process_flags::parent_streams);
    const auto buffer_size
        = has_flag(flags, process_flags::interactive) ? interactive_pipe_buffer_size : 0;
    const bool stderr_to_stdout = has_flag(flags, process_flags::stderr_to_stdout)
        && opts.stderr_handle == null_native_handle;

    pipe_pair in_pipe;
    pipe_pair out_pipe;
    pipe_pair err_pipe;
    int       child_stdin  = opts.stdin_handle;
    int       child_stdout = opts.stdout_handle;
    int       child_stderr = opts.stderr_handle;
    if (child_stdin == null_native_handle && !inherit_all) {
        in_pipe     = create_pipe(pipe_async_ends::writer, buffer_size);
        child_stdin = in_pipe.reader.get();
    }
    if (child_stdout == null_native_handle && !inherit_all) {
        out_pipe     = create_pipe(pipe_async_ends::reader, buffer_size);
        child_stdout = out_pipe.writer.get();
    }
    if (child_stderr == null_native_handle && !inherit_all && !stderr_to_stdout) {
        err_pipe     = create_pipe(pipe_async_ends::reader, buffer_size);
        child_stderr = err_pipe.writer.get();
    }

    auto error_io_pipe = create_pipe();
    const bool use_path = has_flag(flags, process_flags::use_path);

    auto child_pid = ::fork();
    if (child_pid == -1) {
        throw_current_error("::fork() failed in mux::subprocess::spawn()");
    }
    if (child_pid != 0) {
        // We are the parent
        error_io_pipe.writer.close();
        throw_if_error_on_pipe(error_io_pipe.reader.get(), child_pid);

        auto imp = std::make_unique<impl>();
        imp->pid = child_pid;
        imp->stderr_merged = stderr_to_stdout;
        // The child ends close as the pipe_pairs go out of scope
        if (in_pipe.writer.is_open()) {
            imp->input = async_pipe::wrap(r, null_native_handle, in_pipe.writer.release());
        }
        if (out_pipe.reader.is_open()) {
            imp->output = async_pipe::wrap(r, out_pipe.reader.release(), null_native_handle);
        }
        if (err_pipe.reader.is_open()) {
            imp->error = async_pipe::wrap(r, err_pipe.reader.release(), null_native_handle);
        }
        log().debug("Spawned process {}", child_pid);
        return subprocess{imp.release()};
    }

    // We are the child
    int error_fd = error_io_pipe.writer.get();

    auto child_fail = [&](std::string_view message) {
        int err = errno;
        child_write(error_fd, &err, sizeof err);
        child_write(error_fd, message.data(), message.size());
        std::_Exit(127);
    };

    // Our parent may have closed its own stdio, so that any of these were given 0, 1 or 2
    if (!lift_above_stdio(error_fd)) {
        child_fail("Failed to move the spawn status pipe above the standard streams");
    }
    if (!lift_above_stdio(child_stdin) || !lift_above_stdio(child_stdout)
        || !lift_above_stdio(child_stderr)) {
        child_fail("Failed to move a stdio descriptor above the standard streams");
    }

    // dup2 our stdin
    if (child_stdin != null_native_handle && ::dup2(child_stdin, STDIN_FILENO) == -1) {
        child_fail("Failed to dup2() for stdin");
    }
    // dup2 our stdout
    if (child_stdout != null_native_handle && ::dup2(child_stdout, STDOUT_FILENO) == -1) {
        child_fail("Failed to dup2() for stdout");
    }
    // dup2 our stderr
    if (child_stderr != null_native_handle && ::dup2(child_stderr, STDERR_FILENO) == -1) {
        child_fail("Failed to dup2() for stderr");
    }
    // If they want stderr to go into stdout, set that now
    if (stderr_to_stdout && ::dup2(STDOUT_FILENO, STDERR_FILENO) == -1) {
        child_fail("Failed to dup2() for redirecting stderr into stdout");
    }

    // Set our working directory
    if (!workdir.empty() && ::chdir(workdir.data()) == -1) {
        child_fail(chdir_error_message);
    }

    if (opts.environment) {
        environ = envp.data();
    }

    if (use_path) {
        ::execvp(argv[0], argv.data());
    } else {
        ::execv(argv[0], argv.data());
    }

    // We should never get to this line if exec succeeds
    child_fail(exec_error_message);
    std::_Exit(127);
}

async_pipe& subprocess::input_pipe() noexcept { return _impl->input; }
async_pipe& subprocess::output_pipe() noexcept { return _impl->output; }

async_pipe& subprocess::error_pipe() noexcept {
    return _impl->stderr_merged ? _impl->output : _impl->error;
}

bool subprocess::_do_is_running() const {
    ::siginfo_t info;
    info.si_pid   = 0;
    info.si_signo = 0;
    int rc        = ::waitid(P_PID, static_cast<::id_t>(_impl->pid), &info, WNOHANG | WEXITED | WNOWAIT);
    if (rc != 0) {
        throw_current_error("Error checking status of child process");
    }
    if (info.si_signo != 0 or info.si_pid != 0) {
        return false;
    } else {
        return true;
    }
}

void subprocess::_do_try_reap() {
    ::siginfo_t info;
    info.si_pid   = 0;
    info.si_signo = 0;
    int rc        = 0;
    do {
        rc = ::waitid(P_PID, static_cast<::id_t>(_impl->pid), &info, WNOHANG | WEXITED);
    } while (rc == -1 && errno == EINTR);
    if (rc == -1) {
        throw_current_error("::waitid() failed while reaping a child process");
    }
    if (info.si_pid == 0) {
        // Still running
        return;
    }

    if (info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED) {
        _exit_result = subprocess_exit{.exit_code     = 128 + info.si_status,
                                       .signal_number = info.si_status};
    } else if (info.si_code == CLD_EXITED) {
        _exit_result = subprocess_exit{.exit_code = info.si_status};
    } else {
        neo_assert(invariant,
                   false,
                   "Unexpected waitid() child exit state",
                   info.si_status,
                   info.si_errno,
                   info.si_signo,
                   info.si_code);
    }
    log().debug("Process {} exited with {}", _impl->pid, _exit_result->exit_code);
}

void subprocess::_do_suspend() {
    if (::kill(_impl->pid, SIGSTOP) != 0) {
        throw_current_error("::kill() failed to suspend a child process");
    }
}

void subprocess::_do_resume() {
    if (::kill(_impl->pid, SIGCONT) != 0) {
        throw_current_error("::kill() failed to resume a child process");
    }
}

void subprocess::_do_stop(bool force) {
    if (::kill(_impl->pid, force ? SIGKILL : SIGTERM) != 0) {
        throw_current_error("::kill() failed to stop a child process");
    }
}

void subprocess::close() noexcept {
    if (!_impl) {
        return;
    }
    _impl->input.close();
    _impl->output.close();
    _impl->error.close();
}

long subprocess::pid() const noexcept { return static_cast<long>(_impl->pid); }

#endif
