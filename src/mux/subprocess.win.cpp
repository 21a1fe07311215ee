#include "./subprocess.hpp"

#include "./environ.hpp"
#include "./log.hpp"
#include "./syserror.hpp"
#include "./text.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#if _WIN32

#include <windows.h>

#include <iostream>

using namespace mux;

namespace {

std::wstring path_lookup(std::wstring_view program) {
    auto prog = std::filesystem::path(program);
    if (prog.has_parent_path()) {
        return prog.native();
    }
    auto path    = mux::getenv("PATH");
    auto pathext = mux::getenv("PATHEXT");
    if (not path or not pathext) {
        return prog.native();
    }
    std::string remain_path = *path;
    while (!remain_path.empty()) {
        const auto semi_pos = remain_path.find(';');
        const auto cand_dir = std::filesystem::path(wide_encode(remain_path.substr(0, semi_pos)));
        remain_path = semi_pos == remain_path.npos ? "" : remain_path.substr(semi_pos + 1);
        auto cand_basename = cand_dir / prog;
        if (std::filesystem::is_regular_file(cand_basename)) {
            return cand_basename.native();
        }
        std::string remain_ext = *pathext;
        while (not remain_ext.empty()) {
            const auto semi_pos2 = remain_ext.find(';');
            const auto cand_ext  = remain_ext.substr(0, semi_pos2);
            remain_ext = semi_pos2 == remain_ext.npos ? "" : remain_ext.substr(semi_pos2 + 1);
            auto candidate = cand_basename;
            candidate += wide_encode(cand_ext);
            if (std::filesystem::is_regular_file(candidate)) {
                return candidate.native();
            }
        }
    }
    return prog.native();
}

/// Build a CREATE_UNICODE_ENVIRONMENT block: `K=V` strings each ending in a null, then a null
std::wstring environment_block(const environment_map& env) {
    std::wstring block;
    for (auto& entry : environment_strings(env)) {
        block.append(wide_encode(entry));
        block.push_back(L'\0');
    }
    if (block.empty()) {
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

}  // namespace

struct subprocess::impl {
    ::PROCESS_INFORMATION proc_info = {};
    /// A 32-bit child of a 64-bit parent, whose thread needs Wow64SuspendThread()
    bool is_wow64 = false;
    /// Whether the child's stderr was sent into its stdout
    bool stderr_merged = false;

    async_pipe input;
    async_pipe output;
    async_pipe error;

    void close_handles() noexcept {
        for (auto h : {&proc_info.hProcess, &proc_info.hThread}) {
            if (*h) {
                ::CloseHandle(*h);
                *h = nullptr;
            }
        }
    }
};

subprocess subprocess::spawn(reactor& r, const subprocess_spawn_options& opts) {
    neo_assert(expects,
               !opts.command.empty(),
               "mux::subprocess::spawn(): opts.command cannot be empty",
               opts);
    const auto flags = opts.flags;
    const bool eval  = has_flag(flags, process_flags::eval_command);

    std::string cmd_str;
    if (eval) {
        cmd_str = opts.command;
        for (auto& arg : opts.args) {
            cmd_str.push_back(' ');
            cmd_str.append(quote_argv_windows(arg));
        }
    } else {
        cmd_str = quote_argv_windows(opts.command);
        for (auto& arg : opts.args) {
            cmd_str.push_back(' ');
            cmd_str.append(quote_argv_windows(arg));
        }
    }
    auto cmd_wide = wide_encode(cmd_str);

    // With no application name, CreateProcessW() takes the program from the command line
    std::wstring program;
    if (!eval) {
        program = wide_encode(opts.command);
        if (has_flag(flags, process_flags::use_path)) {
            program = path_lookup(program);
        }
    }

    if (has_flag(flags, process_flags::echo_command)) {
        std::cout << cmd_str << std::endl;
    }
    log().debug("Spawning process: {}", cmd_str);

    const bool inherit_all = has_flag(flags, process_flags::parent_streams);
    const auto buffer_size
        = has_flag(flags, process_flags::interactive) ? interactive_pipe_buffer_size : 0;
    const bool stderr_to_stdout = has_flag(flags, process_flags::stderr_to_stdout)
        && opts.stderr_handle == null_native_handle;

    auto imp           = std::make_unique<impl>();
    imp->stderr_merged = stderr_to_stdout;

    // The child's ends are synchronous. Only the parent's ends are opened for overlapped I/O.
    pipe_pair in_pipe;
    pipe_pair out_pipe;
    pipe_pair err_pipe;
    HANDLE    child_stdin  = opts.stdin_handle;
    HANDLE    child_stdout = opts.stdout_handle;
    HANDLE    child_stderr = opts.stderr_handle;
    if (child_stdin == null_native_handle) {
        if (inherit_all) {
            child_stdin = ::GetStdHandle(STD_INPUT_HANDLE);
        } else {
            in_pipe     = create_pipe(pipe_async_ends::writer, buffer_size);
            child_stdin = in_pipe.reader.get();
        }
    }
    if (child_stdout == null_native_handle) {
        if (inherit_all) {
            child_stdout = ::GetStdHandle(STD_OUTPUT_HANDLE);
        } else {
            out_pipe     = create_pipe(pipe_async_ends::reader, buffer_size);
            child_stdout = out_pipe.writer.get();
        }
    }
    if (stderr_to_stdout) {
        child_stderr = child_stdout;
    } else if (child_stderr == null_native_handle) {
        if (inherit_all) {
            child_stderr = ::GetStdHandle(STD_ERROR_HANDLE);
        } else {
            err_pipe     = create_pipe(pipe_async_ends::reader, buffer_size);
            child_stderr = err_pipe.writer.get();
        }
    }
    for (auto h : {child_stdin, child_stdout, child_stderr}) {
        if (h != null_native_handle && h != nullptr) {
            set_inheritable(h, true);
        }
    }

    ::STARTUPINFOW startup_info = {};
    startup_info.cb             = sizeof startup_info;
    startup_info.dwFlags        = STARTF_USESTDHANDLES;
    startup_info.hStdInput      = child_stdin;
    startup_info.hStdOutput     = child_stdout;
    startup_info.hStdError      = child_stderr;

    std::wstring env_block;
    if (opts.environment) {
        env_block = environment_block(*opts.environment);
    }
    std::wstring workdir;
    if (opts.working_directory) {
        workdir = opts.working_directory->native();
    }

    DWORD creation_flags = NORMAL_PRIORITY_CLASS | CREATE_UNICODE_ENVIRONMENT;
    if (has_flag(flags, process_flags::no_window)) {
        creation_flags |= CREATE_NO_WINDOW;
    }

    BOOL okay = ::CreateProcessW(program.empty() ? nullptr : program.data(),
                                 cmd_wide.data(),
                                 nullptr,
                                 nullptr,
                                 TRUE,
                                 creation_flags,
                                 opts.environment ? env_block.data() : nullptr,
                                 workdir.empty() ? nullptr : workdir.c_str(),
                                 &startup_info,
                                 &imp->proc_info);
    if (!okay) {
        throw_current_error(neo::ufmt("::CreateProcessW() failed for [{}]", cmd_str));
    }

    if constexpr (sizeof(void*) == 8) {
        BOOL wow64 = FALSE;
        if (!::IsWow64Process(imp->proc_info.hProcess, &wow64)) {
            auto err = static_cast<int>(::GetLastError());
            ::TerminateProcess(imp->proc_info.hProcess, 1);
            throw_for_system_error_code(err, "::IsWow64Process() failed for a new child process");
        }
        imp->is_wow64 = wow64 != FALSE;
    }

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
    log().debug("Spawned process {}", imp->proc_info.dwProcessId);
    return subprocess{imp.release()};
}

async_pipe& subprocess::input_pipe() noexcept { return _impl->input; }
async_pipe& subprocess::output_pipe() noexcept { return _impl->output; }

async_pipe& subprocess::error_pipe() noexcept {
    return _impl->stderr_merged ? _impl->output : _impl->error;
}

bool subprocess::_do_is_running() const {
    neo_assert(expects,
               _impl->proc_info.hProcess != nullptr,
               "The process handle of a subprocess was used after close()");
    const auto ret = ::WaitForSingleObject(_impl->proc_info.hProcess, 0);
    if (ret == WAIT_FAILED) {
        throw_current_error("::WaitForSingleObject() failed checking a child process");
    }
    return ret == WAIT_TIMEOUT;
}

void subprocess::_do_try_reap() {
    if (_do_is_running()) {
        return;
    }
    DWORD rc = 0;
    if (!::GetExitCodeProcess(_impl->proc_info.hProcess, &rc)) {
        throw_current_error("::GetExitCodeProcess() failed in mux::subprocess::peek_exit_code()");
    }
    _exit_result = subprocess_exit{.exit_code = static_cast<int>(rc)};
    log().debug("Process {} exited with {}", _impl->proc_info.dwProcessId, _exit_result->exit_code);
}

void subprocess::_do_suspend() {
    const DWORD prior = _impl->is_wow64 ? ::Wow64SuspendThread(_impl->proc_info.hThread)
                                        : ::SuspendThread(_impl->proc_info.hThread);
    if (prior == static_cast<DWORD>(-1)) {
        throw_current_error("Failed to suspend the main thread of a child process");
    }
}

void subprocess::_do_resume() {
    if (::ResumeThread(_impl->proc_info.hThread) == static_cast<DWORD>(-1)) {
        throw_current_error("::ResumeThread() failed for a child process");
    }
}

void subprocess::_do_stop(bool) {
    if (!::TerminateProcess(_impl->proc_info.hProcess, 1)) {
        auto err = static_cast<int>(::GetLastError());
        // The process may have exited since it was last checked
        if (!_do_is_running()) {
            return;
        }
        throw_for_system_error_code(err, "::TerminateProcess() failed");
    }
}

void subprocess::close() noexcept {
    if (!_impl) {
        return;
    }
    _impl->input.close();
    _impl->output.close();
    _impl->error.close();
    _impl->close_handles();
}

long subprocess::pid() const noexcept { return static_cast<long>(_impl->proc_info.dwProcessId); }

#endif
