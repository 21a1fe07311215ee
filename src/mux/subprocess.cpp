#include "./subprocess.hpp"

#include "./log.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>

using namespace mux;

void subprocess::_destroy() noexcept {
    if (_impl) {
        close();
        delete _impl;
        _impl = nullptr;
    }
}

bool subprocess::running() const {
    _expect_open();
    return !_exit_result.has_value() and _do_is_running();
}

int subprocess::peek_exit_code() {
    _expect_open();
    if (!_exit_result) {
        _do_try_reap();
    }
    return _exit_result ? _exit_result->exit_code : -1;
}

void subprocess::suspend() {
    _expect_open();
    neo_assertion_breadcrumbs("Suspending a subprocess", pid());
    _do_suspend();
}

void subprocess::resume() {
    _expect_open();
    neo_assertion_breadcrumbs("Resuming a subprocess", pid());
    _do_resume();
}

void subprocess::terminate() {
    _expect_open();
    if (!running()) {
        return;
    }
    _do_stop(false);
}

void subprocess::kill() {
    _expect_open();
    if (_exit_result) {
        log().debug("Not killing process {}: it has already exited", pid());
        return;
    }
    _do_stop(true);
}

subprocess_failure::subprocess_failure(int exit_code, int signo) noexcept
    : runtime_error(signo ? neo::ufmt("Subprocess was terminated by signal {}", signo)
                          : neo::ufmt("Subprocess exited [{}]", exit_code))
    , _exit_code(exit_code)
    , _signal_number(signo) {}

std::string mux::quote_argv_windows(std::string_view arg) {
    const bool needs_quotes = arg.empty() || arg.find_first_of(" \t") != arg.npos;
    std::string ret;
    if (needs_quotes) {
        ret.push_back('"');
    }
    std::size_t n_backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++n_backslashes;
        } else if (c == '"') {
            // Backslashes before a quote are escapes, and so is the one we add
            ret.append(n_backslashes * 2 + 1, '\\');
            ret.push_back('"');
            n_backslashes = 0;
        } else {
            ret.append(n_backslashes, '\\');
            ret.push_back(c);
            n_backslashes = 0;
        }
    }
    ret.append(n_backslashes, '\\');
    if (needs_quotes) {
        // Double the trailing backslashes so they do not escape the closing quote
        ret.append(n_backslashes, '\\');
        ret.push_back('"');
    }
    return ret;
}

namespace {

bool is_shell_safe(char c) noexcept {
    constexpr std::string_view okay_chars = "%+-./_:=@";
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || okay_chars.find(c) != okay_chars.npos;
}

}  // namespace

std::string mux::quote_shell_posix(std::string_view arg) {
    if (arg.empty()) {
        return "''";
    }
    if (std::all_of(arg.begin(), arg.end(), is_shell_safe)) {
        return std::string(arg);
    }
    std::string ret = "'";
    for (char c : arg) {
        if (c == '\'') {
            ret.append("'\"'\"'");
        } else {
            ret.push_back(c);
        }
    }
    ret.push_back('\'');
    return ret;
}
