#include "./environ.hpp"

#include "./text.hpp"

using namespace mux;

std::vector<std::string> mux::environment_strings(const environment_map& env) {
    std::vector<std::string> ret;
    ret.reserve(env.size());
    for (auto& [key, value] : env) {
        ret.push_back(key + "=" + value);
    }
    return ret;
}

#if !_WIN32

#include <cstdlib>

std::optional<std::string> mux::getenv(std::string_view key) noexcept {
    auto ptr = std::getenv(std::string(key).c_str());
    if (ptr) {
        return std::make_optional(std::string(ptr));
    } else {
        return std::nullopt;
    }
}

#else

#include <windows.h>

namespace {

std::optional<std::wstring> getenv_wstr(std::wstring const& varname, std::size_t size_hint = 256) {
    std::wstring ret;
    ret.resize(size_hint);
    while (true) {
        auto real_len
            = ::GetEnvironmentVariableW(varname.data(), ret.data(), static_cast<DWORD>(ret.size()));
        if (real_len == 0 && ::GetLastError() == ERROR_ENVVAR_NOT_FOUND) {
            // Environment variable is not defined
            return std::nullopt;
        } else if (real_len > ret.size()) {
            // Try again, with a larger buffer
            ret.resize(real_len);
            continue;
        } else {
            ret.resize(real_len);
            return ret;
        }
    }
}

}  // namespace

std::optional<std::string> mux::getenv(std::string_view key) noexcept {
    std::optional<std::wstring> val = getenv_wstr(wide_encode(key));
    if (!val) {
        return std::nullopt;
    }
    return narrow_encode(*val);
}

#endif
