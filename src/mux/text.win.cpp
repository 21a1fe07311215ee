#include "./text.hpp"

#include "./syserror.hpp"

#if _WIN32

#include <windows.h>

using namespace mux;

std::wstring mux::wide_encode(std::string_view u8) {
    if (u8.empty()) {
        return {};
    }
    const int in_len = static_cast<int>(u8.size());
    int       n      = ::MultiByteToWideChar(CP_UTF8, 0, u8.data(), in_len, nullptr, 0);
    if (n <= 0) {
        throw_current_error("::MultiByteToWideChar() failed to measure a UTF-8 string");
    }
    std::wstring ret;
    ret.resize(static_cast<std::size_t>(n));
    n = ::MultiByteToWideChar(CP_UTF8, 0, u8.data(), in_len, ret.data(), n);
    if (n <= 0) {
        throw_current_error("::MultiByteToWideChar() failed to convert a UTF-8 string");
    }
    return ret;
}

std::string mux::narrow_encode(std::wstring_view wide) {
    if (wide.empty()) {
        return {};
    }
    const int in_len = static_cast<int>(wide.size());
    int n = ::WideCharToMultiByte(CP_UTF8, 0, wide.data(), in_len, nullptr, 0, nullptr, nullptr);
    if (n <= 0) {
        throw_current_error("::WideCharToMultiByte() failed to measure a wide string");
    }
    std::string ret;
    ret.resize(static_cast<std::size_t>(n));
    n = ::WideCharToMultiByte(CP_UTF8, 0, wide.data(), in_len, ret.data(), n, nullptr, nullptr);
    if (n <= 0) {
        throw_current_error("::WideCharToMultiByte() failed to convert a wide string");
    }
    return ret;
}

#endif
