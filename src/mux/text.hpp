#pragma once

#include <string>
#include <string_view>

namespace mux {

/**
 * @brief Convert UTF-8 to the platform's wide encoding (UTF-16 on Windows)
 *
 * @note Only available on Windows, where the wide Win32 APIs require it
 */
std::wstring wide_encode(std::string_view u8);

/**
 * @brief Convert the platform's wide encoding to UTF-8
 */
std::string narrow_encode(std::wstring_view wide);

}  // namespace mux
