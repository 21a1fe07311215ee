#include "./syserror.hpp"

#include <string>

using namespace mux;

std::error_code mux::get_current_error_code() noexcept {
    return make_system_error_code(get_current_error());
}

void mux::throw_for_system_error_code(int error, std::string_view message) {
    throw std::system_error(make_system_error_code(error), std::string(message));
}

void mux::throw_current_error(std::string_view message) {
    throw_for_system_error_code(get_current_error(), message);
}
