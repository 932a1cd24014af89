#include <retrieve/error.hpp>
#include <cerrno>
#include <system_error>

void retrieve::check_error(int return_val) {
    if(return_val < 0 && errno > 0) {
        throw std::system_error(errno, std::generic_category());
    }
}
