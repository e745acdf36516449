#include <file_icon/icon_source.hpp>

#if defined(_WIN32)
#include <file_icon/sources/shell_source.hpp>
#else
#include <file_icon/sources/file_source.hpp>
#endif

namespace file_icon {

std::shared_ptr<icon_source> make_default_source() {
#if defined(_WIN32)
    return std::make_shared<shell_source>();
#else
    return std::make_shared<file_source>();
#endif
}

} // namespace file_icon
