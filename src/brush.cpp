#include <brushkit/brush.hpp>

namespace brushkit {

std::string default_sample_name(std::string_view stem, std::size_t index, std::size_t count) {
    std::string name(stem);
    if (count > 1) {
        name += '_';
        name += std::to_string(index);
    }
    return name;
}

} // namespace brushkit
