/**
 * @file element_source.cpp
 * @brief Element id formatting
 */

#include <csa/integration/element_source.hpp>

#include <csa/compat/format.hpp>

namespace csa::integration {

auto to_string(element_id id) -> std::string {
    return compat::format("({:04X},{:04X})", id.group, id.element);
}

}  // namespace csa::integration
