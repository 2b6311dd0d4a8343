#ifndef BV_COMMON_TYPES_HPP
#define BV_COMMON_TYPES_HPP

#include <cstdint>
#include <vector>

namespace bv {

using Bytes = std::vector<uint8_t>;

} // namespace bv

#endif // BV_COMMON_TYPES_HPP
