#pragma once

extern "C" {
#include <blst.h>
}

#include <type_traits>

namespace Subnet::Crypto::impl {

// P1, P2 and Scalar are standard-layout wrappers whose single member is storage
// of the blst type, so their addresses are interchangeable. Constness carries over.
template <typename BlstT, typename WrapperT>
inline auto to_native(WrapperT* w)
{
    using Native = std::conditional_t<std::is_const_v<WrapperT>, const BlstT, BlstT>;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<Native*>(w);
}

} // namespace Subnet::Crypto::impl
