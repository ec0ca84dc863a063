#pragma once

#include "rdx/config.h"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#if !defined(RDX_EXPORT_ALL_STUFF_FOR_GNUC)
#    ifdef __GNUC__
#        define RDX_EXPORT_ALL_STUFF_FOR_GNUC RDX_EXPORT
#    else
#        define RDX_EXPORT_ALL_STUFF_FOR_GNUC
#    endif
#endif

#if !defined(RDX_CONSTEXPR)
#    if __cplusplus < 201703L
#        define RDX_CONSTEXPR
#    else  // __cplusplus < 201703L
#        define RDX_CONSTEXPR constexpr
#    endif  // __cplusplus < 201703L
#endif      // !defined(RDX_CONSTEXPR)

#if !defined(RDX_NODISCARD)
#    if __cplusplus < 201703L
#        define RDX_NODISCARD
#    else  // __cplusplus < 201703L
#        define RDX_NODISCARD [[nodiscard]]
#    endif  // __cplusplus < 201703L
#endif      // !defined(RDX_NODISCARD)

#define RDX_IMPLEMENT_BITWISE_OPS_FOR_ENUM(ty) \
    inline RDX_CONSTEXPR ty operator|(ty lhs, ty rhs) { \
        return static_cast<ty>(static_cast<typename std::underlying_type<ty>::type>(lhs) | \
                               static_cast<typename std::underlying_type<ty>::type>(rhs)); \
    } \
    inline RDX_CONSTEXPR ty operator&(ty lhs, ty rhs) { \
        return static_cast<ty>(static_cast<typename std::underlying_type<ty>::type>(lhs) & \
                               static_cast<typename std::underlying_type<ty>::type>(rhs)); \
    } \
    inline RDX_CONSTEXPR ty operator~(ty flags) { \
        return static_cast<ty>(~static_cast<typename std::underlying_type<ty>::type>(flags)); \
    } \
    inline RDX_CONSTEXPR bool operator!(ty flags) { \
        return static_cast<typename std::underlying_type<ty>::type>(flags) == 0; \
    } \
    inline ty& operator|=(ty& lhs, ty rhs) { return lhs = lhs | rhs; } \
    inline ty& operator&=(ty& lhs, ty rhs) { return lhs = lhs & rhs; }

#if RDX_USE_COMPILER_128BIT_EXTENSIONS != 0
#    if defined(_MSC_VER) && defined(_M_X64)
#        include <intrin.h>
#    elif defined(__GNUC__) && defined(__x86_64__)
namespace gcc_ints {
__extension__ typedef unsigned __int128 uint128;
}  // namespace gcc_ints
#    endif
#endif  // RDX_USE_COMPILER_128BIT_EXTENSIONS
