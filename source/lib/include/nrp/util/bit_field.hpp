#pragma once

#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
struct BitFieldOperatorsEnabled : std::false_type
{
};

template<typename BitFieldTy>
concept EnabledBitField = BitFieldOperatorsEnabled<BitFieldTy>::value;
} // namespace detail

// Opt an enum class into the bitwise operators below
#define NRP_ENABLE_BITFIELD_OPERATORS(bitfield)       \
    template<>                                        \
    struct detail::BitFieldOperatorsEnabled<bitfield> \
        : std::true_type                              \
    {                                                 \
    }

#define NRP_MAKE_BINARY_BITFIELD_OPERATOR(op)                                  \
    template<detail::EnabledBitField BitFieldTy>                               \
    inline constexpr BitFieldTy operator op(BitFieldTy lhs, BitFieldTy rhs)    \
    {                                                                          \
        using BaseTy = std::underlying_type_t<BitFieldTy>;                     \
        return static_cast<BitFieldTy>(                                        \
            static_cast<BaseTy>(lhs) op static_cast<BaseTy>(rhs));             \
    }                                                                          \
    template<detail::EnabledBitField BitFieldTy>                               \
    inline constexpr BitFieldTy& operator op##=(BitFieldTy & lhs, BitFieldTy rhs) \
    {                                                                          \
        lhs = lhs op rhs;                                                      \
        return lhs;                                                            \
    }

NRP_MAKE_BINARY_BITFIELD_OPERATOR(&)
NRP_MAKE_BINARY_BITFIELD_OPERATOR(|)
NRP_MAKE_BINARY_BITFIELD_OPERATOR(^)

#undef NRP_MAKE_BINARY_BITFIELD_OPERATOR

template<detail::EnabledBitField BitFieldTy>
inline constexpr BitFieldTy operator~(BitFieldTy value)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(~static_cast<BaseTy>(value));
}

template<detail::EnabledBitField BitFieldTy>
inline constexpr bool IsSet(BitFieldTy flags, BitFieldTy bits)
{
    return (flags & bits) == bits;
}

template<class T>
consteval T Bit(T ith)
{
    return static_cast<T>(T{ 1 } << ith);
}

// NOLINTEND
