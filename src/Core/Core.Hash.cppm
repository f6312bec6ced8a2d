module;
#include <cstddef>
#include <cstdint>
#include <functional>

export module Core:Hash;

export namespace Core::Hash
{
    // Boost-style combine with a 64-bit golden ratio constant.
    template <typename T>
    constexpr void HashCombine(size_t& seed, const T& value)
    {
        seed ^= std::hash<T>{}(value) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    }

    template <typename... Ts>
    [[nodiscard]] constexpr size_t HashAll(const Ts&... values)
    {
        size_t seed = 0;
        (HashCombine(seed, values), ...);
        return seed;
    }
}
