#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <type_traits>

/**
    Strong wrapper over a trivial value so that ids, prices and quantities cannot be
    mixed by accident.

    struct Custom : StrongType<std::uint64_t, Custom> {
        using StrongType::StrongType;
    };
*/
template <typename Base, typename Tag> struct StrongType {
    static_assert(std::is_trivial_v<Base>, "The value type must be trivial");
    using value_type = Base;
    using tag_type = Tag;

public:
    constexpr StrongType() noexcept : data_m{} {}
    constexpr explicit StrongType(Base value) noexcept : data_m(value) {}

    [[nodiscard]] constexpr auto value() const noexcept { return data_m; }
    explicit constexpr operator Base() const noexcept { return data_m; }

    friend std::ostream& operator<<(std::ostream& os, const StrongType& st) {
        return os << st.data_m;
    }

    constexpr auto operator<=>(const StrongType&) const noexcept = default;
    constexpr bool operator==(const StrongType&) const noexcept = default;
    constexpr auto operator<=>(Base other) const noexcept { return data_m <=> other; }
    constexpr bool operator==(Base other) const noexcept { return data_m == other; }

    constexpr Tag operator+(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m + other.data_m)};
    }

    // Saturates at zero: durations and latencies are never negative.
    constexpr Tag operator-(const Tag& other) const noexcept {
        return Tag{data_m > other.data_m ? static_cast<Base>(data_m - other.data_m) : Base{}};
    }

    constexpr Tag operator%(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m % other.data_m)};
    }

    constexpr Tag& operator+=(const Tag& other) noexcept {
        data_m += other.data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag& operator++() noexcept {
        ++data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag operator++(int) noexcept {
        Tag temp = static_cast<Tag&>(*this);
        ++data_m;
        return temp;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return data_m == 0; }

protected:
    Base data_m;
};

template <typename T>
concept IsStrongType = requires {
    typename T::value_type;
    typename T::tag_type;
} && std::derived_from<T, StrongType<typename T::value_type, typename T::tag_type>>;

template <typename Tag>
    requires IsStrongType<Tag> && std::formattable<typename Tag::value_type, char>
struct std::formatter<Tag> : std::formatter<typename Tag::value_type> {
    template <typename FormatContext>
    auto format(const Tag& st, FormatContext& ctx) const {
        return std::formatter<typename Tag::value_type>::format(st.value(), ctx);
    }
};

template <typename Strong> struct strong_hash {
    std::size_t operator()(const Strong& v) const noexcept {
        return std::hash<typename Strong::value_type>{}(v.value());
    }
};

// Microseconds since the Unix epoch. Also used for latencies and interval lengths.
struct Timestamp : StrongType<std::uint64_t, Timestamp> {
    using StrongType::StrongType;
};

// Seconds since local midnight.
struct TimeOfDay : StrongType<std::uint32_t, TimeOfDay> {
    using StrongType::StrongType;
};

// Integer price ticks.
struct Price : StrongType<std::uint64_t, Price> {
    using StrongType::StrongType;
};

struct Quantity : StrongType<std::uint64_t, Quantity> {
    using StrongType::StrongType;
};

struct OrderID : StrongType<std::uint64_t, OrderID> {
    using StrongType::StrongType;
};

struct SymbolID : StrongType<std::uint32_t, SymbolID> {
    using StrongType::StrongType;
};

inline constexpr std::uint32_t SECONDS_PER_DAY = 24 * 60 * 60;
inline constexpr std::uint64_t MICROS_PER_MILLI = 1'000;
inline constexpr std::uint64_t MICROS_PER_SECOND = 1'000'000;

[[nodiscard]] constexpr Timestamp from_millis(std::uint64_t ms) noexcept {
    return Timestamp{ms * MICROS_PER_MILLI};
}

[[nodiscard]] constexpr double to_millis(Timestamp t) noexcept {
    return static_cast<double>(t.value()) / static_cast<double>(MICROS_PER_MILLI);
}

[[nodiscard]] constexpr TimeOfDay make_time_of_day(std::uint32_t h, std::uint32_t m,
                                                   std::uint32_t s) noexcept {
    return TimeOfDay{h * 3600 + m * 60 + s};
}
