#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across lineup.

#include <cstdint>
#include <functional>

namespace lineup::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps PlayerId and MatchId from being mixed up at compile time while
/// sharing the same underlying representation. Zero is the invalid id.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct MatchIdTag {};

/// Identifier of a queued player, allocated by the queue store.
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of a formed match, taken from the match counter.
using MatchId = StrongId<MatchIdTag>;

} // namespace lineup::foundation

template <typename Tag, typename T>
struct std::hash<lineup::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const lineup::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
