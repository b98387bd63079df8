#pragma once
#include <cstdint>

namespace mg::game {

// One grid position: empty, a power-of-two number, or the special marker.
struct Cell {
    enum class Kind : std::uint8_t { Empty = 0, Number = 1, Marker = 2 };

    Kind kind = Kind::Empty;
    std::uint32_t value = 0; // only meaningful for Kind::Number

    static constexpr Cell empty() { return Cell{}; }
    static constexpr Cell number(std::uint32_t v) { return Cell{Kind::Number, v}; }
    static constexpr Cell marker() { return Cell{Kind::Marker, 0}; }

    constexpr bool isEmpty() const { return kind == Kind::Empty; }
    constexpr bool isNumber() const { return kind == Kind::Number; }
    constexpr bool isMarker() const { return kind == Kind::Marker; }

    // Numeric contribution to the score; markers and empties count as 0
    constexpr std::uint32_t points() const { return kind == Kind::Number ? value : 0u; }

    friend constexpr bool operator==(const Cell& a, const Cell& b) {
        return a.kind == b.kind && (a.kind != Kind::Number || a.value == b.value);
    }
    friend constexpr bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
};

} // namespace mg::game
