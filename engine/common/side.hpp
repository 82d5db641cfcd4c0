#pragma once

#include <cstdint>

namespace gridduel {

// Cell values used by both boards' flat arrays.
enum class Side : uint8_t {
    None  = 0,
    Human = 1,
    Ai    = 2,
};

inline Side opponent(Side s) {
    if (s == Side::Human) return Side::Ai;
    if (s == Side::Ai) return Side::Human;
    return Side::None;
}

inline const char* side_name(Side s) {
    switch (s) {
    case Side::Human: return "human";
    case Side::Ai:    return "ai";
    default:          return "none";
    }
}

} // namespace gridduel
