// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#ifndef AUTOZ_MATH_VEC2_H
#define AUTOZ_MATH_VEC2_H

// Vec2: XY machine coordinate in mm.
// Pure C++, no runtime dependencies. Must compile on any host.

namespace autoz {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }

    bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
    bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

    // Both components exactly zero
    bool is_zero() const { return x == 0.0f && y == 0.0f; }
    bool is_finite() const;
};

} // namespace autoz

#endif // AUTOZ_MATH_VEC2_H
