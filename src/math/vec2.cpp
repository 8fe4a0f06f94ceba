// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "math/vec2.h"

#include <cmath>

namespace autoz {

bool Vec2::is_finite() const {
    return std::isfinite(x) && std::isfinite(y);
}

} // namespace autoz
