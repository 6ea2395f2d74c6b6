#pragma once

/**
 * @file MMIStyle.hpp
 * @brief Label and colour attributes for Modified Mercalli Intensity contours
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <cstdint>
#include <string>

namespace shake {

class MMIStyle {
public:
    static constexpr int MIN_CLASS = 1;
    static constexpr int MAX_CLASS = 10;

    /**
     * @brief Roman numeral for 1..3999, empty string outside that range
     */
    static std::string roman_numeral(int value);

    /**
     * @brief Intensity class of a contour level: rounded, clamped to I..X
     */
    static int mmi_class(double mmi);

    /**
     * @brief HTML hex colour ("#rrggbb") of the class the level falls in
     */
    static std::string colour_for(double mmi);

    /**
     * @brief Same colour as 8-bit RGB channels
     */
    static std::array<uint8_t, 3> rgb_for(double mmi);
};

} // namespace shake
