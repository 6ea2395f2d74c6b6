/**
 * @file MMIStyle.cpp
 * @brief MMI class numerals and the shakemap colour ramp
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MMIStyle.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace shake {

namespace {

// Index 0 is class I
constexpr std::array<std::array<uint8_t, 3>, MMIStyle::MAX_CLASS> MMI_COLOURS = {{
    {0xff, 0xff, 0xff},   // I
    {0x20, 0x9f, 0xff},   // II
    {0x00, 0xcf, 0xff},   // III
    {0x55, 0xff, 0xff},   // IV
    {0xaa, 0xff, 0xff},   // V
    {0xff, 0xf0, 0x00},   // VI
    {0xff, 0xa8, 0x00},   // VII
    {0xff, 0x70, 0x00},   // VIII
    {0xff, 0x00, 0x00},   // IX
    {0xdd, 0x00, 0x00}    // X
}};

constexpr std::array<std::pair<int, const char*>, 13> ROMAN_DIGITS = {{
    {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"},
    {100, "C"}, {90, "XC"}, {50, "L"}, {40, "XL"},
    {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}
}};

} // namespace

std::string MMIStyle::roman_numeral(int value) {
    if (value < 1 || value > 3999) {
        return "";
    }

    std::string numeral;
    for (const auto& [amount, digits] : ROMAN_DIGITS) {
        while (value >= amount) {
            numeral += digits;
            value -= amount;
        }
    }
    return numeral;
}

int MMIStyle::mmi_class(double mmi) {
    if (std::isnan(mmi)) {
        return MIN_CLASS;
    }
    const double rounded = std::round(mmi);
    if (rounded <= MIN_CLASS) return MIN_CLASS;
    if (rounded >= MAX_CLASS) return MAX_CLASS;
    return static_cast<int>(rounded);
}

std::array<uint8_t, 3> MMIStyle::rgb_for(double mmi) {
    return MMI_COLOURS[static_cast<size_t>(mmi_class(mmi) - MIN_CLASS)];
}

std::string MMIStyle::colour_for(double mmi) {
    const auto rgb = rgb_for(mmi);

    std::ostringstream hex;
    hex << '#' << std::hex << std::setfill('0');
    for (uint8_t channel : rgb) {
        hex << std::setw(2) << static_cast<int>(channel);
    }
    return hex.str();
}

} // namespace shake
