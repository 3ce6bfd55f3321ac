#pragma once

#include <fmt/color.h>

template <typename T>
auto bold_white(T const& value) {
    return fmt::styled(value, fmt::emphasis::bold | fmt::fg(fmt::color::white));
}

template <typename T>
auto bold_red(T const& value) {
    return fmt::styled(value, fmt::emphasis::bold | fmt::fg(fmt::color::red));
}
