//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef AUDIOPRESS_COLOR_HPP
#define AUDIOPRESS_COLOR_HPP

// ANSI escape sequences for console output
constexpr const char* RESET  = "\033[0m";
constexpr const char* RED    = "\033[1;31m";
constexpr const char* YELLOW = "\033[1;33m";

#endif //AUDIOPRESS_COLOR_HPP
