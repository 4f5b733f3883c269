/**
 * @file Utilities.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <limits>

namespace Membership {

    bool ParseDecimal(const std::string& text, int& value) {
        if (text.empty()) {
            return false;
        }
        int accumulator = 0;
        for (const auto c: text) {
            if ((c < '0') || (c > '9')) {
                return false;
            }
            const auto digit = (int)(c - '0');
            if (accumulator > (std::numeric_limits< int >::max() - digit) / 10) {
                return false;
            }
            accumulator = accumulator * 10 + digit;
        }
        value = accumulator;
        return true;
    }

}
