#ifndef MEMBERSHIP_UTILITIES_HPP
#define MEMBERSHIP_UTILITIES_HPP

/**
 * @file Utilities.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include <sstream>
#include <string>
#include <vector>

namespace Membership {

    /**
     * This is the template for a function which builds and returns a
     * human-readable string representation of a list of elements.  Each
     * element is rendered by its ToString method.
     *
     * @param[in] list
     *     This is the list of elements to format as a string.
     *
     * @return
     *     A human-readable representation of the given list is returned.
     */
    template< typename T > std::string FormatList(const std::vector< T >& list) {
        std::ostringstream builder;
        builder << '[';
        bool first = true;
        for (const auto& element: list) {
            if (!first) {
                builder << ", ";
            }
            first = false;
            builder << element.ToString();
        }
        builder << ']';
        return builder.str();
    }

    /**
     * Parse the given text as a non-negative decimal integer.
     *
     * @param[in] text
     *     This is the text to parse.
     *
     * @param[out] value
     *     This is where to store the parsed value.  It is left
     *     unchanged if the text could not be parsed.
     *
     * @return
     *     An indication of whether or not the text held only decimal
     *     digits whose value fits in an int is returned.
     */
    bool ParseDecimal(const std::string& text, int& value);

}

#endif /* MEMBERSHIP_UTILITIES_HPP */
