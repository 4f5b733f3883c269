/**
 * @file Address.cpp
 *
 * This module contains the implementation of the Membership::Address
 * structure methods.
 *
 * © 2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <Membership/Address.hpp>
#include <sstream>

namespace Membership {

    Address::Address(const std::string& host, int port)
        : host(host)
        , port(port)
    {
    }

    Address Address::FromString(const std::string& text) {
        const auto delimiter = text.find_last_of(':');
        if (delimiter == std::string::npos) {
            return Address(text, 0);
        }
        int port;
        if (!ParseDecimal(text.substr(delimiter + 1), port)) {
            return Address(text, 0);
        }
        return Address(text.substr(0, delimiter), port);
    }

    std::string Address::ToString() const {
        std::ostringstream builder;
        builder << host << ':' << port;
        return builder.str();
    }

    bool Address::operator==(const Address& other) const {
        return (
            (host == other.host)
            && (port == other.port)
        );
    }

    bool Address::operator!=(const Address& other) const {
        return !(*this == other);
    }

    void PrintTo(
        const Address& address,
        std::ostream* os
    ) {
        *os << address.ToString();
    }

}
