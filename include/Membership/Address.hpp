#ifndef MEMBERSHIP_ADDRESS_HPP
#define MEMBERSHIP_ADDRESS_HPP

/**
 * @file Address.hpp
 *
 * This module declares the Membership::Address structure.
 *
 * © 2020 by Richard Walters
 */

#include <ostream>
#include <string>

namespace Membership {

    /**
     * This identifies one network endpoint of a cluster member, such as a
     * seed member used to join the cluster.  No resolution or reachability
     * checks are made on it.
     */
    struct Address {
        // Properties

        /**
         * This is the host name or literal IP address of the endpoint.
         */
        std::string host;

        /**
         * This is the port number of the endpoint.
         */
        int port = 0;

        // Methods

        /**
         * This is the default constructor.
         */
        Address() = default;

        /**
         * This constructor sets up the address with the given host
         * and port.
         *
         * @param[in] host
         *     This is the host name or literal IP address of the endpoint.
         *
         * @param[in] port
         *     This is the port number of the endpoint.
         */
        Address(const std::string& host, int port);

        /**
         * Build an address from its "host:port" form.  If there is no
         * colon, or the text after the last colon is not a decimal number,
         * the whole text is taken as the host and the port is zero.
         *
         * @param[in] text
         *     This is the "host:port" form of the address.
         *
         * @return
         *     The address described by the given text is returned.
         */
        static Address FromString(const std::string& text);

        /**
         * Return the "host:port" form of the address.
         *
         * @return
         *     The "host:port" form of the address is returned.
         */
        std::string ToString() const;

        bool operator==(const Address& other) const;
        bool operator!=(const Address& other) const;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Membership::Address type.
     *
     * @param[in] address
     *     This is the address to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the address.
     */
    void PrintTo(
        const Address& address,
        std::ostream* os
    );

}

#endif /* MEMBERSHIP_ADDRESS_HPP */
