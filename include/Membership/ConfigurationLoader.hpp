#ifndef MEMBERSHIP_CONFIGURATION_LOADER_HPP
#define MEMBERSHIP_CONFIGURATION_LOADER_HPP

/**
 * @file ConfigurationLoader.hpp
 *
 * This module declares the Membership::ConfigurationLoader class.
 *
 * © 2020 by Richard Walters
 */

#include "MembershipConfig.hpp"

#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Membership {

    /**
     * This builds membership configurations from JSON documents.
     *
     * A document is an object whose keys name configuration properties:
     * "seedMembers", "syncInterval", "syncTimeout", "suspicionMult",
     * "namespace", and "removedMembersHistorySize".  The optional "profile"
     * key ("lan", "wan", or "local") selects the preset to start from.
     *
     * Values are not range-checked.  Values of the wrong type and unknown
     * keys are reported through diagnostics and otherwise ignored.
     */
    class ConfigurationLoader {
        // Lifecycle Methods
    public:
        ~ConfigurationLoader() noexcept;
        ConfigurationLoader(const ConfigurationLoader&) = delete;
        ConfigurationLoader(ConfigurationLoader&&) noexcept;
        ConfigurationLoader& operator=(const ConfigurationLoader&) = delete;
        ConfigurationLoader& operator=(ConfigurationLoader&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         */
        ConfigurationLoader();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * Build a configuration from the given JSON document, starting
         * from the default configuration.
         *
         * @param[in] document
         *     This is the JSON object holding configuration properties.
         *
         * @return
         *     The loaded configuration is returned.
         */
        MembershipConfig Load(const Json::Value& document);

        /**
         * Build a configuration from the given JSON document, starting
         * from the given configuration.
         *
         * @param[in] document
         *     This is the JSON object holding configuration properties.
         *
         * @param[in] base
         *     This is the configuration whose properties are kept where
         *     the document does not override them, unless the document
         *     selects a profile.
         *
         * @return
         *     The loaded configuration is returned.  If the document is
         *     not a JSON object, the base configuration is returned.
         */
        MembershipConfig Load(
            const Json::Value& document,
            const MembershipConfig& base
        );

        /**
         * Decode the given JSON text and build a configuration from it,
         * starting from the default configuration.
         *
         * @param[in] encoding
         *     This is the JSON text of the configuration document.
         *
         * @return
         *     The loaded configuration is returned.
         */
        MembershipConfig LoadFromString(const std::string& encoding);

        /**
         * Decode the given JSON text and build a configuration from it,
         * starting from the given configuration.
         *
         * @param[in] encoding
         *     This is the JSON text of the configuration document.
         *
         * @param[in] base
         *     This is the configuration whose properties are kept where
         *     the document does not override them.
         *
         * @return
         *     The loaded configuration is returned.  If the text could not
         *     be decoded, the base configuration is returned.
         */
        MembershipConfig LoadFromString(
            const std::string& encoding,
            const MembershipConfig& base
        );

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* MEMBERSHIP_CONFIGURATION_LOADER_HPP */
