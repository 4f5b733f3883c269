/**
 * @file ConfigurationLoader.cpp
 *
 * This module contains the implementation of the
 * Membership::ConfigurationLoader class.
 *
 * © 2020 by Richard Walters
 */

#include <functional>
#include <Json/Value.hpp>
#include <limits>
#include <map>
#include <Membership/ConfigurationLoader.hpp>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace {

    using Levels = SystemAbstractions::DiagnosticsSender::Levels;

    /**
     * Return an indication of whether or not the given JSON integer
     * can be held in an int.
     *
     * @param[in] value
     *     This is the integer taken from a configuration document.
     *
     * @return
     *     An indication of whether or not the given integer can be held
     *     in an int is returned.
     */
    bool FitsInInt(intmax_t value) {
        return (
            (value >= (intmax_t)std::numeric_limits< int >::min())
            && (value <= (intmax_t)std::numeric_limits< int >::max())
        );
    }

    /**
     * This is the type of function which applies one property, taken from
     * a configuration document, to a configuration.
     *
     * @param[in] diagnosticsSender
     *     This is used to report values which can't be applied.
     *
     * @param[in] config
     *     This is the configuration to which to apply the property.
     *
     * @param[in] value
     *     This is the value of the property taken from the document.
     *
     * @return
     *     The configuration with the property applied is returned.
     */
    typedef std::function<
        Membership::MembershipConfig(
            SystemAbstractions::DiagnosticsSender& diagnosticsSender,
            const Membership::MembershipConfig& config,
            const Json::Value& value
        )
    > PropertyApplier;

    /**
     * This is the type of function which replaces one integer property
     * of a configuration.
     */
    typedef Membership::MembershipConfig (Membership::MembershipConfig::*IntegerSetter)(int) const;

    /**
     * Build a function which applies the integer property with the given
     * name to a configuration.
     *
     * @param[in] name
     *     This is the name of the property in the configuration document.
     *
     * @param[in] setter
     *     This is the method which replaces the property in a
     *     configuration.
     *
     * @param[in] minimum
     *     This is the smallest value below which the property is reported
     *     as degenerate.  It is still applied.
     *
     * @return
     *     The function which applies the property is returned.
     */
    PropertyApplier MakeIntegerApplier(
        const std::string& name,
        IntegerSetter setter,
        int minimum
    ) {
        return [name, setter, minimum](
            SystemAbstractions::DiagnosticsSender& diagnosticsSender,
            const Membership::MembershipConfig& config,
            const Json::Value& value
        ) -> Membership::MembershipConfig {
            if (value.GetType() != Json::Value::Type::Integer) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "Ignoring \"%s\": value %s is not an integer",
                    name.c_str(),
                    value.ToEncoding().c_str()
                );
                return config;
            }
            const intmax_t wideInteger = value;
            if (!FitsInInt(wideInteger)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "Ignoring \"%s\": value %s is out of range",
                    name.c_str(),
                    value.ToEncoding().c_str()
                );
                return config;
            }
            const auto integer = (int)wideInteger;
            if (integer < minimum) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "\"%s\" is %d, which is less than %d",
                    name.c_str(),
                    integer,
                    minimum
                );
            }
            return (config.*setter)(integer);
        };
    }

    /**
     * Apply the "seedMembers" property to a configuration.
     *
     * @param[in] diagnosticsSender
     *     This is used to report elements which can't be applied.
     *
     * @param[in] config
     *     This is the configuration to which to apply the property.
     *
     * @param[in] value
     *     This is the value of the property taken from the document.
     *
     * @return
     *     The configuration with the property applied is returned.
     */
    Membership::MembershipConfig ApplySeedMembers(
        SystemAbstractions::DiagnosticsSender& diagnosticsSender,
        const Membership::MembershipConfig& config,
        const Json::Value& value
    ) {
        if (value.GetType() != Json::Value::Type::Array) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                Levels::WARNING,
                "Ignoring \"seedMembers\": value %s is not an array",
                value.ToEncoding().c_str()
            );
            return config;
        }
        std::vector< Membership::Address > seedMembers;
        for (size_t i = 0; i < value.GetSize(); ++i) {
            const auto& element = value[i];
            Membership::Address address;
            if (element.GetType() == Json::Value::Type::String) {
                const std::string text = element;
                address = Membership::Address::FromString(text);
            } else if (
                (element.GetType() == Json::Value::Type::Object)
                && (element["host"].GetType() == Json::Value::Type::String)
                && (element["port"].GetType() == Json::Value::Type::Integer)
            ) {
                const intmax_t port = element["port"];
                if (!FitsInInt(port)) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        Levels::WARNING,
                        "Ignoring seed member %zu: port %s is out of range",
                        i,
                        element["port"].ToEncoding().c_str()
                    );
                    continue;
                }
                const std::string host = element["host"];
                address = Membership::Address(host, (int)port);
            } else {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "Ignoring seed member %zu: %s is not an address",
                    i,
                    element.ToEncoding().c_str()
                );
                continue;
            }
            if (address.port == 0) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "Seed member %zu (%s) has no port",
                    i,
                    element.ToEncoding().c_str()
                );
            }
            seedMembers.push_back(address);
        }
        return config.WithSeedMembers(seedMembers);
    }

    /**
     * Apply the "namespace" property to a configuration.
     *
     * @param[in] diagnosticsSender
     *     This is used to report values which can't be applied.
     *
     * @param[in] config
     *     This is the configuration to which to apply the property.
     *
     * @param[in] value
     *     This is the value of the property taken from the document.
     *
     * @return
     *     The configuration with the property applied is returned.
     */
    Membership::MembershipConfig ApplyNamespace(
        SystemAbstractions::DiagnosticsSender& diagnosticsSender,
        const Membership::MembershipConfig& config,
        const Json::Value& value
    ) {
        if (value.GetType() != Json::Value::Type::String) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                Levels::WARNING,
                "Ignoring \"namespace\": value %s is not a string",
                value.ToEncoding().c_str()
            );
            return config;
        }
        const std::string ns = value;
        if (ns.empty()) {
            diagnosticsSender.SendDiagnosticInformationString(
                Levels::WARNING,
                "\"namespace\" is empty"
            );
        }
        return config.WithNamespace(ns);
    }

    struct PropertyAppliers {
        // Properties

        /**
         * This holds the function which applies each property,
         * keyed by property name.
         */
        std::map< std::string, PropertyApplier > appliersByName;

        // Methods

        /**
         * This is the default constructor.
         */
        PropertyAppliers() {
            appliersByName["seedMembers"] = ApplySeedMembers;
            appliersByName["syncInterval"] = MakeIntegerApplier(
                "syncInterval",
                &Membership::MembershipConfig::WithSyncInterval,
                1
            );
            appliersByName["syncTimeout"] = MakeIntegerApplier(
                "syncTimeout",
                &Membership::MembershipConfig::WithSyncTimeout,
                1
            );
            appliersByName["suspicionMult"] = MakeIntegerApplier(
                "suspicionMult",
                &Membership::MembershipConfig::WithSuspicionMult,
                1
            );
            appliersByName["removedMembersHistorySize"] = MakeIntegerApplier(
                "removedMembersHistorySize",
                &Membership::MembershipConfig::WithRemovedMembersHistorySize,
                0
            );
            appliersByName["namespace"] = ApplyNamespace;
        }
    } PROPERTY_APPLIERS;

    /**
     * This maps the names of network profiles, as they appear in the
     * "profile" property of a configuration document, to the profiles.
     */
    const std::map< std::string, Membership::NetworkProfile > PROFILES_BY_NAME{
        {"lan", Membership::NetworkProfile::Lan},
        {"wan", Membership::NetworkProfile::Wan},
        {"local", Membership::NetworkProfile::Local},
    };

}

namespace Membership {

    /**
     * This contains the private properties of a ConfigurationLoader
     * instance.
     */
    struct ConfigurationLoader::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        // Methods

        /**
         * This is the constructor of the structure.
         */
        Impl()
            : diagnosticsSender("Membership::ConfigurationLoader")
        {
        }

        /**
         * Return the configuration to which the properties of the given
         * document are applied.  This is the preset selected by the
         * document's "profile" property, if any, or the given base.
         *
         * @param[in] document
         *     This is the configuration document.
         *
         * @param[in] base
         *     This is the configuration to use if the document does not
         *     select a profile.
         *
         * @return
         *     The configuration to which to apply the document's
         *     properties is returned.
         */
        MembershipConfig SelectStartingPoint(
            const Json::Value& document,
            const MembershipConfig& base
        ) {
            if (!document.Has("profile")) {
                return base;
            }
            const auto& profileValue = document["profile"];
            if (profileValue.GetType() == Json::Value::Type::String) {
                const std::string profileName = profileValue;
                const auto profile = PROFILES_BY_NAME.find(profileName);
                if (profile != PROFILES_BY_NAME.end()) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        1,
                        "Starting from the %s profile",
                        NetworkProfileToString(profile->second).c_str()
                    );
                    return MembershipConfig::ForProfile(profile->second);
                }
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                Levels::WARNING,
                "Ignoring \"profile\": %s is not a known network profile",
                profileValue.ToEncoding().c_str()
            );
            return base;
        }
    };

    ConfigurationLoader::~ConfigurationLoader() noexcept = default;
    ConfigurationLoader::ConfigurationLoader(ConfigurationLoader&&) noexcept = default;
    ConfigurationLoader& ConfigurationLoader::operator=(ConfigurationLoader&&) noexcept = default;

    ConfigurationLoader::ConfigurationLoader()
        : impl_(new Impl())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate ConfigurationLoader::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    MembershipConfig ConfigurationLoader::Load(const Json::Value& document) {
        return Load(document, MembershipConfig::DefaultConfig());
    }

    MembershipConfig ConfigurationLoader::Load(
        const Json::Value& document,
        const MembershipConfig& base
    ) {
        if (document.GetType() != Json::Value::Type::Object) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                Levels::ERROR,
                "Configuration document is not a JSON object"
            );
            return base;
        }
        auto config = impl_->SelectStartingPoint(document, base);
        for (const auto& key: document.GetKeys()) {
            if (key == "profile") {
                continue;
            }
            const auto applier = PROPERTY_APPLIERS.appliersByName.find(key);
            if (applier == PROPERTY_APPLIERS.appliersByName.end()) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    Levels::WARNING,
                    "Ignoring unknown property \"%s\"",
                    key.c_str()
                );
                continue;
            }
            config = applier->second(
                impl_->diagnosticsSender,
                config,
                document[key]
            );
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Loaded configuration: %s",
            config.ToString().c_str()
        );
        return config;
    }

    MembershipConfig ConfigurationLoader::LoadFromString(const std::string& encoding) {
        return LoadFromString(encoding, MembershipConfig::DefaultConfig());
    }

    MembershipConfig ConfigurationLoader::LoadFromString(
        const std::string& encoding,
        const MembershipConfig& base
    ) {
        const auto document = Json::Value::FromEncoding(encoding);
        if (document.GetType() == Json::Value::Type::Invalid) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                Levels::ERROR,
                "Configuration document could not be decoded as JSON"
            );
            return base;
        }
        return Load(document, base);
    }

}
