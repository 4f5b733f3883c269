#ifndef MEMBERSHIP_MEMBERSHIP_CONFIG_HPP
#define MEMBERSHIP_MEMBERSHIP_CONFIG_HPP

/**
 * @file MembershipConfig.hpp
 *
 * This module declares the Membership::MembershipConfig class.
 *
 * © 2020 by Richard Walters
 */

#include "Address.hpp"

#include <initializer_list>
#include <Json/Value.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace Membership {

    // Default settings for a cluster on a LAN.  Intervals are in milliseconds.
    constexpr int DEFAULT_SYNC_INTERVAL = 30000;
    constexpr int DEFAULT_SYNC_TIMEOUT = 3000;
    constexpr int DEFAULT_SUSPICION_MULT = 5;
    constexpr int DEFAULT_REMOVED_MEMBERS_HISTORY_SIZE = 42;
    constexpr const char* DEFAULT_NAMESPACE = "default";

    // Overrides of the LAN settings for a cluster spread over a WAN.
    constexpr int DEFAULT_WAN_SUSPICION_MULT = 6;
    constexpr int DEFAULT_WAN_SYNC_INTERVAL = 60000;

    // Overrides of the LAN settings for a cluster running over the
    // loopback interface.
    constexpr int DEFAULT_LOCAL_SUSPICION_MULT = 3;
    constexpr int DEFAULT_LOCAL_SYNC_INTERVAL = 15000;

    /**
     * This identifies the kind of network over which the cluster runs,
     * selecting one of the preset configurations.
     */
    enum class NetworkProfile {
        /**
         * Members share a local area network.
         */
        Lan,

        /**
         * Members are spread over a wide area network, with higher latency
         * and packet loss.
         */
        Wan,

        /**
         * Members run on the same machine and talk over the loopback
         * interface.
         */
        Local,
    };

    /**
     * This holds the tuning parameters of the membership protocol: how
     * members find the cluster, how often they synchronize membership
     * tables, and how long they wait before suspecting a silent member.
     *
     * Instances are immutable.  Each "With" method returns a new instance
     * which differs from the original in exactly one property, so instances
     * may be shared freely between threads.
     */
    class MembershipConfig {
        // Lifecycle Methods
    public:
        ~MembershipConfig() noexcept;
        MembershipConfig(const MembershipConfig&);
        MembershipConfig(MembershipConfig&&) noexcept;
        MembershipConfig& operator=(const MembershipConfig&);
        MembershipConfig& operator=(MembershipConfig&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.  All properties are set
         * to their defaults.
         */
        MembershipConfig();

        /**
         * Return a configuration with all properties at their defaults.
         *
         * @return
         *     A configuration with all properties at their defaults
         *     is returned.
         */
        static MembershipConfig DefaultConfig();

        /**
         * Return the preset configuration for a cluster on a LAN.
         * This is the same as the default configuration.
         *
         * @return
         *     The preset configuration for a cluster on a LAN is returned.
         */
        static MembershipConfig DefaultLanConfig();

        /**
         * Return the preset configuration for a cluster on a WAN.
         * Synchronization is less frequent and members are given longer
         * to respond before they are suspected.
         *
         * @return
         *     The preset configuration for a cluster on a WAN is returned.
         */
        static MembershipConfig DefaultWanConfig();

        /**
         * Return the preset configuration for a cluster working over the
         * local loopback interface.  Synchronization is more frequent and
         * failures are detected sooner.
         *
         * @return
         *     The preset configuration for a local cluster is returned.
         */
        static MembershipConfig DefaultLocalConfig();

        /**
         * Return the preset configuration for the given kind of network.
         *
         * @param[in] profile
         *     This identifies the kind of network over which the cluster
         *     runs.
         *
         * @return
         *     The preset configuration for the given kind of network
         *     is returned.
         */
        static MembershipConfig ForProfile(NetworkProfile profile);

        /**
         * Return the endpoints contacted in order to join the cluster.
         *
         * @return
         *     The seed member endpoints, in the order given, are returned.
         */
        const std::vector< Address >& GetSeedMembers() const;

        /**
         * Return a copy of this configuration with the seed members
         * replaced by the given endpoints.  Order and duplicates are kept.
         *
         * @param[in] seedMembers
         *     These are the endpoints contacted in order to join the
         *     cluster.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithSeedMembers(std::initializer_list< Address > seedMembers) const;

        /**
         * Return a copy of this configuration with the seed members
         * replaced by a copy of the given endpoints.  Later changes to
         * the given vector have no effect on the new configuration.
         *
         * @param[in] seedMembers
         *     These are the endpoints contacted in order to join the
         *     cluster.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithSeedMembers(const std::vector< Address >& seedMembers) const;

        /**
         * Return the time, in milliseconds, between full membership
         * synchronization rounds.
         *
         * @return
         *     The sync interval is returned.
         */
        int GetSyncInterval() const;

        /**
         * Return a copy of this configuration with the given sync interval.
         *
         * @param[in] syncInterval
         *     This is the time, in milliseconds, between full membership
         *     synchronization rounds.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithSyncInterval(int syncInterval) const;

        /**
         * Return the time, in milliseconds, to wait for responses in one
         * synchronization round.
         *
         * @return
         *     The sync timeout is returned.
         */
        int GetSyncTimeout() const;

        /**
         * Return a copy of this configuration with the given sync timeout.
         *
         * @param[in] syncTimeout
         *     This is the time, in milliseconds, to wait for responses in
         *     one synchronization round.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithSyncTimeout(int syncTimeout) const;

        /**
         * Return the factor applied to the base interval to compute how
         * long a member may stay suspected before it is declared dead.
         *
         * @return
         *     The suspicion multiplier is returned.
         */
        int GetSuspicionMult() const;

        /**
         * Return a copy of this configuration with the given suspicion
         * multiplier.
         *
         * @param[in] suspicionMult
         *     This is the factor applied to the base interval to compute
         *     the suspicion timeout.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithSuspicionMult(int suspicionMult) const;

        /**
         * Return the name of the logical cluster to which gossip
         * messages are scoped.
         *
         * @return
         *     The cluster namespace is returned.
         */
        const std::string& GetNamespace() const;

        /**
         * Return a copy of this configuration with the given namespace.
         *
         * @param[in] ns
         *     This is the name of the logical cluster to which gossip
         *     messages are scoped.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithNamespace(const std::string& ns) const;

        /**
         * Return the number of recently removed members remembered in
         * order to suppress duplicate removal events.
         *
         * @return
         *     The removed members history size is returned.
         */
        int GetRemovedMembersHistorySize() const;

        /**
         * Return a copy of this configuration with the given removed
         * members history size.
         *
         * @param[in] removedMembersHistorySize
         *     This is the number of recently removed members to remember.
         *
         * @return
         *     The new configuration is returned.
         */
        MembershipConfig WithRemovedMembersHistorySize(int removedMembersHistorySize) const;

        /**
         * Return a human-readable rendering of every property of the
         * configuration, for diagnostic output.
         *
         * @return
         *     A human-readable rendering of the configuration is returned.
         */
        std::string ToString() const;

        /**
         * This method returns a JSON value listing every property of the
         * configuration.  Seed members are rendered as "host:port" strings.
         *
         * @return
         *     A JSON object listing every property of the configuration
         *     is returned.
         */
        operator Json::Value() const;

        /**
         * Compare this configuration with the given other configuration.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not every property of the two
         *     configurations is equal is returned.
         */
        bool operator==(const MembershipConfig& other) const;

        /**
         * Compare this configuration with the given other configuration.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not any property of the two
         *     configurations differs is returned.
         */
        bool operator!=(const MembershipConfig& other) const;

        // Private properties
    private:
        /**
         * This holds the endpoints contacted in order to join the cluster.
         * It is never modified once set, so copies of the configuration
         * share it.
         */
        std::shared_ptr< const std::vector< Address > > seedMembers_;

        int syncInterval_ = DEFAULT_SYNC_INTERVAL;
        int syncTimeout_ = DEFAULT_SYNC_TIMEOUT;
        int suspicionMult_ = DEFAULT_SUSPICION_MULT;
        int removedMembersHistorySize_ = DEFAULT_REMOVED_MEMBERS_HISTORY_SIZE;
        std::string namespace_ = DEFAULT_NAMESPACE;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Membership::MembershipConfig type.
     *
     * @param[in] config
     *     This is the configuration to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the configuration.
     */
    void PrintTo(
        const MembershipConfig& config,
        std::ostream* os
    );

    /**
     * Return a human-readable string representation of the given network
     * profile.
     *
     * @param[in] profile
     *     This is the network profile to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given network
     *     profile is returned.
     */
    std::string NetworkProfileToString(NetworkProfile profile);

}

#endif /* MEMBERSHIP_MEMBERSHIP_CONFIG_HPP */
