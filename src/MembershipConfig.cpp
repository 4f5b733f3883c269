/**
 * @file MembershipConfig.cpp
 *
 * This module contains the implementation of the
 * Membership::MembershipConfig class.
 *
 * © 2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <Json/Value.hpp>
#include <Membership/MembershipConfig.hpp>
#include <sstream>

namespace {

    /**
     * Return the seed member list shared by every configuration which
     * has no seed members.
     *
     * @return
     *     The shared empty seed member list is returned.
     */
    const std::shared_ptr< const std::vector< Membership::Address > >& NoSeedMembers() {
        static const std::shared_ptr< const std::vector< Membership::Address > > noSeedMembers(
            std::make_shared< std::vector< Membership::Address > >()
        );
        return noSeedMembers;
    }

}

namespace Membership {

    MembershipConfig::~MembershipConfig() noexcept = default;
    MembershipConfig::MembershipConfig(const MembershipConfig&) = default;
    MembershipConfig::MembershipConfig(MembershipConfig&&) noexcept = default;
    MembershipConfig& MembershipConfig::operator=(const MembershipConfig&) = default;
    MembershipConfig& MembershipConfig::operator=(MembershipConfig&&) noexcept = default;

    MembershipConfig::MembershipConfig()
        : seedMembers_(NoSeedMembers())
    {
    }

    MembershipConfig MembershipConfig::DefaultConfig() {
        return MembershipConfig();
    }

    MembershipConfig MembershipConfig::DefaultLanConfig() {
        return DefaultConfig();
    }

    MembershipConfig MembershipConfig::DefaultWanConfig() {
        return DefaultConfig()
            .WithSuspicionMult(DEFAULT_WAN_SUSPICION_MULT)
            .WithSyncInterval(DEFAULT_WAN_SYNC_INTERVAL);
    }

    MembershipConfig MembershipConfig::DefaultLocalConfig() {
        return DefaultConfig()
            .WithSuspicionMult(DEFAULT_LOCAL_SUSPICION_MULT)
            .WithSyncInterval(DEFAULT_LOCAL_SYNC_INTERVAL);
    }

    MembershipConfig MembershipConfig::ForProfile(NetworkProfile profile) {
        switch (profile) {
            case NetworkProfile::Wan: return DefaultWanConfig();
            case NetworkProfile::Local: return DefaultLocalConfig();
            case NetworkProfile::Lan:
            default: return DefaultLanConfig();
        }
    }

    const std::vector< Address >& MembershipConfig::GetSeedMembers() const {
        // A moved-from configuration has no list of its own.
        if (seedMembers_ == nullptr) {
            return *NoSeedMembers();
        }
        return *seedMembers_;
    }

    MembershipConfig MembershipConfig::WithSeedMembers(std::initializer_list< Address > seedMembers) const {
        return WithSeedMembers(std::vector< Address >(seedMembers));
    }

    MembershipConfig MembershipConfig::WithSeedMembers(const std::vector< Address >& seedMembers) const {
        MembershipConfig config(*this);
        config.seedMembers_ = std::make_shared< std::vector< Address > >(seedMembers);
        return config;
    }

    int MembershipConfig::GetSyncInterval() const {
        return syncInterval_;
    }

    MembershipConfig MembershipConfig::WithSyncInterval(int syncInterval) const {
        MembershipConfig config(*this);
        config.syncInterval_ = syncInterval;
        return config;
    }

    int MembershipConfig::GetSyncTimeout() const {
        return syncTimeout_;
    }

    MembershipConfig MembershipConfig::WithSyncTimeout(int syncTimeout) const {
        MembershipConfig config(*this);
        config.syncTimeout_ = syncTimeout;
        return config;
    }

    int MembershipConfig::GetSuspicionMult() const {
        return suspicionMult_;
    }

    MembershipConfig MembershipConfig::WithSuspicionMult(int suspicionMult) const {
        MembershipConfig config(*this);
        config.suspicionMult_ = suspicionMult;
        return config;
    }

    const std::string& MembershipConfig::GetNamespace() const {
        return namespace_;
    }

    MembershipConfig MembershipConfig::WithNamespace(const std::string& ns) const {
        MembershipConfig config(*this);
        config.namespace_ = ns;
        return config;
    }

    int MembershipConfig::GetRemovedMembersHistorySize() const {
        return removedMembersHistorySize_;
    }

    MembershipConfig MembershipConfig::WithRemovedMembersHistorySize(int removedMembersHistorySize) const {
        MembershipConfig config(*this);
        config.removedMembersHistorySize_ = removedMembersHistorySize;
        return config;
    }

    std::string MembershipConfig::ToString() const {
        std::ostringstream builder;
        builder
            << "MembershipConfig["
            << "seedMembers=" << FormatList(GetSeedMembers())
            << ", syncInterval=" << syncInterval_
            << ", syncTimeout=" << syncTimeout_
            << ", suspicionMult=" << suspicionMult_
            << ", namespace='" << namespace_ << '\''
            << ", removedMembersHistorySize=" << removedMembersHistorySize_
            << ']';
        return builder.str();
    }

    MembershipConfig::operator Json::Value() const {
        auto seedMembersArray = Json::Array({});
        for (const auto& seedMember: GetSeedMembers()) {
            seedMembersArray.Add(seedMember.ToString());
        }
        return Json::Object({
            {"seedMembers", std::move(seedMembersArray)},
            {"syncInterval", syncInterval_},
            {"syncTimeout", syncTimeout_},
            {"suspicionMult", suspicionMult_},
            {"namespace", namespace_},
            {"removedMembersHistorySize", removedMembersHistorySize_},
        });
    }

    bool MembershipConfig::operator==(const MembershipConfig& other) const {
        return (
            (syncInterval_ == other.syncInterval_)
            && (syncTimeout_ == other.syncTimeout_)
            && (suspicionMult_ == other.suspicionMult_)
            && (removedMembersHistorySize_ == other.removedMembersHistorySize_)
            && (namespace_ == other.namespace_)
            && (GetSeedMembers() == other.GetSeedMembers())
        );
    }

    bool MembershipConfig::operator!=(const MembershipConfig& other) const {
        return !(*this == other);
    }

    void PrintTo(
        const MembershipConfig& config,
        std::ostream* os
    ) {
        *os << config.ToString();
    }

    std::string NetworkProfileToString(NetworkProfile profile) {
        switch (profile) {
            case NetworkProfile::Lan: return "lan";
            case NetworkProfile::Wan: return "wan";
            case NetworkProfile::Local: return "local";
            default: return "???";
        }
    }

}
