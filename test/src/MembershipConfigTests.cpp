/**
 * @file MembershipConfigTests.cpp
 *
 * This module contains the unit tests of the
 * Membership::MembershipConfig class.
 *
 * © 2020 by Richard Walters
 */

#include <functional>
#include <gtest/gtest.h>
#include <Json/Value.hpp>
#include <Membership/MembershipConfig.hpp>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

    /**
     * Return a configuration in which every property differs from
     * the defaults.
     *
     * @return
     *     A configuration in which every property differs from
     *     the defaults is returned.
     */
    Membership::MembershipConfig MakeNonDefaultConfig() {
        return Membership::MembershipConfig::DefaultConfig()
            .WithSeedMembers({
                {"10.0.0.1", 4801},
                {"10.0.0.2", 4801},
            })
            .WithSyncInterval(1000)
            .WithSyncTimeout(200)
            .WithSuspicionMult(7)
            .WithNamespace("orders")
            .WithRemovedMembersHistorySize(100);
    }

    /**
     * This is the type of function which derives a new configuration
     * from a given one.
     */
    typedef std::function<
        Membership::MembershipConfig(const Membership::MembershipConfig&)
    > Mutator;

    /**
     * Return one mutator for each property of the configuration.  Each
     * mutator sets its property to a value none of the other tests use.
     *
     * @return
     *     One mutator for each property of the configuration is returned.
     */
    std::vector< Mutator > MakeMutators() {
        return {
            [](const Membership::MembershipConfig& config){
                return config.WithSeedMembers({{"192.168.1.9", 1234}});
            },
            [](const Membership::MembershipConfig& config){
                return config.WithSyncInterval(12345);
            },
            [](const Membership::MembershipConfig& config){
                return config.WithSyncTimeout(54321);
            },
            [](const Membership::MembershipConfig& config){
                return config.WithSuspicionMult(11);
            },
            [](const Membership::MembershipConfig& config){
                return config.WithNamespace("inventory");
            },
            [](const Membership::MembershipConfig& config){
                return config.WithRemovedMembersHistorySize(9);
            },
        };
    }

}

TEST(MembershipConfigTests, Default_Config) {
    // Arrange

    // Act
    const auto config = Membership::MembershipConfig::DefaultConfig();

    // Assert
    EXPECT_EQ(30000, config.GetSyncInterval());
    EXPECT_EQ(3000, config.GetSyncTimeout());
    EXPECT_EQ(5, config.GetSuspicionMult());
    EXPECT_EQ(42, config.GetRemovedMembersHistorySize());
    EXPECT_EQ("default", config.GetNamespace());
    EXPECT_TRUE(config.GetSeedMembers().empty());
}

TEST(MembershipConfigTests, Default_Constructor_Matches_Default_Config) {
    // Arrange
    const Membership::MembershipConfig config;

    // Act

    // Assert
    EXPECT_EQ(Membership::MembershipConfig::DefaultConfig(), config);
}

TEST(MembershipConfigTests, Lan_Config_Is_Default_Config) {
    // Arrange

    // Act
    const auto config = Membership::MembershipConfig::DefaultLanConfig();

    // Assert
    EXPECT_EQ(Membership::MembershipConfig::DefaultConfig(), config);
}

TEST(MembershipConfigTests, Wan_Config) {
    // Arrange
    const auto defaults = Membership::MembershipConfig::DefaultConfig();

    // Act
    const auto config = Membership::MembershipConfig::DefaultWanConfig();

    // Assert
    EXPECT_EQ(6, config.GetSuspicionMult());
    EXPECT_EQ(60000, config.GetSyncInterval());
    EXPECT_EQ(defaults.GetSyncTimeout(), config.GetSyncTimeout());
    EXPECT_EQ(defaults.GetRemovedMembersHistorySize(), config.GetRemovedMembersHistorySize());
    EXPECT_EQ(defaults.GetNamespace(), config.GetNamespace());
    EXPECT_EQ(defaults.GetSeedMembers(), config.GetSeedMembers());
}

TEST(MembershipConfigTests, Local_Config) {
    // Arrange
    const auto defaults = Membership::MembershipConfig::DefaultConfig();

    // Act
    const auto config = Membership::MembershipConfig::DefaultLocalConfig();

    // Assert
    EXPECT_EQ(3, config.GetSuspicionMult());
    EXPECT_EQ(15000, config.GetSyncInterval());
    EXPECT_EQ(defaults.GetSyncTimeout(), config.GetSyncTimeout());
    EXPECT_EQ(defaults.GetRemovedMembersHistorySize(), config.GetRemovedMembersHistorySize());
    EXPECT_EQ(defaults.GetNamespace(), config.GetNamespace());
    EXPECT_EQ(defaults.GetSeedMembers(), config.GetSeedMembers());
}

TEST(MembershipConfigTests, For_Profile) {
    // Arrange

    // Act
    const auto lan = Membership::MembershipConfig::ForProfile(Membership::NetworkProfile::Lan);
    const auto wan = Membership::MembershipConfig::ForProfile(Membership::NetworkProfile::Wan);
    const auto local = Membership::MembershipConfig::ForProfile(Membership::NetworkProfile::Local);

    // Assert
    EXPECT_EQ(Membership::MembershipConfig::DefaultLanConfig(), lan);
    EXPECT_EQ(Membership::MembershipConfig::DefaultWanConfig(), wan);
    EXPECT_EQ(Membership::MembershipConfig::DefaultLocalConfig(), local);
}

TEST(MembershipConfigTests, Network_Profile_To_String) {
    EXPECT_EQ("lan", Membership::NetworkProfileToString(Membership::NetworkProfile::Lan));
    EXPECT_EQ("wan", Membership::NetworkProfileToString(Membership::NetworkProfile::Wan));
    EXPECT_EQ("local", Membership::NetworkProfileToString(Membership::NetworkProfile::Local));
}

TEST(MembershipConfigTests, Mutators_Do_Not_Change_Receiver) {
    // Arrange
    const auto original = MakeNonDefaultConfig();
    const auto snapshot = original;
    const auto snapshotText = original.ToString();

    // Act
    for (const auto& mutator: MakeMutators()) {
        (void)mutator(original);
    }

    // Assert
    EXPECT_EQ(snapshot, original);
    EXPECT_EQ(snapshotText, original.ToString());
}

TEST(MembershipConfigTests, Each_Mutator_Changes_Exactly_One_Property) {
    // Arrange
    const auto original = MakeNonDefaultConfig();

    // Act
    const auto seedMembersChanged = original.WithSeedMembers({{"192.168.1.9", 1234}});
    const auto syncIntervalChanged = original.WithSyncInterval(12345);
    const auto syncTimeoutChanged = original.WithSyncTimeout(54321);
    const auto suspicionMultChanged = original.WithSuspicionMult(11);
    const auto namespaceChanged = original.WithNamespace("inventory");
    const auto historySizeChanged = original.WithRemovedMembersHistorySize(9);

    // Assert
    EXPECT_EQ(
        std::vector< Membership::Address >({{"192.168.1.9", 1234}}),
        seedMembersChanged.GetSeedMembers()
    );
    EXPECT_EQ(
        original,
        seedMembersChanged.WithSeedMembers(original.GetSeedMembers())
    );
    EXPECT_EQ(12345, syncIntervalChanged.GetSyncInterval());
    EXPECT_EQ(
        original,
        syncIntervalChanged.WithSyncInterval(original.GetSyncInterval())
    );
    EXPECT_EQ(54321, syncTimeoutChanged.GetSyncTimeout());
    EXPECT_EQ(
        original,
        syncTimeoutChanged.WithSyncTimeout(original.GetSyncTimeout())
    );
    EXPECT_EQ(11, suspicionMultChanged.GetSuspicionMult());
    EXPECT_EQ(
        original,
        suspicionMultChanged.WithSuspicionMult(original.GetSuspicionMult())
    );
    EXPECT_EQ("inventory", namespaceChanged.GetNamespace());
    EXPECT_EQ(
        original,
        namespaceChanged.WithNamespace(original.GetNamespace())
    );
    EXPECT_EQ(9, historySizeChanged.GetRemovedMembersHistorySize());
    EXPECT_EQ(
        original,
        historySizeChanged.WithRemovedMembersHistorySize(original.GetRemovedMembersHistorySize())
    );
}

TEST(MembershipConfigTests, Sync_Interval_Change_Keeps_Other_Properties) {
    // Arrange
    const auto original = MakeNonDefaultConfig();

    // Act
    const auto config = original.WithSyncInterval(777);

    // Assert
    EXPECT_EQ(777, config.GetSyncInterval());
    EXPECT_EQ(original.GetSeedMembers(), config.GetSeedMembers());
    EXPECT_EQ(original.GetSyncTimeout(), config.GetSyncTimeout());
    EXPECT_EQ(original.GetSuspicionMult(), config.GetSuspicionMult());
    EXPECT_EQ(original.GetNamespace(), config.GetNamespace());
    EXPECT_EQ(original.GetRemovedMembersHistorySize(), config.GetRemovedMembersHistorySize());
}

TEST(MembershipConfigTests, Seed_Members_Are_Copied) {
    // Arrange
    std::vector< Membership::Address > seedMembers{
        {"10.0.0.1", 4801},
        {"10.0.0.2", 4802},
    };
    const auto config = Membership::MembershipConfig::DefaultConfig().WithSeedMembers(seedMembers);

    // Act
    seedMembers.push_back({"10.0.0.3", 4803});
    seedMembers[0].port = 9999;

    // Assert
    EXPECT_EQ(
        std::vector< Membership::Address >({
            {"10.0.0.1", 4801},
            {"10.0.0.2", 4802},
        }),
        config.GetSeedMembers()
    );
}

TEST(MembershipConfigTests, Seed_Members_Keep_Order_And_Duplicates) {
    // Arrange

    // Act
    const auto config = Membership::MembershipConfig::DefaultConfig().WithSeedMembers({
        {"seed-b", 4801},
        {"seed-a", 4801},
        {"seed-b", 4801},
    });

    // Assert
    EXPECT_EQ(
        std::vector< Membership::Address >({
            {"seed-b", 4801},
            {"seed-a", 4801},
            {"seed-b", 4801},
        }),
        config.GetSeedMembers()
    );
}

TEST(MembershipConfigTests, Seed_Members_Shared_With_Derived_Configs) {
    // Arrange
    const auto original = MakeNonDefaultConfig();

    // Act
    const auto derived = original.WithNamespace("other");

    // Assert
    EXPECT_EQ(&original.GetSeedMembers(), &derived.GetSeedMembers());
}

TEST(MembershipConfigTests, Degenerate_Values_Accepted) {
    // Arrange

    // Act
    const auto config = Membership::MembershipConfig::DefaultConfig()
        .WithSyncInterval(0)
        .WithSyncTimeout(-1)
        .WithSuspicionMult(-5)
        .WithRemovedMembersHistorySize(-42)
        .WithNamespace("");

    // Assert
    EXPECT_EQ(0, config.GetSyncInterval());
    EXPECT_EQ(-1, config.GetSyncTimeout());
    EXPECT_EQ(-5, config.GetSuspicionMult());
    EXPECT_EQ(-42, config.GetRemovedMembersHistorySize());
    EXPECT_EQ("", config.GetNamespace());
}

TEST(MembershipConfigTests, Applying_Same_Mutator_Twice_Is_Same_As_Once) {
    // Arrange
    const auto config = MakeNonDefaultConfig();

    // Act
    const auto once = config.WithNamespace("x");
    const auto twice = config.WithNamespace("x").WithNamespace("x");

    // Assert
    EXPECT_EQ(once, twice);
    EXPECT_EQ(once.ToString(), twice.ToString());
}

TEST(MembershipConfigTests, Compare_Equal) {
    // Arrange
    const auto base = MakeNonDefaultConfig();
    std::vector< Membership::MembershipConfig > examples{base};
    for (const auto& mutator: MakeMutators()) {
        examples.push_back(mutator(base));
    }

    // Act
    const size_t numExamples = examples.size();
    for (size_t i = 0; i < numExamples; ++i) {
        for (size_t j = 0; j < numExamples; ++j) {
            if (i == j) {
                EXPECT_EQ(examples[i], examples[j]);
                EXPECT_EQ(examples[i].ToString(), examples[j].ToString());
            } else {
                EXPECT_NE(examples[i], examples[j]);
                EXPECT_NE(examples[i].ToString(), examples[j].ToString());
            }
        }
    }
}

TEST(MembershipConfigTests, Independently_Built_Configs_Are_Equal) {
    // Arrange

    // Act
    const auto first = MakeNonDefaultConfig();
    const auto second = Membership::MembershipConfig()
        .WithRemovedMembersHistorySize(100)
        .WithNamespace("orders")
        .WithSuspicionMult(7)
        .WithSyncTimeout(200)
        .WithSyncInterval(1000)
        .WithSeedMembers(std::vector< Membership::Address >({
            {"10.0.0.1", 4801},
            {"10.0.0.2", 4801},
        }));

    // Assert
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.ToString(), second.ToString());
}

TEST(MembershipConfigTests, To_String) {
    // Arrange
    const auto config = MakeNonDefaultConfig();

    // Act
    const auto text = config.ToString();

    // Assert
    EXPECT_EQ(
        "MembershipConfig["
        "seedMembers=[10.0.0.1:4801, 10.0.0.2:4801], "
        "syncInterval=1000, "
        "syncTimeout=200, "
        "suspicionMult=7, "
        "namespace='orders', "
        "removedMembersHistorySize=100"
        "]",
        text
    );
}

TEST(MembershipConfigTests, To_String_Default) {
    EXPECT_EQ(
        "MembershipConfig["
        "seedMembers=[], "
        "syncInterval=30000, "
        "syncTimeout=3000, "
        "suspicionMult=5, "
        "namespace='default', "
        "removedMembersHistorySize=42"
        "]",
        Membership::MembershipConfig::DefaultConfig().ToString()
    );
}

TEST(MembershipConfigTests, To_Json) {
    // Arrange
    const auto config = MakeNonDefaultConfig();

    // Act
    const Json::Value json = config;

    // Assert
    EXPECT_EQ(
        Json::Object({
            {"seedMembers", Json::Array({"10.0.0.1:4801", "10.0.0.2:4801"})},
            {"syncInterval", 1000},
            {"syncTimeout", 200},
            {"suspicionMult", 7},
            {"namespace", "orders"},
            {"removedMembersHistorySize", 100},
        }),
        json
    );
}

TEST(MembershipConfigTests, Moved_From_Config_Has_No_Seed_Members) {
    // Arrange
    auto config = MakeNonDefaultConfig();

    // Act
    const auto moved = std::move(config);

    // Assert
    EXPECT_EQ((size_t)2, moved.GetSeedMembers().size());
    EXPECT_TRUE(config.GetSeedMembers().empty());
}

TEST(MembershipConfigTests, Shared_Between_Threads) {
    // Arrange
    const auto config = MakeNonDefaultConfig();
    const auto expectedText = config.ToString();
    std::vector< std::thread > readers;
    std::vector< int > matched(8, 0);

    // Act
    for (size_t i = 0; i < matched.size(); ++i) {
        readers.emplace_back(
            [&config, &expectedText, &matched, i]{
                bool allMatched = true;
                for (int j = 0; j < 1000; ++j) {
                    const auto copy = config;
                    const auto derived = config.WithSyncInterval(j);
                    allMatched = (
                        allMatched
                        && (copy.ToString() == expectedText)
                        && (derived.GetSeedMembers() == config.GetSeedMembers())
                        && (derived.GetSyncInterval() == j)
                    );
                }
                matched[i] = (allMatched ? 1 : 0);
            }
        );
    }
    for (auto& reader: readers) {
        reader.join();
    }

    // Assert
    EXPECT_EQ(expectedText, config.ToString());
    for (size_t i = 0; i < matched.size(); ++i) {
        EXPECT_EQ(1, matched[i]) << i;
    }
}
