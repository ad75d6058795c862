/**
 * @file instance_provisioner_tests.cpp
 * @brief Launch tagging, failure mapping and agent readiness
 *
 * @date 2025
 */

#include "fake_services.hpp"

#include "stratus/core/errors.hpp"
#include "stratus/core/instance_provisioner.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace stratus;
using namespace stratus::core;
using services::AgentInfo;

TEST(InstanceProvisionerTest, LaunchesOneTaggedInstance) {
    fakes::FakeWorld world;
    auto config = fakes::MakeConfig();

    InstanceProvisioner provisioner(world.control_plane);
    auto handle = provisioner.Provision(config, "my_task");

    EXPECT_EQ(handle.instance_id, "i-0123456789abcdef0");
    EXPECT_EQ(handle.region, "us-west-2");

    ASSERT_EQ(world.control_plane->launches.size(), 1u);
    const auto& request = world.control_plane->launches[0];
    EXPECT_EQ(request.image_id, "ami-1");
    EXPECT_EQ(request.instance_type, "t3a.large");
    EXPECT_EQ(request.security_group_id, "sg-1");
    EXPECT_EQ(request.subnet_id, "subnet-1");
    EXPECT_EQ(request.instance_profile, "sandbox-profile");

    utils::TagSet expected = {
        {"owner", "tests"},
        {"Name", "inspect_ec2_sandbox_my_task"},
        {"inspect_task", "my_task"},
        {"inspect_sandbox", "true"},
    };
    EXPECT_EQ(request.tags, expected);

    ASSERT_EQ(world.log->size(), 2u);
    EXPECT_EQ((*world.log)[0], "launch");
    EXPECT_EQ((*world.log)[1], "wait_running:i-0123456789abcdef0");
}

TEST(InstanceProvisionerTest, LaunchErrorKeepsServiceCodeAndMessage) {
    fakes::FakeWorld world;
    world.control_plane->launch_error = ServiceError("ec2", "InvalidAMIID.NotFound",
                                                     "The image id '[ami-1]' does not exist");

    InstanceProvisioner provisioner(world.control_plane);
    try {
        provisioner.Provision(fakes::MakeConfig(), "task");
        FAIL() << "expected ProvisioningFailure";
    } catch (const ProvisioningFailure& e) {
        EXPECT_EQ(e.Code(), "InvalidAMIID.NotFound");
        EXPECT_EQ(e.Detail(), "The image id '[ami-1]' does not exist");
    }
    EXPECT_EQ(world.control_plane->launches.size(), 1u);
}

TEST(InstanceProvisionerTest, WaiterErrorIsProvisioningFailure) {
    fakes::FakeWorld world;
    world.control_plane->wait_error = ServiceError("ec2", "WaiterError", "instance terminated");

    InstanceProvisioner provisioner(world.control_plane);
    EXPECT_THROW(provisioner.Provision(fakes::MakeConfig(), "task"), ProvisioningFailure);
}

class AgentReadinessWaiterTest : public ::testing::Test {
protected:
    AgentReadinessWaiter MakeWaiter() {
        return AgentReadinessWaiter(world.relay, fakes::RecordingSleeper(pauses));
    }

    static std::function<std::vector<AgentInfo>()> Returns(std::vector<AgentInfo> records) {
        return [records] { return records; };
    }

    fakes::FakeWorld world;
    std::shared_ptr<std::vector<std::chrono::milliseconds>> pauses =
        std::make_shared<std::vector<std::chrono::milliseconds>>();
};

TEST_F(AgentReadinessWaiterTest, ReadyWhenSingleOnlineRecord) {
    world.relay->inventory = {
        Returns({}),
        Returns({AgentInfo{"i-1", "ConnectionLost"}}),
        Returns({AgentInfo{"i-1", "Online"}}),
    };

    EXPECT_NO_THROW(MakeWaiter().AwaitReady("i-1", "us-west-2"));
    EXPECT_EQ(world.relay->inventory_calls, 3);
    EXPECT_EQ(world.relay->inventory_queries[0], "i-1");
    ASSERT_EQ(pauses->size(), 2u);
    EXPECT_EQ((*pauses)[0], std::chrono::milliseconds(30000));
}

TEST_F(AgentReadinessWaiterTest, TwoRecordsAreNotReady) {
    world.relay->inventory = {
        Returns({AgentInfo{"i-1", "Online"}, AgentInfo{"i-1", "Online"}}),
    };
    EXPECT_FALSE(MakeWaiter().IsReady("i-1"));
}

TEST_F(AgentReadinessWaiterTest, ProbeErrorsCountAsNotReady) {
    world.relay->inventory = {
        [] () -> std::vector<AgentInfo> { throw ServiceError("ssm", "ThrottlingException", "Rate exceeded"); },
        Returns({AgentInfo{"i-1", "Online"}}),
    };

    EXPECT_NO_THROW(MakeWaiter().AwaitReady("i-1", "us-west-2"));
    EXPECT_EQ(world.relay->inventory_calls, 2);
}

TEST_F(AgentReadinessWaiterTest, GivesUpAfterTwentyAttempts) {
    world.relay->inventory = {Returns({})};

    try {
        MakeWaiter().AwaitReady("i-1", "us-west-2");
        FAIL() << "expected ReadinessTimeout";
    } catch (const ReadinessTimeout& e) {
        EXPECT_EQ(e.Attempts(), 20);
        EXPECT_EQ(e.InstanceId(), "i-1");
    }
    EXPECT_EQ(world.relay->inventory_calls, 20);
    EXPECT_EQ(pauses->size(), 19u);
}
