#include "gtest/gtest.h"
#include "monitor/DiffEngine.hpp"
#include "common/Render.hpp"

using namespace switch_watch::common;
using switch_watch::monitor::DiffEngine;

namespace
{
    PortState MakePort(int number, const std::string &status = "Enabled", const std::string &speed = "1000MF")
    {
        PortState port;
        port.port_number = number;
        port.status = status;
        port.speed_config = "Auto";
        port.speed_actual = speed;
        port.flow_control_config = "Off";
        port.flow_control_actual = "Off";
        return port;
    }

    VlanState MakeVlan(int id, std::set<int> untagged, const std::string &name = "")
    {
        VlanState vlan;
        vlan.vlan_id = id;
        vlan.name = name;
        vlan.untagged_ports = std::move(untagged);
        return vlan;
    }

    DeviceSnapshot MakeSnapshot()
    {
        DeviceSnapshot snapshot;
        snapshot.system_info.device_name = "TL-SG108E";
        snapshot.system_info.mac_address = "50:C7:BF:00:11:22";
        snapshot.system_info.firmware_version = "1.0.0";
        snapshot.system_info.quality = ParseQuality::Parsed;
        snapshot.ports = {MakePort(1), MakePort(2, "Enabled", "Link Down"), MakePort(3)};
        snapshot.vlans = {MakeVlan(1, {1, 2, 3}, "Default")};
        snapshot.cable_diagnostics = {DiagnosticState{}};
        snapshot.cable_diagnostics[0].port_number = 1;
        snapshot.cable_diagnostics[0].state_code = 1;
        snapshot.cable_diagnostics[0].state_description = "Normal";
        snapshot.cable_diagnostics[0].length_meters = 12;
        snapshot.captured_at = Clock::now();
        return snapshot;
    }

    DeviceSnapshot Later(DeviceSnapshot snapshot)
    {
        snapshot.captured_at += std::chrono::seconds(30);
        return snapshot;
    }
}

class DiffEngineTest : public ::testing::Test
{
protected:
    DiffEngine engine{"192.168.0.1"};
};

TEST_F(DiffEngineTest, IdenticalSnapshotsProduceNoEvents)
{
    const DeviceSnapshot snapshot = MakeSnapshot();
    EXPECT_TRUE(engine.Diff(&snapshot, snapshot).empty());
    EXPECT_TRUE(engine.Diff(&snapshot, Later(snapshot)).empty());
}

TEST_F(DiffEngineTest, FirstSnapshotIsBaseline)
{
    const DeviceSnapshot snapshot = MakeSnapshot();
    const auto events = engine.Diff(nullptr, snapshot);

    ASSERT_EQ(events.size(), 1u + 3u + 1u + 1u);
    for (const auto &event : events)
    {
        EXPECT_EQ(event.change_kind, ChangeKind::PeriodicSnapshot);
        EXPECT_EQ(event.device, "192.168.0.1");
        EXPECT_TRUE(event.previous_value.empty());
        EXPECT_EQ(event.timestamp, snapshot.captured_at);
    }
    EXPECT_EQ(events[0].entity_type, entity::SYSTEM);
    EXPECT_EQ(events[0].new_value, RenderSystemInfo(snapshot.system_info));
    EXPECT_EQ(events[1].entity_type, entity::PORT);
    EXPECT_EQ(events[1].entity_key, 1);
    EXPECT_EQ(events[4].entity_type, entity::VLAN);
    EXPECT_EQ(events[5].entity_type, entity::CABLE);
}

TEST_F(DiffEngineTest, PortStatusChangeIsSingleStatusEvent)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.ports[2].status = "Disabled";

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entity_type, "port");
    EXPECT_EQ(events[0].entity_key, 3);
    EXPECT_EQ(events[0].change_kind, ChangeKind::StatusChange);
    EXPECT_EQ(events[0].previous_value, "Enabled");
    EXPECT_EQ(events[0].new_value, "Disabled");
    EXPECT_EQ(events[0].timestamp, current.captured_at);
}

TEST_F(DiffEngineTest, ConfiguredSpeedIsConfigChange)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.ports[0].speed_config = "100MF";

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].change_kind, ChangeKind::ConfigChange);
    EXPECT_EQ(events[0].previous_value, "Auto");
    EXPECT_EQ(events[0].new_value, "100MF");
}

TEST_F(DiffEngineTest, SeveralPortFieldsAreNamed)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.ports[1].speed_actual = "100MF";
    current.ports[1].trunk = "LAG2";

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].change_kind, ChangeKind::StatusChange);
    EXPECT_EQ(events[0].previous_value, "SpeedActual: Link Down, Trunk: ");
    EXPECT_EQ(events[0].new_value, "SpeedActual: 100MF, Trunk: LAG2");
}

TEST_F(DiffEngineTest, PortAppearingAndVanishing)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.ports.erase(current.ports.begin() + 1);
    current.ports.push_back(MakePort(4));

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].entity_key, 4);
    EXPECT_EQ(events[0].change_kind, ChangeKind::PeriodicSnapshot);
    EXPECT_EQ(events[1].entity_key, 2);
    EXPECT_EQ(events[1].change_kind, ChangeKind::StatusChange);
    EXPECT_EQ(events[1].previous_value, "Present");
    EXPECT_EQ(events[1].new_value, "Absent");
}

TEST_F(DiffEngineTest, VlanLifecycle)
{
    DeviceSnapshot previous = MakeSnapshot();
    previous.vlans.push_back(MakeVlan(20, {5}));
    DeviceSnapshot current = Later(previous);
    current.vlans[0].untagged_ports.insert(4);
    current.vlans.erase(current.vlans.begin() + 1);
    current.vlans.push_back(MakeVlan(30, {6, 7}, "Guests"));

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].entity_key, 1);
    EXPECT_EQ(events[0].change_kind, ChangeKind::ConfigChange);
    EXPECT_EQ(events[0].previous_value, "Name: Default, Tagged: , Untagged: 1-3");
    EXPECT_EQ(events[0].new_value, "Name: Default, Tagged: , Untagged: 1-4");
    EXPECT_EQ(events[1].entity_key, 30);
    EXPECT_EQ(events[1].change_kind, ChangeKind::VlanCreated);
    EXPECT_EQ(events[2].entity_key, 20);
    EXPECT_EQ(events[2].change_kind, ChangeKind::VlanDeleted);
    EXPECT_TRUE(events[2].new_value.empty());
}

TEST_F(DiffEngineTest, SystemChangeIsOneEvent)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.system_info.firmware_version = "1.0.1";
    current.system_info.device_name = "Core";

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entity_type, entity::SYSTEM);
    EXPECT_EQ(events[0].change_kind, ChangeKind::ConfigChange);
    EXPECT_EQ(events[0].previous_value, "Device Description: TL-SG108E\nFirmware Version: 1.0.0\n");
    EXPECT_EQ(events[0].new_value, "Device Description: Core\nFirmware Version: 1.0.1\n");
}

TEST_F(DiffEngineTest, CableChangeIsStatusChange)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.cable_diagnostics[0].state_code = 2;
    current.cable_diagnostics[0].state_description = "Open";
    current.cable_diagnostics[0].length_meters = 7;

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entity_type, entity::CABLE);
    EXPECT_EQ(events[0].change_kind, ChangeKind::StatusChange);
    EXPECT_EQ(events[0].previous_value, "Normal (12 m)");
    EXPECT_EQ(events[0].new_value, "Open (7 m)");
}

TEST_F(DiffEngineTest, VanishedCableDiagnosticIsAbsent)
{
    const DeviceSnapshot previous = MakeSnapshot();
    DeviceSnapshot current = Later(previous);
    current.cable_diagnostics.clear();

    const auto events = engine.Diff(&previous, current);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entity_type, entity::CABLE);
    EXPECT_EQ(events[0].entity_key, 1);
    EXPECT_EQ(events[0].change_kind, ChangeKind::StatusChange);
    EXPECT_EQ(events[0].previous_value, "Present");
    EXPECT_EQ(events[0].new_value, "Absent");
}

TEST_F(DiffEngineTest, ConnectivityEvents)
{
    const auto when = Clock::now();

    const ChangeEvent first = DiffEngine::MakeConnectivityEvent("sw", std::nullopt, true, "latency 4 ms", when);
    EXPECT_EQ(first.entity_type, entity::SWITCH);
    EXPECT_EQ(first.entity_key, 0);
    EXPECT_EQ(first.change_kind, ChangeKind::ConnectivityChange);
    EXPECT_EQ(first.previous_value, "Unknown");
    EXPECT_EQ(first.new_value, "Reachable (latency 4 ms)");

    const ChangeEvent down = DiffEngine::MakeConnectivityEvent("sw", true, false, "", when);
    EXPECT_EQ(down.previous_value, "Reachable");
    EXPECT_EQ(down.new_value, "Unreachable");
    EXPECT_EQ(down.timestamp, when);
}
