#include "gtest/gtest.h"
#include "common/ResponseParser.hpp"
#include "SamplePages.hpp"

using namespace switch_watch::common;
namespace pages = switch_watch::test_pages;

namespace
{
    const VlanState *FindVlan(const VlanConfig &config, int id)
    {
        for (const auto &vlan : config.vlans)
        {
            if (vlan.vlan_id == id)
                return &vlan;
        }
        return nullptr;
    }
}

TEST(ResponseParserTest, SystemInfoFromArrayLiteral)
{
    const SystemInfo info = ResponseParser::ParseSystemInfo(pages::SYSTEM_INFO);

    EXPECT_EQ(info.quality, ParseQuality::Parsed);
    EXPECT_EQ(info.device_name, "TL-SG108E");
    EXPECT_EQ(info.mac_address, "50:C7:BF:00:11:22");
    EXPECT_EQ(info.ip_address, "192.168.0.1");
    EXPECT_EQ(info.subnet_mask, "255.255.255.0");
    EXPECT_EQ(info.gateway, "192.168.0.254");
    EXPECT_EQ(info.firmware_version, "1.0.0 Build 20171214 Rel.70905");
    EXPECT_EQ(info.hardware_version, "TL-SG108E 3.0");
}

TEST(ResponseParserTest, SystemInfoFromObjectLiteral)
{
    const SystemInfo info = ResponseParser::ParseSystemInfo(pages::SYSTEM_INFO_OBJECT);

    EXPECT_EQ(info.quality, ParseQuality::Parsed);
    EXPECT_EQ(info.device_name, "TL-SG105E");
    EXPECT_EQ(info.mac_address, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(info.gateway, "10.0.0.1");
    EXPECT_EQ(info.hardware_version, "TL-SG105E 5.0");
}

TEST(ResponseParserTest, SystemInfoFromKeyValueLines)
{
    const SystemInfo info = ResponseParser::ParseSystemInfo(
        "Device Description : Office Switch\n"
        "MAC Address : 00:11:22:33:44:55\n"
        "firmware version : 2.0.1\n"
        "Uptime : 3 days\n");

    EXPECT_EQ(info.quality, ParseQuality::Parsed);
    EXPECT_EQ(info.device_name, "Office Switch");
    EXPECT_EQ(info.mac_address, "00:11:22:33:44:55");
    EXPECT_EQ(info.firmware_version, "2.0.1");
    EXPECT_TRUE(info.ip_address.empty());
}

TEST(ResponseParserTest, UnrecognizedSystemInfoIsDefaulted)
{
    const SystemInfo info = ResponseParser::ParseSystemInfo("<html><body>hello</body></html>");

    EXPECT_EQ(info.quality, ParseQuality::Defaulted);
    EXPECT_TRUE(info.device_name.empty());
    EXPECT_TRUE(info.mac_address.empty());
}

TEST(ResponseParserTest, PortTableFromScriptBlock)
{
    const PortTable table = ResponseParser::ParsePortTable(pages::PORTS);

    ASSERT_EQ(table.quality, ParseQuality::Parsed);
    EXPECT_EQ(table.max_ports, 8);
    ASSERT_EQ(table.ports.size(), 8u);

    const PortState &first = table.ports[0];
    EXPECT_EQ(first.port_number, 1);
    EXPECT_EQ(first.status, "Enabled");
    EXPECT_EQ(first.speed_config, "Auto");
    EXPECT_EQ(first.speed_actual, "1000MF");
    EXPECT_EQ(first.flow_control_config, "Off");
    EXPECT_EQ(first.flow_control_actual, "Off");
    EXPECT_TRUE(first.trunk.empty());

    EXPECT_EQ(table.ports[1].speed_actual, "Link Down");
    EXPECT_FALSE(table.ports[1].IsConnected());
    EXPECT_EQ(table.ports[6].trunk, "LAG1");
    EXPECT_EQ(table.ports[7].status, "Disabled");
}

TEST(ResponseParserTest, PortTableMissingEntriesReadUnknown)
{
    const PortTable table = ResponseParser::ParsePortTable(
        "var max_port_num = 3;\n"
        "var all_info = {state:[1,9], spd_cfg:[1,1,1], spd_act:[6,6,6], fc_cfg:[0,0,0], fc_act:[0,0,0]};");

    ASSERT_EQ(table.ports.size(), 3u);
    EXPECT_EQ(table.ports[1].status, "Unknown");
    EXPECT_EQ(table.ports[2].status, "Unknown");
    EXPECT_EQ(table.ports[2].speed_actual, "1000MF");
}

TEST(ResponseParserTest, PortTableFromTextTable)
{
    const PortTable table = ResponseParser::ParsePortTable(
        "Port | Status | Speed Config | Speed Actual | Flow Config | Flow Actual | Trunk\n"
        "-----|--------|--------------|--------------|-------------|-------------|------\n"
        "3 | Disabled | Auto | Link Down | Off | Off | LAG1\n"
        "not a row\n"
        "1 | Enabled | Auto | 1000MF | Off | Off |\n");

    ASSERT_EQ(table.quality, ParseQuality::Parsed);
    ASSERT_EQ(table.ports.size(), 2u);
    EXPECT_EQ(table.ports[0].port_number, 1);
    EXPECT_TRUE(table.ports[0].trunk.empty());
    EXPECT_EQ(table.ports[1].port_number, 3);
    EXPECT_EQ(table.ports[1].trunk, "LAG1");
    EXPECT_EQ(table.max_ports, 3);
}

TEST(ResponseParserTest, PortTableHeaderWithoutRowsIsEmpty)
{
    const PortTable table = ResponseParser::ParsePortTable(
        "Port | Status | Speed Config | Speed Actual | Flow Config | Flow Actual | Trunk\n");

    EXPECT_EQ(table.quality, ParseQuality::Empty);
    EXPECT_TRUE(table.ports.empty());
    EXPECT_EQ(table.max_ports, DEFAULT_MAX_PORTS);
}

TEST(ResponseParserTest, UnrecognizedPortPageIsDefaulted)
{
    const PortTable table = ResponseParser::ParsePortTable("<html>login required</html>");

    EXPECT_EQ(table.quality, ParseQuality::Defaulted);
    EXPECT_TRUE(table.ports.empty());
    EXPECT_EQ(table.max_ports, DEFAULT_MAX_PORTS);
}

TEST(ResponseParserTest, Dot1qVlansDecodeTaggedAndUntaggedMasks)
{
    const VlanConfig config = ResponseParser::ParseVlanConfig(pages::DOT1Q_VLANS);

    ASSERT_EQ(config.quality, ParseQuality::Parsed);
    EXPECT_EQ(config.format, VlanFormat::Dot1q);
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.total_ports, 8);
    EXPECT_EQ(config.vlan_count, 2);

    const VlanState *mgmt = FindVlan(config, 10);
    ASSERT_NE(mgmt, nullptr);
    EXPECT_EQ(mgmt->name, "Mgmt");
    EXPECT_EQ(mgmt->tagged_ports, (std::set<int>{2, 3}));
    EXPECT_TRUE(mgmt->untagged_ports.empty());

    const VlanState *def = FindVlan(config, 1);
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->untagged_ports.size(), 8u);
}

TEST(ResponseParserTest, Dot1qEntriesStopAtShorterOfIdsAndNames)
{
    const VlanConfig config = ResponseParser::ParseStructuredVlans(
        "var qvlan_ds = {state:1, portNum:8, vids:[1,2,3], names:[\"a\",\"b\"], tagMbrs:[0,0,0], untagMbrs:[1,2,4]};");

    ASSERT_EQ(config.vlans.size(), 2u);
    EXPECT_EQ(config.vlan_count, 2);
    EXPECT_EQ(config.vlans[1].name, "b");
    EXPECT_EQ(config.vlans[1].untagged_ports, (std::set<int>{2}));
}

TEST(ResponseParserTest, Dot1qSkipsOutOfRangeIds)
{
    const VlanConfig config = ResponseParser::ParseStructuredVlans(
        "var qvlan_ds = {state:1, portNum:8, vids:[0,5000,7], names:[\"x\",\"y\",\"z\"], tagMbrs:[1,1,1], untagMbrs:[0,0,0]};");

    ASSERT_EQ(config.vlans.size(), 1u);
    EXPECT_EQ(config.vlans[0].vlan_id, 7);
    EXPECT_EQ(config.vlans[0].name, "z");
}

TEST(ResponseParserTest, Dot1qKeepsPortsThatAreBothTaggedAndUntagged)
{
    const VlanConfig config = ResponseParser::ParseStructuredVlans(
        "var qvlan_ds = {state:1, portNum:8, vids:[5], names:[\"both\"], tagMbrs:[0x3], untagMbrs:[0x1]};");

    ASSERT_EQ(config.vlans.size(), 1u);
    EXPECT_EQ(config.vlans[0].tagged_ports.count(1), 1u);
    EXPECT_EQ(config.vlans[0].untagged_ports.count(1), 1u);
}

TEST(ResponseParserTest, MalformedDot1qMaskYieldsDefaultConfig)
{
    VlanConfig config;
    EXPECT_NO_THROW(config = ResponseParser::ParseVlanConfig(
                        "var qvlan_ds = {state:1, portNum:8, vids:[1], names:[\"x\"], tagMbrs:[0xZZ], untagMbrs:[0]};"));

    EXPECT_EQ(config.quality, ParseQuality::Defaulted);
    EXPECT_FALSE(config.enabled);
    EXPECT_EQ(config.total_ports, DEFAULT_MAX_PORTS);
    EXPECT_EQ(config.vlan_count, 0);
    EXPECT_TRUE(config.vlans.empty());
}

TEST(ResponseParserTest, Dot1qArraysTolerateTrailingCommas)
{
    const VlanConfig config = ResponseParser::ParseVlanConfig(
        "var qvlan_ds = { state:1, portNum:8, count:2, vids:[1,10,], names:['Default','v10',], "
        "tagMbrs:[0x0,0x6,], untagMbrs:[0xFF,0x0,] };");

    ASSERT_EQ(config.quality, ParseQuality::Parsed);
    EXPECT_EQ(config.vlan_count, 2);

    const VlanState *vlan = FindVlan(config, 10);
    ASSERT_NE(vlan, nullptr);
    EXPECT_EQ(vlan->name, "v10");
    EXPECT_EQ(vlan->tagged_ports, (std::set<int>{2, 3}));
    EXPECT_TRUE(vlan->untagged_ports.empty());
}

TEST(ResponseParserTest, PortTableSkipsBlankArrayEntries)
{
    const PortTable table = ResponseParser::ParsePortTable(
        "var max_port_num = 2;\n"
        "var all_info = {state:[1, ,0,], spd_cfg:[1,1,], spd_act:[6,0,], fc_cfg:[0,0,], fc_act:[0,0,]};");

    ASSERT_EQ(table.ports.size(), 2u);
    EXPECT_EQ(table.ports[0].status, "Enabled");
    EXPECT_EQ(table.ports[1].status, "Disabled");
    EXPECT_EQ(table.ports[1].speed_actual, "Link Down");
}

TEST(ResponseParserTest, PortBasedVlansAreUntaggedMembers)
{
    const VlanConfig config = ResponseParser::ParseVlanConfig(pages::PORT_BASED_VLANS);

    ASSERT_EQ(config.quality, ParseQuality::Parsed);
    EXPECT_EQ(config.format, VlanFormat::PortBased);
    EXPECT_EQ(config.vlan_count, 2);

    const VlanState *vlan = FindVlan(config, 2);
    ASSERT_NE(vlan, nullptr);
    EXPECT_EQ(vlan->untagged_ports, (std::set<int>{3, 4}));
    EXPECT_TRUE(vlan->tagged_ports.empty());
}

TEST(ResponseParserTest, LegacyRowWithoutHeaderIsParsed)
{
    const VlanConfig config = ResponseParser::ParseVlanConfig("1 | 1-4");

    ASSERT_EQ(config.vlans.size(), 1u);
    EXPECT_EQ(config.vlans[0].vlan_id, 1);
    EXPECT_EQ(config.vlans[0].untagged_ports, (std::set<int>{1, 2, 3, 4}));
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.format, VlanFormat::LegacyTable);
}

TEST(ResponseParserTest, LegacyTableWithStatusLines)
{
    const VlanConfig config = ResponseParser::ParseVlanConfig(
        "Status: Disabled\n"
        "Total Ports: 8\n"
        "Number of VLANs: 2\n"
        "\n"
        "VLAN ID | Member Ports\n"
        "--------|-------------\n"
        "1 | 1-4,7,3\n"
        "20 | 5-6\n");

    EXPECT_FALSE(config.enabled);
    EXPECT_EQ(config.total_ports, 8);
    ASSERT_EQ(config.vlans.size(), 2u);
    EXPECT_EQ(config.vlans[0].untagged_ports, (std::set<int>{1, 2, 3, 4, 7}));
    EXPECT_EQ(config.vlans[1].vlan_id, 20);
    EXPECT_EQ(config.vlan_count, 2);
}

TEST(ResponseParserTest, GarbageVlanPageNeverThrows)
{
    for (const char *text : {"", "hello world", "var qvlan_ds = {", "vids:[a,b] mbrs:[1]", "tagMbrs:[[[", "|||"})
    {
        VlanConfig config;
        EXPECT_NO_THROW(config = ResponseParser::ParseVlanConfig(text)) << text;
        EXPECT_TRUE(config.vlans.empty()) << text;
    }

    const VlanConfig config = ResponseParser::ParseVlanConfig("hello world");
    EXPECT_EQ(config.quality, ParseQuality::Defaulted);
    EXPECT_EQ(config.total_ports, DEFAULT_MAX_PORTS);
}

TEST(ResponseParserTest, PortRangeParsing)
{
    EXPECT_EQ(ResponseParser::ParsePortRange("1-4,7"), (std::vector<int>{1, 2, 3, 4, 7}));
    EXPECT_EQ(ResponseParser::ParsePortRange("7, 1-3 ,2,bad,50,3-1"), (std::vector<int>{1, 2, 3, 7}));
    EXPECT_EQ(ResponseParser::ParsePortRange("0-2,47-60"), (std::vector<int>{1, 2, 47, 48}));
    EXPECT_TRUE(ResponseParser::ParsePortRange("").empty());
}

TEST(ResponseParserTest, CableStatesMapToCategories)
{
    const CableDiagnostics result = ResponseParser::ParseCableDiagnostics(pages::CABLES);

    ASSERT_EQ(result.quality, ParseQuality::Parsed);
    EXPECT_EQ(result.max_ports, 8);
    ASSERT_EQ(result.diagnostics.size(), 8u);

    EXPECT_EQ(result.diagnostics[0].state_description, "Normal");
    EXPECT_EQ(result.diagnostics[0].length_meters, 15);
    EXPECT_EQ(result.diagnostics[0].Category(), CableCategory::Healthy);
    EXPECT_EQ(result.diagnostics[1].state_description, "No Cable");
    EXPECT_EQ(result.diagnostics[1].Category(), CableCategory::Disconnected);
    EXPECT_EQ(result.diagnostics[2].state_description, "Open");
    EXPECT_EQ(result.diagnostics[2].Category(), CableCategory::Issue);
    EXPECT_EQ(result.diagnostics[3].state_description, "--");
    EXPECT_EQ(result.diagnostics[3].Category(), CableCategory::Untested);
    EXPECT_EQ(result.diagnostics[4].state_description, "Short");
    EXPECT_EQ(result.diagnostics[5].state_description, "Open & Short");
    EXPECT_EQ(result.diagnostics[6].state_description, "Cross Cable");
    EXPECT_EQ(result.diagnostics[7].state_description, "Others");
    EXPECT_EQ(result.diagnostics[7].Category(), CableCategory::Unknown);
}

TEST(ResponseParserTest, CableEntriesLimitedByMaxPort)
{
    const CableDiagnostics result = ResponseParser::ParseCableDiagnostics(
        "var maxPort=2;\nvar cablestate=[1,x,1,1];\nvar cablelength=[3];");

    ASSERT_EQ(result.diagnostics.size(), 2u);
    EXPECT_EQ(result.diagnostics[1].state_code, -1);
    EXPECT_TRUE(result.diagnostics[1].untested);
    EXPECT_EQ(result.diagnostics[1].length_meters, -1);
}

TEST(ResponseParserTest, MissingCableArrayIsDefaulted)
{
    const CableDiagnostics result = ResponseParser::ParseCableDiagnostics("<html></html>");

    EXPECT_EQ(result.quality, ParseQuality::Defaulted);
    EXPECT_TRUE(result.diagnostics.empty());
}
