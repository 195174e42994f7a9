#include "Render.hpp"
#include <sstream>

namespace switch_watch::common
{
    std::string FormatPortRanges(const std::set<int> &ports)
    {
        std::ostringstream out;
        auto it = ports.begin();
        bool first = true;
        while (it != ports.end())
        {
            const int start = *it;
            int end = start;
            ++it;
            while (it != ports.end() && *it == end + 1)
            {
                end = *it;
                ++it;
            }

            if (!first)
                out << ',';
            first = false;

            out << start;
            if (end != start)
                out << '-' << end;
        }
        return out.str();
    }

    std::string FormatPortRanges(const std::vector<int> &ports)
    {
        return FormatPortRanges(std::set<int>(ports.begin(), ports.end()));
    }

    std::string RenderSystemInfo(const SystemInfo &info)
    {
        std::ostringstream out;
        out << "Device Description : " << info.device_name << "\n"
            << "MAC Address : " << info.mac_address << "\n"
            << "IP Address : " << info.ip_address << "\n"
            << "Subnet Mask : " << info.subnet_mask << "\n"
            << "Gateway : " << info.gateway << "\n"
            << "Firmware Version : " << info.firmware_version << "\n"
            << "Hardware Version : " << info.hardware_version << "\n";
        return out.str();
    }

    std::string RenderPortTable(const std::vector<PortState> &ports)
    {
        std::ostringstream out;
        out << "Port | Status | Speed Config | Speed Actual | Flow Config | Flow Actual | Trunk\n";
        out << "-----|--------|--------------|--------------|-------------|-------------|------\n";
        for (const auto &port : ports)
        {
            out << port.port_number << " | " << port.status << " | "
                << port.speed_config << " | " << port.speed_actual << " | "
                << port.flow_control_config << " | " << port.flow_control_actual << " | "
                << port.trunk << "\n";
        }
        return out.str();
    }

    std::string RenderVlanTable(const VlanConfig &config)
    {
        std::ostringstream out;
        out << "Status: " << (config.enabled ? "Enabled" : "Disabled") << "\n";
        out << "Total Ports: " << config.total_ports << "\n";
        out << "Number of VLANs: " << config.vlan_count << "\n\n";
        out << "VLAN ID | Member Ports\n";
        out << "--------|-------------\n";
        for (const auto &vlan : config.vlans)
        {
            std::set<int> members = vlan.untagged_ports;
            members.insert(vlan.tagged_ports.begin(), vlan.tagged_ports.end());
            out << vlan.vlan_id << " | " << FormatPortRanges(members) << "\n";
        }
        return out.str();
    }

    std::string RenderCableTable(const std::vector<DiagnosticState> &diagnostics)
    {
        std::ostringstream out;
        out << "Port | State | Length (m)\n";
        out << "-----|-------|-----------\n";
        for (const auto &diag : diagnostics)
        {
            out << diag.port_number << " | " << diag.state_description << " | ";
            if (diag.length_meters >= 0)
                out << diag.length_meters;
            else
                out << "--";
            out << "\n";
        }
        return out.str();
    }

    std::string DescribePort(const PortState &port)
    {
        std::ostringstream out;
        out << "Status: " << port.status
            << ", SpeedConfig: " << port.speed_config
            << ", SpeedActual: " << port.speed_actual
            << ", FlowControlConfig: " << port.flow_control_config
            << ", FlowControlActual: " << port.flow_control_actual
            << ", Trunk: " << (port.trunk.empty() ? "-" : port.trunk);
        return out.str();
    }

    std::string DescribeVlan(const VlanState &vlan)
    {
        std::ostringstream out;
        out << "Name: " << vlan.name
            << ", Tagged: " << FormatPortRanges(vlan.tagged_ports)
            << ", Untagged: " << FormatPortRanges(vlan.untagged_ports);
        return out.str();
    }

    std::string DescribeDiagnostic(const DiagnosticState &diag)
    {
        std::ostringstream out;
        out << diag.state_description;
        if (diag.length_meters >= 0)
            out << " (" << diag.length_meters << " m)";
        return out.str();
    }
}
