#include "DiffEngine.hpp"
#include "../common/Render.hpp"
#include <map>

namespace switch_watch::monitor
{
    using common::ChangeEvent;
    using common::ChangeKind;
    using common::DeviceSnapshot;

    namespace
    {
        struct FieldChange
        {
            const char *name;
            std::string before;
            std::string after;
            bool affects_status;
        };

        void Compare(std::vector<FieldChange> &changes, const char *name,
                     const std::string &before, const std::string &after, bool affectsStatus = false)
        {
            if (before != after)
                changes.push_back({name, before, after, affectsStatus});
        }

        // One field: bare values. Several: "Field: value, Field: value".
        std::pair<std::string, std::string> Summarize(const std::vector<FieldChange> &changes)
        {
            if (changes.size() == 1)
                return {changes.front().before, changes.front().after};

            std::string before;
            std::string after;
            for (const auto &change : changes)
            {
                if (!before.empty())
                {
                    before += ", ";
                    after += ", ";
                }
                before += std::string(change.name) + ": " + change.before;
                after += std::string(change.name) + ": " + change.after;
            }
            return {before, after};
        }

        std::vector<FieldChange> SystemChanges(const common::SystemInfo &a, const common::SystemInfo &b)
        {
            std::vector<FieldChange> changes;
            Compare(changes, "Device Description", a.device_name, b.device_name);
            Compare(changes, "MAC Address", a.mac_address, b.mac_address);
            Compare(changes, "IP Address", a.ip_address, b.ip_address);
            Compare(changes, "Subnet Mask", a.subnet_mask, b.subnet_mask);
            Compare(changes, "Gateway", a.gateway, b.gateway);
            Compare(changes, "Firmware Version", a.firmware_version, b.firmware_version);
            Compare(changes, "Hardware Version", a.hardware_version, b.hardware_version);
            return changes;
        }
    }

    DiffEngine::DiffEngine(std::string device) : m_device(std::move(device)) {}

    ChangeEvent DiffEngine::MakeEvent(const char *entityType, int key, ChangeKind kind,
                                      std::string previousValue, std::string newValue,
                                      common::TimePoint when) const
    {
        ChangeEvent event;
        event.device = m_device;
        event.entity_type = entityType;
        event.entity_key = key;
        event.change_kind = kind;
        event.previous_value = std::move(previousValue);
        event.new_value = std::move(newValue);
        event.timestamp = when;
        return event;
    }

    ChangeEvent DiffEngine::MakeConnectivityEvent(const std::string &device,
                                                  std::optional<bool> previousReachable,
                                                  bool reachable,
                                                  const std::string &detail,
                                                  common::TimePoint when)
    {
        ChangeEvent event;
        event.device = device;
        event.entity_type = common::entity::SWITCH;
        event.entity_key = 0;
        event.change_kind = ChangeKind::ConnectivityChange;
        if (previousReachable)
            event.previous_value = *previousReachable ? "Reachable" : "Unreachable";
        else
            event.previous_value = "Unknown";
        event.new_value = reachable ? "Reachable" : "Unreachable";
        if (!detail.empty())
            event.new_value += " (" + detail + ")";
        event.timestamp = when;
        return event;
    }

    std::vector<ChangeEvent> DiffEngine::Diff(const DeviceSnapshot *previous, const DeviceSnapshot &current) const
    {
        std::vector<ChangeEvent> events;
        if (!previous)
        {
            Baseline(current, events);
            return events;
        }

        DiffSystem(*previous, current, events);
        DiffPorts(*previous, current, events);
        DiffVlans(*previous, current, events);
        DiffCables(*previous, current, events);
        return events;
    }

    void DiffEngine::Baseline(const DeviceSnapshot &current, std::vector<ChangeEvent> &events) const
    {
        const auto when = current.captured_at;

        events.push_back(MakeEvent(common::entity::SYSTEM, 0, ChangeKind::PeriodicSnapshot,
                                   "", common::RenderSystemInfo(current.system_info), when));
        for (const auto &port : current.ports)
            events.push_back(MakeEvent(common::entity::PORT, port.port_number, ChangeKind::PeriodicSnapshot,
                                       "", common::DescribePort(port), when));
        for (const auto &vlan : current.vlans)
            events.push_back(MakeEvent(common::entity::VLAN, vlan.vlan_id, ChangeKind::PeriodicSnapshot,
                                       "", common::DescribeVlan(vlan), when));
        for (const auto &diag : current.cable_diagnostics)
            events.push_back(MakeEvent(common::entity::CABLE, diag.port_number, ChangeKind::PeriodicSnapshot,
                                       "", common::DescribeDiagnostic(diag), when));
    }

    void DiffEngine::DiffSystem(const DeviceSnapshot &previous, const DeviceSnapshot &current,
                                std::vector<ChangeEvent> &events) const
    {
        const auto changes = SystemChanges(previous.system_info, current.system_info);
        if (changes.empty())
            return;

        std::string before;
        std::string after;
        for (const auto &change : changes)
        {
            before += std::string(change.name) + ": " + change.before + "\n";
            after += std::string(change.name) + ": " + change.after + "\n";
        }
        events.push_back(MakeEvent(common::entity::SYSTEM, 0, ChangeKind::ConfigChange,
                                   std::move(before), std::move(after), current.captured_at));
    }

    void DiffEngine::DiffPorts(const DeviceSnapshot &previous, const DeviceSnapshot &current,
                               std::vector<ChangeEvent> &events) const
    {
        std::map<int, const common::PortState *> before;
        for (const auto &port : previous.ports)
            before[port.port_number] = &port;

        for (const auto &port : current.ports)
        {
            auto it = before.find(port.port_number);
            if (it == before.end())
            {
                events.push_back(MakeEvent(common::entity::PORT, port.port_number, ChangeKind::PeriodicSnapshot,
                                           "", common::DescribePort(port), current.captured_at));
                continue;
            }

            const common::PortState &old = *it->second;
            before.erase(it);

            std::vector<FieldChange> changes;
            Compare(changes, "Status", old.status, port.status, true);
            Compare(changes, "SpeedConfig", old.speed_config, port.speed_config);
            Compare(changes, "SpeedActual", old.speed_actual, port.speed_actual, true);
            Compare(changes, "FlowControlConfig", old.flow_control_config, port.flow_control_config);
            Compare(changes, "FlowControlActual", old.flow_control_actual, port.flow_control_actual, true);
            Compare(changes, "Trunk", old.trunk, port.trunk);
            if (changes.empty())
                continue;

            bool statusAffected = false;
            for (const auto &change : changes)
                statusAffected = statusAffected || change.affects_status;

            auto [oldValue, newValue] = Summarize(changes);
            events.push_back(MakeEvent(common::entity::PORT, port.port_number,
                                       statusAffected ? ChangeKind::StatusChange : ChangeKind::ConfigChange,
                                       std::move(oldValue), std::move(newValue), current.captured_at));
        }

        for (const auto &pair : before)
        {
            events.push_back(MakeEvent(common::entity::PORT, pair.first, ChangeKind::StatusChange,
                                       "Present", "Absent", current.captured_at));
        }
    }

    void DiffEngine::DiffVlans(const DeviceSnapshot &previous, const DeviceSnapshot &current,
                               std::vector<ChangeEvent> &events) const
    {
        std::map<int, const common::VlanState *> before;
        for (const auto &vlan : previous.vlans)
            before[vlan.vlan_id] = &vlan;

        for (const auto &vlan : current.vlans)
        {
            auto it = before.find(vlan.vlan_id);
            if (it == before.end())
            {
                events.push_back(MakeEvent(common::entity::VLAN, vlan.vlan_id, ChangeKind::VlanCreated,
                                           "", common::DescribeVlan(vlan), current.captured_at));
                continue;
            }

            const common::VlanState &old = *it->second;
            before.erase(it);

            if (old.name == vlan.name && old.tagged_ports == vlan.tagged_ports && old.untagged_ports == vlan.untagged_ports)
                continue;

            events.push_back(MakeEvent(common::entity::VLAN, vlan.vlan_id, ChangeKind::ConfigChange,
                                       common::DescribeVlan(old), common::DescribeVlan(vlan), current.captured_at));
        }

        for (const auto &pair : before)
        {
            events.push_back(MakeEvent(common::entity::VLAN, pair.first, ChangeKind::VlanDeleted,
                                       common::DescribeVlan(*pair.second), "", current.captured_at));
        }
    }

    void DiffEngine::DiffCables(const DeviceSnapshot &previous, const DeviceSnapshot &current,
                                std::vector<ChangeEvent> &events) const
    {
        std::map<int, const common::DiagnosticState *> before;
        for (const auto &diag : previous.cable_diagnostics)
            before[diag.port_number] = &diag;

        for (const auto &diag : current.cable_diagnostics)
        {
            auto it = before.find(diag.port_number);
            if (it == before.end())
            {
                events.push_back(MakeEvent(common::entity::CABLE, diag.port_number, ChangeKind::PeriodicSnapshot,
                                           "", common::DescribeDiagnostic(diag), current.captured_at));
                continue;
            }

            const common::DiagnosticState &old = *it->second;
            before.erase(it);
            if (old.state_code == diag.state_code && old.length_meters == diag.length_meters)
                continue;

            events.push_back(MakeEvent(common::entity::CABLE, diag.port_number, ChangeKind::StatusChange,
                                       common::DescribeDiagnostic(old), common::DescribeDiagnostic(diag),
                                       current.captured_at));
        }

        for (const auto &pair : before)
        {
            events.push_back(MakeEvent(common::entity::CABLE, pair.first, ChangeKind::StatusChange,
                                       "Present", "Absent", current.captured_at));
        }
    }
}
