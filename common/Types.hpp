#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace switch_watch::common
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    inline constexpr int DEFAULT_MAX_PORTS = 24;
    inline constexpr int MIN_PORT_NUMBER = 1;
    inline constexpr int MAX_SUPPORTED_PORTS = 48;
    inline constexpr int MIN_VLAN_ID = 1;
    inline constexpr int MAX_VLAN_ID = 4094;

    // Parsed: data recognized. Empty: recognized but no rows.
    // Defaulted: nothing recognized or the parse failed; all fields hold defaults.
    enum class ParseQuality
    {
        Parsed,
        Empty,
        Defaulted
    };

    struct SessionState
    {
        std::string token;
        TimePoint issued_at{};
        TimePoint expires_at{};
        bool authenticated = false;

        bool IsExpired(TimePoint now) const { return !authenticated || now >= expires_at; }
    };

    struct SystemInfo
    {
        std::string device_name;
        std::string mac_address;
        std::string ip_address;
        std::string subnet_mask;
        std::string gateway;
        std::string firmware_version;
        std::string hardware_version;
        ParseQuality quality = ParseQuality::Defaulted;

        bool SameAs(const SystemInfo &other) const;
    };

    struct PortState
    {
        int port_number = 0;
        std::string status;
        std::string speed_config;
        std::string speed_actual;
        std::string flow_control_config;
        std::string flow_control_actual;
        std::string trunk;

        bool IsEnabled() const { return status == "Enabled"; }
        bool IsConnected() const { return speed_actual != "Link Down"; }
    };

    struct PortTable
    {
        std::vector<PortState> ports;
        int max_ports = DEFAULT_MAX_PORTS;
        ParseQuality quality = ParseQuality::Defaulted;
    };

    struct VlanState
    {
        int vlan_id = 0;
        std::string name;
        std::set<int> tagged_ports;
        std::set<int> untagged_ports;
    };

    enum class VlanFormat
    {
        Unknown,
        Dot1q,
        PortBased,
        LegacyTable
    };

    struct VlanConfig
    {
        bool enabled = false;
        int total_ports = DEFAULT_MAX_PORTS;
        int vlan_count = 0;
        std::vector<VlanState> vlans;
        VlanFormat format = VlanFormat::Unknown;
        ParseQuality quality = ParseQuality::Defaulted;
    };

    enum class CableCategory
    {
        Healthy,
        Issue,
        Untested,
        Disconnected,
        Unknown
    };

    struct DiagnosticState
    {
        int port_number = 0;
        int state_code = -1;
        std::string state_description;
        int length_meters = -1;
        bool healthy = false;
        bool issue = false;
        bool untested = false;
        bool disconnected = false;

        CableCategory Category() const;
    };

    struct CableDiagnostics
    {
        std::vector<DiagnosticState> diagnostics;
        int max_ports = DEFAULT_MAX_PORTS;
        ParseQuality quality = ParseQuality::Defaulted;
    };

    struct DeviceSnapshot
    {
        SystemInfo system_info;
        std::vector<PortState> ports;
        std::vector<VlanState> vlans;
        std::vector<DiagnosticState> cable_diagnostics;
        TimePoint captured_at{};
    };

    enum class ChangeKind
    {
        ConfigChange,
        StatusChange,
        PeriodicSnapshot,
        ConnectivityChange,
        VlanCreated,
        VlanDeleted
    };

    namespace entity
    {
        inline constexpr const char *PORT = "port";
        inline constexpr const char *VLAN = "vlan";
        inline constexpr const char *SYSTEM = "system";
        inline constexpr const char *CABLE = "cable";
        inline constexpr const char *SWITCH = "switch";
    }

    struct ChangeEvent
    {
        std::string device;
        std::string entity_type;
        int entity_key = 0;
        ChangeKind change_kind = ChangeKind::PeriodicSnapshot;
        std::string previous_value;
        std::string new_value;
        TimePoint timestamp{};
    };

    const char *ToString(ChangeKind kind);
    const char *ToString(ParseQuality quality);
    const char *ToString(VlanFormat format);
    std::optional<ChangeKind> ParseChangeKind(const std::string &text);

    // Milliseconds since the Unix epoch; 0 for a default-constructed time point.
    std::int64_t ToEpochMillis(TimePoint tp);
    std::string FormatTimestamp(TimePoint tp);
}
