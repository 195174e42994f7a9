#include "Types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace switch_watch::common
{
    bool SystemInfo::SameAs(const SystemInfo &other) const
    {
        return device_name == other.device_name &&
               mac_address == other.mac_address &&
               ip_address == other.ip_address &&
               subnet_mask == other.subnet_mask &&
               gateway == other.gateway &&
               firmware_version == other.firmware_version &&
               hardware_version == other.hardware_version;
    }

    CableCategory DiagnosticState::Category() const
    {
        if (healthy)
            return CableCategory::Healthy;
        if (issue)
            return CableCategory::Issue;
        if (untested)
            return CableCategory::Untested;
        if (disconnected)
            return CableCategory::Disconnected;
        return CableCategory::Unknown;
    }

    const char *ToString(ChangeKind kind)
    {
        switch (kind)
        {
        case ChangeKind::ConfigChange:
            return "CONFIG_CHANGE";
        case ChangeKind::StatusChange:
            return "STATUS_CHANGE";
        case ChangeKind::PeriodicSnapshot:
            return "PERIODIC_SNAPSHOT";
        case ChangeKind::ConnectivityChange:
            return "CONNECTIVITY_CHANGE";
        case ChangeKind::VlanCreated:
            return "VLAN_CREATED";
        case ChangeKind::VlanDeleted:
            return "VLAN_DELETED";
        }
        return "UNKNOWN";
    }

    std::optional<ChangeKind> ParseChangeKind(const std::string &text)
    {
        for (ChangeKind kind : {ChangeKind::ConfigChange, ChangeKind::StatusChange, ChangeKind::PeriodicSnapshot,
                                ChangeKind::ConnectivityChange, ChangeKind::VlanCreated, ChangeKind::VlanDeleted})
        {
            if (text == ToString(kind))
                return kind;
        }
        return std::nullopt;
    }

    const char *ToString(ParseQuality quality)
    {
        switch (quality)
        {
        case ParseQuality::Parsed:
            return "parsed";
        case ParseQuality::Empty:
            return "empty";
        case ParseQuality::Defaulted:
            return "defaulted";
        }
        return "unknown";
    }

    const char *ToString(VlanFormat format)
    {
        switch (format)
        {
        case VlanFormat::Dot1q:
            return "802.1Q";
        case VlanFormat::PortBased:
            return "port-based";
        case VlanFormat::LegacyTable:
            return "legacy-table";
        case VlanFormat::Unknown:
            break;
        }
        return "unknown";
    }

    std::int64_t ToEpochMillis(TimePoint tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::string FormatTimestamp(TimePoint tp)
    {
        std::time_t t = Clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&t, &utc);

        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}
