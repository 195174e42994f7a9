#pragma once

#include <memory>
#include <string>
#include <vector>
#include "DeviceSession.hpp"
#include "../common/Types.hpp"

namespace switch_watch::device
{
    enum class OperationError
    {
        None,
        Validation,
        Transport,
        Device
    };

    struct OperationResult
    {
        bool success = false;
        OperationError error = OperationError::None;
        std::string message;
    };

    const char *ToString(OperationError error);

    // On-demand reads and writes sharing the monitored device's session.
    // Arguments are validated before any request leaves the process.
    class SwitchOperations
    {
    public:
        static constexpr int MIN_SPEED_CODE = 0;
        static constexpr int MAX_SPEED_CODE = 10;

        explicit SwitchOperations(std::shared_ptr<DeviceSession> session);

        OperationResult GetSystemInfo(common::SystemInfo &out);
        OperationResult GetPorts(common::PortTable &out);
        OperationResult GetVlans(common::VlanConfig &out);

        OperationResult SetPortConfig(int port, bool enable, int speed = 1, bool flowControl = false);
        OperationResult CreateVlan(int vlanId, const std::vector<int> &ports);
        OperationResult DeleteVlans(const std::vector<int> &vlanIds);
        OperationResult RunCableDiagnostics(const std::vector<int> &ports, common::CableDiagnostics &out);
        OperationResult Reboot();

        static bool IsValidPort(int port);
        static bool IsValidVlanId(int vlanId);
        static bool IsValidSpeed(int speed);

    private:
        std::shared_ptr<DeviceSession> m_session;

        OperationResult Fetch(const std::string &endpoint, std::string &body);
        OperationResult Submit(const std::string &endpoint, HttpMethod method, const std::string &body,
                               bool requireSuccessMarker, const std::string &what);
    };
}
