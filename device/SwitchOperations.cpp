#include "SwitchOperations.hpp"
#include "../common/ResponseParser.hpp"
#include <iostream>
#include <sstream>

namespace switch_watch::device
{
    namespace
    {
        OperationResult Ok()
        {
            return {true, OperationError::None, ""};
        }

        OperationResult Invalid(const std::string &message)
        {
            std::cerr << "[SwitchOperations] Rejected: " << message << "\n";
            return {false, OperationError::Validation, message};
        }

        std::string InvalidPorts(const std::vector<int> &ports)
        {
            std::ostringstream out;
            bool first = true;
            for (int port : ports)
            {
                if (SwitchOperations::IsValidPort(port))
                    continue;
                if (!first)
                    out << ",";
                out << port;
                first = false;
            }
            return out.str();
        }
    }

    const char *ToString(OperationError error)
    {
        switch (error)
        {
        case OperationError::None:
            return "none";
        case OperationError::Validation:
            return "validation";
        case OperationError::Transport:
            return "transport";
        case OperationError::Device:
            return "device";
        }
        return "unknown";
    }

    SwitchOperations::SwitchOperations(std::shared_ptr<DeviceSession> session)
        : m_session(std::move(session))
    {
    }

    bool SwitchOperations::IsValidPort(int port)
    {
        return port >= common::MIN_PORT_NUMBER && port <= common::MAX_SUPPORTED_PORTS;
    }

    bool SwitchOperations::IsValidVlanId(int vlanId)
    {
        return vlanId >= common::MIN_VLAN_ID && vlanId <= common::MAX_VLAN_ID;
    }

    bool SwitchOperations::IsValidSpeed(int speed)
    {
        return speed >= MIN_SPEED_CODE && speed <= MAX_SPEED_CODE;
    }

    OperationResult SwitchOperations::Fetch(const std::string &endpoint, std::string &body)
    {
        ExecuteResult result = m_session->Execute(endpoint);
        if (!result.success)
            return {false, OperationError::Transport, result.error.message};

        body = std::move(result.body);
        return Ok();
    }

    OperationResult SwitchOperations::Submit(const std::string &endpoint, HttpMethod method, const std::string &body,
                                             bool requireSuccessMarker, const std::string &what)
    {
        ExecuteResult result = m_session->Execute(endpoint, method, body);
        if (!result.success)
        {
            std::cerr << "[SwitchOperations] " << what << " failed: " << result.error.message << "\n";
            return {false, OperationError::Transport, what + " failed: " + result.error.message};
        }

        if (requireSuccessMarker && result.body.find(protocol::OPERATION_SUCCESS_MARKER) == std::string::npos)
        {
            std::cerr << "[SwitchOperations] " << what << " may have failed: no success message in response\n";
            return {false, OperationError::Device, what + " may have failed - no success message found in response"};
        }

        std::cout << "[SwitchOperations] " << what << " done\n";
        return Ok();
    }

    OperationResult SwitchOperations::GetSystemInfo(common::SystemInfo &out)
    {
        std::string body;
        OperationResult result = Fetch(protocol::endpoint::SYSTEM_INFO, body);
        if (result.success)
            out = common::ResponseParser::ParseSystemInfo(body);
        return result;
    }

    OperationResult SwitchOperations::GetPorts(common::PortTable &out)
    {
        std::string body;
        OperationResult result = Fetch(protocol::endpoint::PORT_SETTINGS, body);
        if (result.success)
            out = common::ResponseParser::ParsePortTable(body);
        return result;
    }

    OperationResult SwitchOperations::GetVlans(common::VlanConfig &out)
    {
        std::string body;
        OperationResult result = Fetch(protocol::endpoint::VLAN_CONFIG, body);
        if (result.success)
            out = common::ResponseParser::ParseVlanConfig(body);
        return result;
    }

    OperationResult SwitchOperations::SetPortConfig(int port, bool enable, int speed, bool flowControl)
    {
        if (!IsValidPort(port))
            return Invalid("Invalid port number: " + std::to_string(port) + ". Must be between 1 and 48.");
        if (!IsValidSpeed(speed))
            return Invalid("Invalid speed setting: " + std::to_string(speed) + ". Must be between 0 and 10.");

        const std::string form = EncodeForm({{"portid", std::to_string(port) + "^"},
                                             {"state", enable ? "1^" : "0^"},
                                             {"speed", std::to_string(speed) + "^"},
                                             {"flowcontrol", flowControl ? "1^" : "0^"},
                                             {"apply", "Apply"}});
        return Submit(protocol::endpoint::PORT_CONFIG, HttpMethod::Post, form, false,
                      "Configure port " + std::to_string(port));
    }

    OperationResult SwitchOperations::CreateVlan(int vlanId, const std::vector<int> &ports)
    {
        if (!IsValidVlanId(vlanId))
            return Invalid("Invalid VLAN ID: " + std::to_string(vlanId) + ". Must be between 1 and 4094.");
        if (ports.empty())
            return Invalid("At least one port must be specified.");
        const std::string bad = InvalidPorts(ports);
        if (!bad.empty())
            return Invalid("Invalid port number(s): " + bad);

        std::string query = std::string(protocol::endpoint::VLAN_SET) + "?vid=" + std::to_string(vlanId) + "^";
        for (int port : ports)
            query += "&selPorts=" + std::to_string(port) + "^";
        query += "&pvlan_add=Apply";

        return Submit(query, HttpMethod::Get, "", true, "Create VLAN " + std::to_string(vlanId));
    }

    OperationResult SwitchOperations::DeleteVlans(const std::vector<int> &vlanIds)
    {
        if (vlanIds.empty())
            return Invalid("At least one VLAN ID must be specified.");
        for (int vid : vlanIds)
        {
            if (!IsValidVlanId(vid))
                return Invalid("Invalid VLAN ID: " + std::to_string(vid) + ". Must be between 1 and 4094.");
        }

        std::string query = std::string(protocol::endpoint::VLAN_SET) + "?";
        for (int vid : vlanIds)
            query += "selVlans=" + std::to_string(vid) + "^&";
        query += "pvlan_del=Delete";

        return Submit(query, HttpMethod::Get, "", true, "Delete VLANs");
    }

    OperationResult SwitchOperations::RunCableDiagnostics(const std::vector<int> &ports, common::CableDiagnostics &out)
    {
        if (ports.empty())
            return Invalid("At least one port must be specified.");
        const std::string bad = InvalidPorts(ports);
        if (!bad.empty())
            return Invalid("Invalid port number(s): " + bad);

        std::string query = std::string(protocol::endpoint::CABLE_DIAGNOSTIC) + "?";
        for (int port : ports)
            query += "chk_" + std::to_string(port) + "=" + std::to_string(port) + "^&";
        query += "Apply=Apply";

        std::string body;
        OperationResult result = Fetch(query, body);
        if (result.success)
            out = common::ResponseParser::ParseCableDiagnostics(body);
        return result;
    }

    OperationResult SwitchOperations::Reboot()
    {
        const std::string form = EncodeForm({{"reboot_op", "reboot^"}, {"save_op", "false"}});
        OperationResult result = Submit(protocol::endpoint::REBOOT, HttpMethod::Post, form, false, "Reboot");
        if (result.success)
            m_session->Logout();
        return result;
    }
}
