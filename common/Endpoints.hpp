#pragma once

#include <chrono>

namespace switch_watch::protocol
{
    namespace endpoint
    {
        inline constexpr const char *ROOT = "/";
        inline constexpr const char *LOGIN = "/logon.cgi";
        inline constexpr const char *SYSTEM_INFO = "/SystemInfoRpm.htm";
        inline constexpr const char *PORT_SETTINGS = "/PortSettingRpm.htm";
        inline constexpr const char *PORT_CONFIG = "/port_setting.cgi";
        inline constexpr const char *VLAN_CONFIG = "/VlanPortBasicRpm.htm";
        inline constexpr const char *VLAN_SET = "/pvlanSet.cgi";
        inline constexpr const char *CABLE_DIAGNOSTIC = "/cable_diag_get.cgi";
        inline constexpr const char *REBOOT = "/reboot.cgi";
    }

    // A response body containing the login endpoint means the session is gone.
    inline constexpr const char *LOGIN_MARKER = "logon.cgi";
    inline constexpr const char *OPERATION_SUCCESS_MARKER = "Operation successful";

    inline constexpr const char *SESSION_COOKIE_NAME = "SessionID";

    inline constexpr std::chrono::hours SESSION_LIFETIME{1};
    inline constexpr std::chrono::seconds CONNECTION_TEST_TIMEOUT{5};
    inline constexpr std::chrono::seconds LOGIN_TIMEOUT{10};
    inline constexpr std::chrono::seconds OPERATION_TIMEOUT{60};

    inline constexpr int DEFAULT_HTTP_PORT = 80;
    inline constexpr int DEFAULT_HTTPS_PORT = 443;
}
