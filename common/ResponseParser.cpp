#include "ResponseParser.hpp"
#include "BitmaskCodec.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace switch_watch::common
{
    namespace
    {
        constexpr std::size_t npos = std::string::npos;

        const char *const SPEED_LABELS[] = {"Link Down", "Auto", "10MH", "10MF", "100MH", "100MF", "1000MF"};
        const char *const STATE_LABELS[] = {"Disabled", "Enabled"};
        const char *const FLOW_LABELS[] = {"Off", "On"};
        constexpr int MAX_TRUNK_GROUP = 8;

        bool IsIdentChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        std::string Trim(const std::string &s)
        {
            std::size_t start = 0;
            std::size_t end = s.size();
            while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
                ++start;
            while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
                --end;
            return s.substr(start, end - start);
        }

        std::string TrimQuotes(const std::string &s)
        {
            std::string t = Trim(s);
            if (t.size() >= 2 && (t.front() == '"' || t.front() == '\'') && t.back() == t.front())
                return t.substr(1, t.size() - 2);
            return t;
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::size_t SkipSpaces(const std::string &text, std::size_t pos)
        {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
                ++pos;
            return pos;
        }

        bool Contains(const std::string &text, const char *needle)
        {
            return text.find(needle) != npos;
        }

        // Position of the value after `key :` or `key =`, where key is a whole identifier.
        std::size_t FindValue(const std::string &text, const std::string &key, std::size_t from = 0)
        {
            std::size_t pos = from;
            while ((pos = text.find(key, pos)) != npos)
            {
                const std::size_t end = pos + key.size();
                const bool leftOk = pos == 0 || !IsIdentChar(text[pos - 1]);
                const bool rightOk = end >= text.size() || !IsIdentChar(text[end]);
                if (leftOk && rightOk)
                {
                    std::size_t p = SkipSpaces(text, end);
                    if (p < text.size() && (text[p] == ':' || text[p] == '='))
                        return SkipSpaces(text, p + 1);
                }
                pos = end;
            }
            return npos;
        }

        // Content between the bracket at `pos` and its match. Quoted text is skipped.
        std::optional<std::string> ExtractBlockAt(const std::string &text, std::size_t pos, char open, char close)
        {
            if (pos == npos || pos >= text.size() || text[pos] != open)
                return std::nullopt;

            int depth = 0;
            char quote = 0;
            for (std::size_t i = pos; i < text.size(); ++i)
            {
                const char c = text[i];
                if (quote)
                {
                    if (c == '\\')
                        ++i;
                    else if (c == quote)
                        quote = 0;
                    continue;
                }
                if (c == '"' || c == '\'')
                    quote = c;
                else if (c == open)
                    ++depth;
                else if (c == close && --depth == 0)
                    return text.substr(pos + 1, i - pos - 1);
            }
            return std::nullopt;
        }

        std::optional<std::string> ExtractArray(const std::string &text, const std::string &key)
        {
            return ExtractBlockAt(text, FindValue(text, key), '[', ']');
        }

        std::optional<long> ExtractNumber(const std::string &text, const std::string &key)
        {
            const std::size_t pos = FindValue(text, key);
            if (pos == npos)
                return std::nullopt;

            std::size_t end = pos;
            if (end < text.size() && text[end] == '-')
                ++end;
            while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])))
                ++end;

            long value = 0;
            auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + end, value);
            if (ec != std::errc() || ptr == text.data() + pos)
                return std::nullopt;
            return value;
        }

        // Splits on commas that are outside quotes.
        std::vector<std::string> SplitItems(const std::string &body)
        {
            std::vector<std::string> items;
            std::string current;
            char quote = 0;
            for (char c : body)
            {
                if (quote)
                {
                    if (c == quote)
                        quote = 0;
                    current += c;
                    continue;
                }
                if (c == '"' || c == '\'')
                    quote = c;
                if (c == ',')
                {
                    items.push_back(Trim(current));
                    current.clear();
                    continue;
                }
                current += c;
            }
            if (!Trim(current).empty() || !items.empty())
                items.push_back(Trim(current));
            return items;
        }

        // Array elements with blank entries (trailing or doubled commas) dropped.
        std::vector<std::string> ArrayItems(const std::string &body)
        {
            std::vector<std::string> items;
            for (auto &item : SplitItems(body))
            {
                if (!item.empty())
                    items.push_back(std::move(item));
            }
            return items;
        }

        std::vector<std::string> ExtractQuoted(const std::string &body)
        {
            std::vector<std::string> values;
            std::size_t i = 0;
            while (i < body.size())
            {
                const char c = body[i];
                if (c != '"' && c != '\'')
                {
                    ++i;
                    continue;
                }
                const std::size_t close = body.find(c, i + 1);
                if (close == npos)
                    break;
                values.push_back(body.substr(i + 1, close - i - 1));
                i = close + 1;
            }
            return values;
        }

        bool TryParseInt(const std::string &token, int &out)
        {
            const std::string t = TrimQuotes(token);
            if (t.empty())
                return false;
            auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), out);
            return ec == std::errc() && ptr == t.data() + t.size();
        }

        // Non-numeric entries become `fallback`.
        std::vector<int> IntArray(const std::optional<std::string> &body, int fallback)
        {
            std::vector<int> values;
            if (!body)
                return values;
            for (const auto &item : ArrayItems(*body))
            {
                int v = fallback;
                if (!TryParseInt(item, v))
                    v = fallback;
                values.push_back(v);
            }
            return values;
        }

        // Strict: throws std::invalid_argument / std::out_of_range on anything but an id.
        std::vector<int> StrictIdArray(const std::optional<std::string> &body)
        {
            std::vector<int> ids;
            if (!body)
                return ids;
            for (const auto &item : ArrayItems(*body))
            {
                const std::string t = TrimQuotes(item);
                std::size_t used = 0;
                int id = std::stoi(t, &used);
                if (used != t.size())
                    throw std::invalid_argument("vlan id: " + t);
                ids.push_back(id);
            }
            return ids;
        }

        // "0x..." is hexadecimal, anything else decimal. Throws on malformed masks.
        std::uint32_t ParseMask(const std::string &token)
        {
            std::string t = TrimQuotes(token);
            int base = 10;
            if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X'))
            {
                t = t.substr(2);
                base = 16;
            }
            if (t.empty() || !std::isxdigit(static_cast<unsigned char>(t[0])))
                throw std::invalid_argument("mask: " + token);

            std::size_t used = 0;
            unsigned long value = std::stoul(t, &used, base);
            if (used != t.size())
                throw std::invalid_argument("mask: " + token);
            if (value > 0xFFFFFFFFUL)
                throw std::out_of_range("mask: " + token);
            return static_cast<std::uint32_t>(value);
        }

        std::vector<std::uint32_t> MaskArray(const std::optional<std::string> &body)
        {
            std::vector<std::uint32_t> masks;
            if (!body)
                return masks;
            for (const auto &item : ArrayItems(*body))
                masks.push_back(ParseMask(item));
            return masks;
        }

        std::vector<std::string> SplitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream stream(text);
            std::string line;
            while (std::getline(stream, line))
                lines.push_back(Trim(line));
            return lines;
        }

        std::vector<std::string> SplitColumns(const std::string &line)
        {
            std::vector<std::string> cols;
            std::string cell;
            std::istringstream stream(line);
            while (std::getline(stream, cell, '|'))
                cols.push_back(Trim(cell));
            return cols;
        }

        template <std::size_t N>
        std::string Label(const char *const (&labels)[N], const std::vector<int> &values, std::size_t index)
        {
            if (index >= values.size())
                return "Unknown";
            const int v = values[index];
            if (v < 0 || static_cast<std::size_t>(v) >= N)
                return "Unknown";
            return labels[v];
        }

        int SanitizePortCount(long value)
        {
            if (value < MIN_PORT_NUMBER)
                return DEFAULT_MAX_PORTS;
            return static_cast<int>(std::min<long>(value, MAX_SUPPORTED_PORTS));
        }

        bool ApplySystemField(SystemInfo &info, const std::string &key, const std::string &value)
        {
            const std::string k = ToLower(key);
            if (k == "device description" || k == "device name" || k == "descristr")
                info.device_name = value;
            else if (k == "mac address" || k == "macstr")
                info.mac_address = value;
            else if (k == "ip address" || k == "ipstr")
                info.ip_address = value;
            else if (k == "subnet mask" || k == "netmaskstr")
                info.subnet_mask = value;
            else if (k == "gateway" || k == "default gateway" || k == "gatewaystr")
                info.gateway = value;
            else if (k == "firmware version" || k == "firmwarestr")
                info.firmware_version = value;
            else if (k == "hardware version" || k == "hardwarestr")
                info.hardware_version = value;
            else
                return false;
            return true;
        }

        PortTable ParseScriptPorts(const std::string &block, const std::string &text)
        {
            PortTable table;
            const auto state = IntArray(ExtractArray(block, "state"), 0);
            const auto speedCfg = IntArray(ExtractArray(block, "spd_cfg"), 0);
            const auto speedAct = IntArray(ExtractArray(block, "spd_act"), 0);
            const auto flowCfg = IntArray(ExtractArray(block, "fc_cfg"), 0);
            const auto flowAct = IntArray(ExtractArray(block, "fc_act"), 0);
            const auto trunk = IntArray(ExtractArray(block, "trunk_info"), 0);

            table.max_ports = SanitizePortCount(ExtractNumber(text, "max_port_num").value_or(DEFAULT_MAX_PORTS));

            if (state.empty() && speedCfg.empty() && speedAct.empty())
            {
                table.quality = ParseQuality::Empty;
                return table;
            }

            for (int i = 0; i < table.max_ports; ++i)
            {
                const auto idx = static_cast<std::size_t>(i);
                PortState port;
                port.port_number = i + 1;
                port.status = Label(STATE_LABELS, state, idx);
                port.speed_config = Label(SPEED_LABELS, speedCfg, idx);
                port.speed_actual = Label(SPEED_LABELS, speedAct, idx);
                port.flow_control_config = Label(FLOW_LABELS, flowCfg, idx);
                port.flow_control_actual = Label(FLOW_LABELS, flowAct, idx);
                if (idx < trunk.size() && trunk[idx] >= 1 && trunk[idx] <= MAX_TRUNK_GROUP)
                    port.trunk = "LAG" + std::to_string(trunk[idx]);
                table.ports.push_back(std::move(port));
            }
            table.quality = ParseQuality::Parsed;
            return table;
        }

        PortTable ParseTextPorts(const std::string &text)
        {
            PortTable table;
            bool headerSeen = false;
            int highest = 0;

            for (const auto &line : SplitLines(text))
            {
                if (line.empty())
                    continue;
                if (!headerSeen)
                {
                    if (Contains(line, "Port") && Contains(line, "Status") && Contains(line, "|"))
                        headerSeen = true;
                    continue;
                }
                if (line.rfind("---", 0) == 0)
                    continue;

                const auto cols = SplitColumns(line);
                if (cols.size() < 6)
                    continue;

                PortState port;
                if (!TryParseInt(cols[0], port.port_number) ||
                    port.port_number < MIN_PORT_NUMBER || port.port_number > MAX_SUPPORTED_PORTS)
                    continue;

                port.status = cols[1];
                port.speed_config = cols[2];
                port.speed_actual = cols[3];
                port.flow_control_config = cols[4];
                port.flow_control_actual = cols[5];
                if (cols.size() > 6)
                    port.trunk = cols[6];

                highest = std::max(highest, port.port_number);
                table.ports.push_back(std::move(port));
            }

            if (!headerSeen)
                return table;

            std::sort(table.ports.begin(), table.ports.end(),
                      [](const PortState &a, const PortState &b)
                      { return a.port_number < b.port_number; });
            table.max_ports = highest > 0 ? highest : DEFAULT_MAX_PORTS;
            table.quality = table.ports.empty() ? ParseQuality::Empty : ParseQuality::Parsed;
            return table;
        }
    }

    VlanConfig ResponseParser::DefaultVlanConfig()
    {
        return VlanConfig{};
    }

    SystemInfo ResponseParser::ParseSystemInfo(const std::string &text)
    {
        SystemInfo info;

        const std::size_t valuePos = FindValue(text, "info_ds");
        if (valuePos != npos && text.compare(valuePos, 9, "new Array") == 0)
        {
            const std::size_t open = text.find('(', valuePos);
            if (auto body = ExtractBlockAt(text, open, '(', ')'))
            {
                const auto items = SplitItems(*body);
                if (items.size() >= 7)
                {
                    info.device_name = TrimQuotes(items[0]);
                    info.mac_address = TrimQuotes(items[1]);
                    info.ip_address = TrimQuotes(items[2]);
                    info.subnet_mask = TrimQuotes(items[3]);
                    info.gateway = TrimQuotes(items[4]);
                    info.firmware_version = TrimQuotes(items[5]);
                    info.hardware_version = TrimQuotes(items[6]);
                    info.quality = ParseQuality::Parsed;
                    return info;
                }
            }
        }

        if (auto block = ExtractBlockAt(text, valuePos, '{', '}'))
        {
            bool any = false;
            for (const char *key : {"descriStr", "macStr", "ipStr", "netmaskStr", "gatewayStr", "firmwareStr", "hardwareStr"})
            {
                auto arr = ExtractArray(*block, key);
                if (!arr)
                    continue;
                const auto values = ExtractQuoted(*arr);
                if (values.empty())
                    continue;
                any = ApplySystemField(info, key, values.front()) || any;
            }
            if (any)
            {
                info.quality = ParseQuality::Parsed;
                return info;
            }
        }

        bool any = false;
        for (const auto &line : SplitLines(text))
        {
            const std::size_t colon = line.find(':');
            if (colon == npos || colon == 0)
                continue;
            any = ApplySystemField(info, Trim(line.substr(0, colon)), Trim(line.substr(colon + 1))) || any;
        }
        info.quality = any ? ParseQuality::Parsed : ParseQuality::Defaulted;
        if (!any)
            info = SystemInfo{};
        return info;
    }

    PortTable ResponseParser::ParsePortTable(const std::string &text)
    {
        if (auto block = ExtractBlockAt(text, FindValue(text, "all_info"), '{', '}'))
            return ParseScriptPorts(*block, text);
        return ParseTextPorts(text);
    }

    bool ResponseParser::IsStructuredVlanPayload(const std::string &text)
    {
        return Contains(text, "qvlan_ds") || FindValue(text, "tagMbrs") != npos;
    }

    bool ResponseParser::IsPortBasedVlanPayload(const std::string &text)
    {
        return Contains(text, "pvlan_ds") ||
               (FindValue(text, "vids") != npos && FindValue(text, "mbrs") != npos);
    }

    VlanConfig ResponseParser::ParseVlanConfig(const std::string &text)
    {
        if (IsStructuredVlanPayload(text))
            return ParseStructuredVlans(text);
        if (IsPortBasedVlanPayload(text))
            return ParsePortBasedVlans(text);
        return ParseLegacyVlans(text);
    }

    VlanConfig ResponseParser::ParseStructuredVlans(const std::string &text)
    {
        try
        {
            VlanConfig config;
            config.format = VlanFormat::Dot1q;
            config.enabled = ExtractNumber(text, "state").value_or(0) == 1;
            config.total_ports = SanitizePortCount(ExtractNumber(text, "portNum").value_or(DEFAULT_MAX_PORTS));

            const auto ids = StrictIdArray(ExtractArray(text, "vids"));
            const auto namesBody = ExtractArray(text, "names");
            const auto names = namesBody ? ExtractQuoted(*namesBody) : std::vector<std::string>{};
            const auto tagged = MaskArray(ExtractArray(text, "tagMbrs"));
            const auto untagged = MaskArray(ExtractArray(text, "untagMbrs"));

            const std::size_t entries = std::min(ids.size(), names.size());
            for (std::size_t i = 0; i < entries; ++i)
            {
                if (ids[i] < MIN_VLAN_ID || ids[i] > MAX_VLAN_ID)
                    continue;

                VlanState vlan;
                vlan.vlan_id = ids[i];
                vlan.name = names[i];
                for (int port : BitmaskCodec::Decode(i < tagged.size() ? tagged[i] : 0, config.total_ports))
                    vlan.tagged_ports.insert(port);
                for (int port : BitmaskCodec::Decode(i < untagged.size() ? untagged[i] : 0, config.total_ports))
                    vlan.untagged_ports.insert(port);
                config.vlans.push_back(std::move(vlan));
            }

            config.vlan_count = static_cast<int>(config.vlans.size());
            config.quality = config.vlans.empty() ? ParseQuality::Empty : ParseQuality::Parsed;
            return config;
        }
        catch (const std::exception &)
        {
            return DefaultVlanConfig();
        }
    }

    VlanConfig ResponseParser::ParsePortBasedVlans(const std::string &text)
    {
        try
        {
            VlanConfig config;
            config.format = VlanFormat::PortBased;
            config.enabled = ExtractNumber(text, "state").value_or(0) == 1;
            config.total_ports = SanitizePortCount(ExtractNumber(text, "portNum").value_or(DEFAULT_MAX_PORTS));

            const auto ids = StrictIdArray(ExtractArray(text, "vids"));
            const auto members = MaskArray(ExtractArray(text, "mbrs"));

            const std::size_t entries = std::min(ids.size(), members.size());
            for (std::size_t i = 0; i < entries; ++i)
            {
                if (ids[i] < MIN_VLAN_ID || ids[i] > MAX_VLAN_ID)
                    continue;

                VlanState vlan;
                vlan.vlan_id = ids[i];
                for (int port : BitmaskCodec::Decode(members[i], config.total_ports))
                    vlan.untagged_ports.insert(port);
                config.vlans.push_back(std::move(vlan));
            }

            config.vlan_count = static_cast<int>(config.vlans.size());
            config.quality = config.vlans.empty() ? ParseQuality::Empty : ParseQuality::Parsed;
            return config;
        }
        catch (const std::exception &)
        {
            return DefaultVlanConfig();
        }
    }

    VlanConfig ResponseParser::ParseLegacyVlans(const std::string &text)
    {
        VlanConfig config;
        const auto lines = SplitLines(text);

        bool statusSeen = false;
        bool structureSeen = false;
        bool headerSeen = false;
        for (const auto &line : lines)
        {
            if (Contains(line, "VLAN ID") && Contains(line, "|"))
                headerSeen = true;
        }

        bool inTable = !headerSeen;
        for (const auto &line : lines)
        {
            if (line.empty())
                continue;

            if (line.rfind("Status:", 0) == 0)
            {
                statusSeen = structureSeen = true;
                config.enabled = ToLower(Trim(line.substr(7))) == "enabled";
                continue;
            }
            if (line.rfind("Total Ports:", 0) == 0)
            {
                int total = 0;
                if (TryParseInt(line.substr(12), total))
                    config.total_ports = SanitizePortCount(total);
                structureSeen = true;
                continue;
            }
            if (line.rfind("Number of VLANs:", 0) == 0)
            {
                structureSeen = true;
                continue;
            }
            if (headerSeen && !inTable)
            {
                if (Contains(line, "VLAN ID") && Contains(line, "|"))
                {
                    inTable = structureSeen = true;
                }
                continue;
            }
            if (line.rfind("---", 0) == 0)
                continue;

            const std::size_t bar = line.find('|');
            if (bar == npos)
                continue;

            int id = 0;
            if (!TryParseInt(line.substr(0, bar), id) || id < MIN_VLAN_ID || id > MAX_VLAN_ID)
                continue;

            VlanState vlan;
            vlan.vlan_id = id;
            for (int port : ParsePortRange(line.substr(bar + 1)))
                vlan.untagged_ports.insert(port);
            config.vlans.push_back(std::move(vlan));
        }

        if (!config.vlans.empty() && !statusSeen)
            config.enabled = true;

        config.vlan_count = static_cast<int>(config.vlans.size());
        if (!config.vlans.empty())
        {
            config.format = VlanFormat::LegacyTable;
            config.quality = ParseQuality::Parsed;
        }
        else if (structureSeen)
        {
            config.format = VlanFormat::LegacyTable;
            config.quality = ParseQuality::Empty;
        }
        else
        {
            return DefaultVlanConfig();
        }
        return config;
    }

    std::vector<int> ResponseParser::ParsePortRange(const std::string &range)
    {
        std::set<int> ports;
        std::istringstream stream(range);
        std::string part;
        while (std::getline(stream, part, ','))
        {
            part = Trim(part);
            if (part.empty())
                continue;

            const std::size_t dash = part.find('-', 1);
            int first = 0;
            int last = 0;
            if (dash == npos)
            {
                if (!TryParseInt(part, first))
                    continue;
                last = first;
            }
            else if (!TryParseInt(part.substr(0, dash), first) || !TryParseInt(part.substr(dash + 1), last))
            {
                continue;
            }

            first = std::max(first, MIN_PORT_NUMBER);
            last = std::min(last, MAX_SUPPORTED_PORTS);
            for (int p = first; p <= last; ++p)
                ports.insert(p);
        }
        return {ports.begin(), ports.end()};
    }

    DiagnosticState ResponseParser::DescribeCableState(int portNumber, int stateCode, int lengthMeters)
    {
        DiagnosticState diag;
        diag.port_number = portNumber;
        diag.state_code = stateCode;
        diag.length_meters = lengthMeters;

        switch (stateCode)
        {
        case -1:
            diag.state_description = "--";
            diag.untested = true;
            break;
        case 0:
            diag.state_description = "No Cable";
            diag.disconnected = true;
            break;
        case 1:
            diag.state_description = "Normal";
            diag.healthy = true;
            break;
        case 2:
            diag.state_description = "Open";
            diag.issue = true;
            break;
        case 3:
            diag.state_description = "Short";
            diag.issue = true;
            break;
        case 4:
            diag.state_description = "Open & Short";
            diag.issue = true;
            break;
        case 5:
            diag.state_description = "Cross Cable";
            diag.issue = true;
            break;
        default:
            diag.state_description = "Others";
            break;
        }
        return diag;
    }

    CableDiagnostics ResponseParser::ParseCableDiagnostics(const std::string &text)
    {
        CableDiagnostics result;

        const auto statesBody = ExtractArray(text, "cablestate");
        if (!statesBody)
            return result;

        const auto states = IntArray(statesBody, -1);
        const auto lengths = IntArray(ExtractArray(text, "cablelength"), -1);
        result.max_ports = SanitizePortCount(ExtractNumber(text, "maxPort").value_or(DEFAULT_MAX_PORTS));

        const std::size_t count = std::min(states.size(), static_cast<std::size_t>(result.max_ports));
        for (std::size_t i = 0; i < count; ++i)
        {
            const int length = i < lengths.size() ? lengths[i] : -1;
            result.diagnostics.push_back(DescribeCableState(static_cast<int>(i) + 1, states[i], length));
        }
        result.quality = result.diagnostics.empty() ? ParseQuality::Empty : ParseQuality::Parsed;
        return result;
    }
}
