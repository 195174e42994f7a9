#include "IcmpProbe.hpp"
#include <tins/tins.h>
#include <iostream>

namespace switch_watch::device
{
    namespace
    {
        constexpr std::uint16_t ECHO_ID = 0x5357;
    }

    std::optional<double> IcmpProbe::Probe(const std::string &host, std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        try
        {
            const Tins::IPv4Address target = Tins::Utils::resolve_domain(host);
            const Tins::NetworkInterface iface(target);

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + target.to_string());
            config.set_timeout(static_cast<int>(timeout.count()));

            Tins::Sniffer sniffer(iface.name(), config);

            Tins::IP ip = Tins::IP(target) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(ECHO_ID);
            icmp.sequence(++m_sequence);

            Tins::PacketSender sender;

            auto start = std::chrono::steady_clock::now();
            sender.send(ip);

            Tins::PtrPacket packet = sniffer.next_packet();
            auto end = std::chrono::steady_clock::now();

            if (packet && end - start <= timeout)
            {
                std::chrono::duration<double, std::milli> elapsed = end - start;
                return elapsed.count();
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[IcmpProbe] " << host << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
