// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef CARTOGRAPH_TEST_SIMULATED_NETWORK_HPP
#define CARTOGRAPH_TEST_SIMULATED_NETWORK_HPP

#include "discovery/device_session.hpp"
#include "discovery/errors.hpp"
#include "discovery/neighbor_normalizer.hpp"
#include "discovery/port_probe.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {
namespace test {

/**
 * SimulatedNetwork - In-process fleet of network devices
 *
 * Plays both collaborator roles the crawler talks to:
 * - DeviceSessionService: answers fact requests and CLI commands per device
 * - PortProber: reports whether the management port is open
 *
 * Neighbor command output is rendered as JSON records (consumed by
 * JsonRecordParser) using each device's own field mapping, so a CDP row on
 * an IOS box and an LLDP row on a ProCurve box carry the field names their
 * templates would produce.
 *
 * Fault injection:
 * - Closed management ports
 * - Per-device credentials (anything else raises AuthenticationError)
 * - Command delays and hangs (released by ReleaseHangs())
 */
class SimulatedNetwork : public discovery::DeviceSessionService, public discovery::PortProber {
public:
    struct Device {
        std::string address;
        std::string dialect;      // the driver whose facts validate
        std::string description;  // what neighbors advertise as platform
        std::string show_version;
        discovery::DeviceFacts facts;
        std::map<std::string, discovery::DeviceFacts> facts_by_driver;  // overrides for other drivers
        bool port_open{true};
        std::optional<discovery::Credentials> credentials;
        std::chrono::milliseconds command_delay{0};
        bool hang_facts{false};
        bool hang_commands{false};
        int parse_score{80};
        std::map<std::string, nlohmann::json> neighbor_rows;  // command -> records array
    };

    SimulatedNetwork() = default;
    ~SimulatedNetwork() override;

    SimulatedNetwork(const SimulatedNetwork&) = delete;
    SimulatedNetwork& operator=(const SimulatedNetwork&) = delete;

    // Device factories (return a reference for further tweaking before the crawl starts)
    Device& AddIos(const std::string& address, const std::string& hostname);
    Device& AddNexus(const std::string& address, const std::string& hostname);
    Device& AddArista(const std::string& address, const std::string& hostname);
    Device& AddProcurve(const std::string& address, const std::string& hostname);
    Device& AddClosed(const std::string& address);

    Device& GetDevice(const std::string& address);

    // Neighbor advertisement seen from `from`: `to` is reachable at
    // `advertised_ip` (defaults to its address) via (from_if, to_if).
    void Advertise(const std::string& from, const std::string& from_if, const std::string& to,
                   const std::string& to_if, discovery::NeighborProtocol protocol,
                   const std::string& advertised_ip = "");

    // Both ends advertise each other
    void Link(const std::string& a, const std::string& a_if, const std::string& b, const std::string& b_if,
              discovery::NeighborProtocol protocol = discovery::NeighborProtocol::Cdp);

    void ReleaseHangs();

    // Collaborator interfaces
    discovery::DeviceFacts FetchFacts(const discovery::DeviceTarget& target,
                                      const discovery::Credentials& credentials, const std::string& dialect,
                                      std::chrono::seconds timeout) override;
    std::string RunCommand(const discovery::DeviceTarget& target, const discovery::Credentials& credentials,
                           const std::string& dialect, const std::string& command,
                           std::chrono::seconds timeout) override;
    bool IsPortOpen(const std::string& address, uint16_t port, std::chrono::seconds timeout) override;

    // Statistics
    size_t probe_count(const std::string& address) const;
    size_t command_count(const std::string& address, const std::string& command) const;
    size_t total_sessions() const { return total_sessions_.load(); }
    size_t max_concurrent_sessions() const { return max_concurrent_.load(); }

private:
    Device& Add(const std::string& address, const std::string& hostname, const std::string& dialect,
                const std::string& vendor, const std::string& model, const std::string& os_version,
                const std::string& description);
    const Device& Connect(const discovery::DeviceTarget& target, const discovery::Credentials& credentials);
    void WaitForRelease();

    class SessionScope {
    public:
        explicit SessionScope(SimulatedNetwork& network);
        ~SessionScope();

    private:
        SimulatedNetwork& network_;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Device> devices_;
    std::map<std::string, size_t> probes_;
    std::map<std::string, std::map<std::string, size_t>> commands_;

    std::mutex hang_mutex_;
    std::condition_variable hang_cv_;
    bool released_{false};

    std::atomic<size_t> active_sessions_{0};
    std::atomic<size_t> max_concurrent_{0};
    std::atomic<size_t> total_sessions_{0};
};

}  // namespace test
}  // namespace cartograph

#endif  // CARTOGRAPH_TEST_SIMULATED_NETWORK_HPP
