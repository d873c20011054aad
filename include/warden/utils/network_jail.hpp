/**
 * @file network_jail.hpp
 * @brief Egress planning and firewall rule generation
 *
 * Turns a Policy's network lists into concrete IPv4 addresses and iptables
 * rules. Nothing here touches the host by itself: rules are plain data that
 * backends apply through a CommandRunner, which keeps the planning testable
 * without root.
 *
 * **Deny-wins at address level**: an address that belongs to a blocked host
 * (or falls inside a blocked CIDR) is never accepted, even when an allowed
 * host resolves to the same address.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"
#include "warden/utils/command_runner.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/// Host name, literal address or CIDR → IPv4 addresses/CIDRs.
using ResolveFunction = std::function<std::vector<std::string>(const std::string&)>;

/**
 * @brief Resolve via getaddrinfo (AF_INET)
 *
 * Literal IPv4 addresses and CIDR blocks are returned unchanged. Unknown
 * hosts yield an empty vector.
 */
std::vector<std::string> ResolveIPv4(const std::string& host);

bool IsIPv4Literal(const std::string& text);

/// "10.0.0.0/8" style block, prefix 0-32.
bool IsIPv4Cidr(const std::string& text);

/**
 * @brief Whether @p address (or CIDR) lies inside @p range
 *
 * A CIDR @p address is contained when its whole block is inside @p range.
 */
bool AddressInRange(const std::string& address, const std::string& range);

/**
 * @struct EgressPlan
 * @brief Resolved form of a policy's network lists
 */
struct EgressPlan {
    core::NetworkAccess access{core::NetworkAccess::NONE};
    std::set<std::string> accept;                          ///< Reachable addresses/CIDRs
    std::set<std::string> reject;                          ///< Blocked addresses/CIDRs
    std::map<std::string, std::vector<std::string>> pins;  ///< Allowed host → accepted addresses
    std::vector<std::string> unresolved;                   ///< Entries with no address

    /// Allow-listed plans with nothing left to accept carry no egress at all.
    bool HasEgress() const;
};

EgressPlan PlanEgress(const core::Policy& policy,
                      const ResolveFunction& resolve = ResolveIPv4);

/**
 * @brief /etc/hosts content pinning every allowed host name
 *
 * Always contains the loopback entries.
 */
std::string BuildHostsFile(const EgressPlan& plan);

/**
 * @struct FirewallRule
 * @brief One iptables rule, independent of how it is applied
 */
struct FirewallRule {
    std::string table{"filter"};
    std::string chain;
    std::vector<std::string> spec;   ///< Match and target, e.g. {"-d", "1.2.3.4", "-j", "ACCEPT"}

    /// {"-t", table, action, chain, spec...}; action is "-A", "-I" or "-D".
    std::vector<std::string> ToArgs(const std::string& action) const;

    bool operator==(const FirewallRule& other) const;
};

/**
 * @brief OUTPUT chain of a sandbox network namespace, in append order
 *
 * Loopback and established traffic pass; blocked destinations drop first;
 * an allow-listed plan accepts its addresses and drops everything else.
 */
std::vector<FirewallRule> BuildJailOutputRules(const EgressPlan& plan);

/**
 * @brief Host-side NAT and forwarding for one veth link, in append order
 */
std::vector<FirewallRule> BuildHostNatRules(const std::string& subnet_cidr,
                                            const std::string& host_interface);

/**
 * @brief DOCKER-USER rules for one container network, in insertion order
 *
 * Each rule is meant to be inserted at the head of the chain, so the final
 * chain order is the reverse of the returned vector: rejects, then accepts,
 * then the catch-all drop of the subnet.
 */
std::vector<FirewallRule> BuildDockerUserRules(const EgressPlan& plan,
                                               const std::string& subnet_cidr);

/**
 * @brief Apply @p rules in order through @p runner
 *
 * @param prefix Command prefix, e.g. {"iptables"} or {"ip", "netns", "exec", ns, "iptables"}
 * @return The first failing result, or a successful one
 */
CommandResult ApplyFirewallRules(CommandRunner& runner,
                                 const std::vector<std::string>& prefix,
                                 const std::vector<FirewallRule>& rules,
                                 const std::string& action);

/**
 * @struct Subnet
 * @brief One slot handed out by a SubnetPool
 */
struct Subnet {
    std::uint32_t index{0};
    std::uint32_t network{0};   ///< Host byte order
    int prefix_length{30};

    std::string Cidr() const;

    /// Address @p offset inside the block (1 = first host).
    std::string Host(std::uint32_t offset) const;
};

/**
 * @class SubnetPool
 * @brief Thread-safe allocator of equal-size IPv4 blocks inside a /16
 */
class SubnetPool {
public:
    /// @throws std::invalid_argument if @p base is not an IPv4 address or prefix is outside 17-30
    SubnetPool(const std::string& base, int prefix_length);

    std::optional<Subnet> Acquire();
    void Release(const Subnet& subnet);

    std::size_t Capacity() const { return capacity_; }
    std::size_t InUse() const;

private:
    std::uint32_t base_;
    int prefix_length_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::set<std::uint32_t> in_use_;
    std::uint32_t next_{0};
};

} // namespace utils
} // namespace warden
