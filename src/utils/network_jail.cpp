/**
 * @file network_jail.cpp
 * @brief Egress planning and iptables rule generation
 *
 * @date 2025
 */

#include "warden/utils/network_jail.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace warden {
namespace utils {

namespace {

bool ParseAddress(const std::string& text, std::uint32_t* out) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    *out = ntohl(addr.s_addr);
    return true;
}

std::string FormatAddress(std::uint32_t host_order) {
    in_addr addr{};
    addr.s_addr = htonl(host_order);
    char buffer[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer))) {
        return {};
    }
    return buffer;
}

// Address or CIDR → (network, prefix). A bare address is a /32.
bool ParseRange(const std::string& text, std::uint32_t* network, int* prefix) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        *prefix = 32;
        return ParseAddress(text, network);
    }

    std::string bits = text.substr(slash + 1);
    if (bits.empty() || bits.size() > 2 ||
        !std::all_of(bits.begin(), bits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    *prefix = std::stoi(bits);
    if (*prefix > 32) {
        return false;
    }
    return ParseAddress(text.substr(0, slash), network);
}

std::uint32_t PrefixMask(int prefix) {
    return prefix == 0 ? 0u : (~0u << (32 - prefix));
}

} // anonymous namespace

// ============================================================================
// ADDRESSES
// ============================================================================

bool IsIPv4Literal(const std::string& text) {
    std::uint32_t ignored = 0;
    return ParseAddress(text, &ignored);
}

bool IsIPv4Cidr(const std::string& text) {
    if (text.find('/') == std::string::npos) {
        return false;
    }
    std::uint32_t network = 0;
    int prefix = 0;
    return ParseRange(text, &network, &prefix);
}

bool AddressInRange(const std::string& address, const std::string& range) {
    std::uint32_t addr = 0, net = 0;
    int addr_prefix = 0, net_prefix = 0;
    if (!ParseRange(address, &addr, &addr_prefix) || !ParseRange(range, &net, &net_prefix)) {
        return false;
    }
    if (addr_prefix < net_prefix) {
        return false;
    }
    std::uint32_t mask = PrefixMask(net_prefix);
    return (addr & mask) == (net & mask);
}

std::vector<std::string> ResolveIPv4(const std::string& host) {
    if (IsIPv4Literal(host) || IsIPv4Cidr(host)) {
        return {host};
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0) {
        spdlog::warn("Cannot resolve {}: {}", host, gai_strerror(rc));
        return {};
    }

    std::vector<std::string> addresses;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        auto* sin = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
        std::string text = FormatAddress(ntohl(sin->sin_addr.s_addr));
        if (!text.empty() &&
            std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
            addresses.push_back(text);
        }
    }
    freeaddrinfo(results);

    spdlog::debug("Resolved {} → {} address(es)", host, addresses.size());
    return addresses;
}

// ============================================================================
// PLANNING
// ============================================================================

bool EgressPlan::HasEgress() const {
    switch (access) {
        case core::NetworkAccess::ALLOW_ALL_EXCEPT: return true;
        case core::NetworkAccess::ALLOW_LISTED:     return !accept.empty();
        case core::NetworkAccess::NONE:             return false;
    }
    return false;
}

EgressPlan PlanEgress(const core::Policy& policy, const ResolveFunction& resolve) {
    EgressPlan plan;
    plan.access = policy.GetNetworkAccess();
    if (plan.access == core::NetworkAccess::NONE) {
        return plan;
    }

    for (const auto& entry : policy.blocked_networks) {
        std::string host = core::NormalizeHost(entry);
        auto addresses = resolve(host);
        if (addresses.empty()) {
            plan.unresolved.push_back(host);
        }
        plan.reject.insert(addresses.begin(), addresses.end());
    }

    if (plan.access != core::NetworkAccess::ALLOW_LISTED) {
        return plan;
    }

    auto is_blocked = [&plan](const std::string& address) {
        return std::any_of(plan.reject.begin(), plan.reject.end(),
                           [&address](const std::string& range) {
                               return AddressInRange(address, range);
                           });
    };

    for (const auto& host : policy.EffectiveAllowedNetworks()) {
        auto addresses = resolve(host);
        if (addresses.empty()) {
            plan.unresolved.push_back(host);
            continue;
        }

        std::vector<std::string> kept;
        for (const auto& address : addresses) {
            if (is_blocked(address)) {
                spdlog::debug("{} ({}) is blocked, not accepted", host, address);
                continue;
            }
            plan.accept.insert(address);
            kept.push_back(address);
        }

        if (!kept.empty() && !IsIPv4Literal(host) && !IsIPv4Cidr(host)) {
            plan.pins[host] = kept;
        }
    }

    return plan;
}

std::string BuildHostsFile(const EgressPlan& plan) {
    std::ostringstream out;
    out << "127.0.0.1\tlocalhost\n";
    out << "::1\tlocalhost ip6-localhost ip6-loopback\n";
    for (const auto& [host, addresses] : plan.pins) {
        for (const auto& address : addresses) {
            if (IsIPv4Literal(address)) {
                out << address << '\t' << host << '\n';
            }
        }
    }
    return out.str();
}

// ============================================================================
// RULES
// ============================================================================

std::vector<std::string> FirewallRule::ToArgs(const std::string& action) const {
    std::vector<std::string> args = {"-t", table, action, chain};
    args.insert(args.end(), spec.begin(), spec.end());
    return args;
}

bool FirewallRule::operator==(const FirewallRule& other) const {
    return table == other.table && chain == other.chain && spec == other.spec;
}

std::vector<FirewallRule> BuildJailOutputRules(const EgressPlan& plan) {
    std::vector<FirewallRule> rules;
    rules.push_back({"filter", "OUTPUT", {"-o", "lo", "-j", "ACCEPT"}});
    rules.push_back({"filter", "OUTPUT",
                     {"-m", "conntrack", "--ctstate", "ESTABLISHED,RELATED", "-j", "ACCEPT"}});

    for (const auto& range : plan.reject) {
        rules.push_back({"filter", "OUTPUT", {"-d", range, "-j", "DROP"}});
    }

    if (plan.access != core::NetworkAccess::ALLOW_ALL_EXCEPT) {
        for (const auto& address : plan.accept) {
            rules.push_back({"filter", "OUTPUT", {"-d", address, "-j", "ACCEPT"}});
        }
        rules.push_back({"filter", "OUTPUT", {"-j", "DROP"}});
    }

    return rules;
}

std::vector<FirewallRule> BuildHostNatRules(const std::string& subnet_cidr,
                                            const std::string& host_interface) {
    return {
        {"nat", "POSTROUTING", {"-s", subnet_cidr, "!", "-o", host_interface, "-j", "MASQUERADE"}},
        {"filter", "FORWARD", {"-i", host_interface, "-s", subnet_cidr, "-j", "ACCEPT"}},
        {"filter", "FORWARD", {"-o", host_interface, "-d", subnet_cidr,
                               "-m", "conntrack", "--ctstate", "ESTABLISHED,RELATED",
                               "-j", "ACCEPT"}},
    };
}

std::vector<FirewallRule> BuildDockerUserRules(const EgressPlan& plan,
                                               const std::string& subnet_cidr) {
    std::vector<FirewallRule> rules;

    if (plan.access != core::NetworkAccess::ALLOW_ALL_EXCEPT) {
        rules.push_back({"filter", "DOCKER-USER", {"-s", subnet_cidr, "-j", "DROP"}});
        for (const auto& address : plan.accept) {
            rules.push_back({"filter", "DOCKER-USER",
                             {"-s", subnet_cidr, "-d", address, "-j", "ACCEPT"}});
        }
    }

    for (const auto& range : plan.reject) {
        rules.push_back({"filter", "DOCKER-USER",
                         {"-s", subnet_cidr, "-d", range, "-j", "DROP"}});
    }

    return rules;
}

CommandResult ApplyFirewallRules(CommandRunner& runner,
                                 const std::vector<std::string>& prefix,
                                 const std::vector<FirewallRule>& rules,
                                 const std::string& action) {
    for (const auto& rule : rules) {
        std::vector<std::string> argv = prefix;
        auto args = rule.ToArgs(action);
        argv.insert(argv.end(), args.begin(), args.end());

        CommandResult result = runner.Run(argv);
        if (!result.Succeeded()) {
            return result;
        }
    }
    return CommandResult{};
}

// ============================================================================
// SUBNETS
// ============================================================================

std::string Subnet::Cidr() const {
    return FormatAddress(network) + "/" + std::to_string(prefix_length);
}

std::string Subnet::Host(std::uint32_t offset) const {
    return FormatAddress(network + offset);
}

SubnetPool::SubnetPool(const std::string& base, int prefix_length)
    : base_(0)
    , prefix_length_(prefix_length)
    , capacity_(0) {

    if (!ParseAddress(base, &base_)) {
        throw std::invalid_argument("subnet base is not an IPv4 address: " + base);
    }
    if (prefix_length < 17 || prefix_length > 30) {
        throw std::invalid_argument("subnet prefix must be between 17 and 30");
    }

    base_ &= PrefixMask(16);
    capacity_ = std::size_t{1} << (prefix_length - 16);
}

std::optional<Subnet> SubnetPool::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (std::size_t i = 0; i < capacity_; ++i) {
        auto index = static_cast<std::uint32_t>((next_ + i) % capacity_);
        if (in_use_.count(index)) {
            continue;
        }
        in_use_.insert(index);
        next_ = static_cast<std::uint32_t>((index + 1) % capacity_);

        Subnet subnet;
        subnet.index = index;
        subnet.prefix_length = prefix_length_;
        subnet.network = base_ + (index << (32 - prefix_length_));
        return subnet;
    }

    return std::nullopt;
}

void SubnetPool::Release(const Subnet& subnet) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_use_.erase(subnet.index);
}

std::size_t SubnetPool::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_.size();
}

} // namespace utils
} // namespace warden
