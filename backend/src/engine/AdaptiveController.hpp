#pragma once

#include "engine/Probes.hpp"
#include "engine/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tmax::engine
{

class TransferEngine;

constexpr char const *kProfileWifi = "wifi";
constexpr char const *kProfileLan = "lan";
constexpr char const *kProfileVpn = "vpn";
constexpr char const *kProfileUnknown = "unknown";

struct Bottleneck
{
    std::string category; // disk, cpu, peers, network
    double severity = 0.0;
    std::string message;
    std::string suggestion;

    bool operator==(Bottleneck const &) const = default;
};

// Tuning bundle for a connection type, keyed by session setting name.
SettingsMap const *find_profile(std::string const &name);

// Picks a tuning profile from the environment and pushes it into the
// engine. A manual profile, once set, wins over detection until cleared.
class AdaptiveController
{
  public:
    AdaptiveController(TransferEngine &engine, NetworkClassifier &network);

    std::string const &current_profile() const noexcept
    {
        return current_profile_;
    }
    std::optional<std::string> const &manual_profile() const noexcept
    {
        return manual_profile_;
    }

    // Returns the active profile name. Settings are only pushed when the
    // detected profile differs from the active one.
    std::string detect_and_apply();
    void set_manual_profile(std::optional<std::string> name);
    bool apply_profile(std::string const &name);

    static std::vector<Bottleneck> analyze_bottlenecks(SessionStats const &stats,
                                                       double disk_percent,
                                                       double cpu_percent);

    // Disk pressure above 0.8 halves the active profile's baseline
    // connection limit (never below 30). Other findings are advisory.
    void apply_dynamic_adjustments(std::vector<Bottleneck> const &bottlenecks);

  private:
    TransferEngine &engine_;
    NetworkClassifier &network_;
    std::string current_profile_{kProfileUnknown};
    std::optional<std::string> manual_profile_;
};

} // namespace tmax::engine
