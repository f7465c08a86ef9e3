#pragma once

#include "MobilityProfile.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace accessroute {

/// Keys of the built-in profiles
namespace profiles {
constexpr const char* STANDARD = "standard";
constexpr const char* WHEELCHAIR = "wheelchair";
constexpr const char* ELDERLY = "elderly";
constexpr const char* PREGNANT = "pregnant";
constexpr const char* STROLLER = "stroller";
constexpr const char* TEMPORARY_IMPAIRMENT = "temporary_impairment";
constexpr const char* VISUALLY_IMPAIRED = "visually_impaired";
}  // namespace profiles

/// Immutable catalog of mobility profiles keyed by name.
///
/// Every profile is validated on registration, so a registry that was
/// built successfully only holds profiles whose factors are all >= 1.0.
///
/// Usage:
/// @code
/// auto registry = ProfileRegistry::builtin();
/// const MobilityProfile& wheelchair = registry.get("wheelchair");
/// @endcode
class ProfileRegistry {
public:
    ProfileRegistry() = default;

    /// Registry preloaded with the built-in campus profiles
    static ProfileRegistry builtin();

    /// Register a profile
    /// @throws std::invalid_argument if the profile is invalid or the key exists
    void registerProfile(MobilityProfile profile);

    bool hasProfile(const std::string& key) const;

    /// @return Pointer to profile, or nullptr if not found
    const MobilityProfile* find(const std::string& key) const;

    /// @throws std::out_of_range if not found
    const MobilityProfile& get(const std::string& key) const;

    /// Profile keys in registration order
    const std::vector<std::string>& keys() const { return order_; }

    size_t size() const { return order_.size(); }

private:
    std::unordered_map<std::string, MobilityProfile> profiles_;
    std::vector<std::string> order_;
};

}  // namespace accessroute
