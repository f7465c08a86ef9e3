#include "accessroute/profile/ProfileRegistry.h"

#include <stdexcept>

namespace accessroute {

namespace {

// Table order reminders:
//   surface  = {paved, rough, unpaved}
//   slope    = {flat, gentle, moderate, steep}
//   crossing = {none, marked, unmarked}
//   width    = {narrow, restricted, standard}

MobilityProfile standardProfile() {
    MobilityProfile p;
    p.key = profiles::STANDARD;
    p.displayName = "Adult without restrictions";
    p.baseSpeedMps = 1.4;
    return p;
}

MobilityProfile wheelchairProfile() {
    MobilityProfile p;
    p.key = profiles::WHEELCHAIR;
    p.displayName = "Wheelchair user";
    p.baseSpeedMps = 1.0;
    p.factors.surface = {1.0, 1.5, 2.0};
    p.factors.uphill = {1.0, 1.25, 2.0, 4.0};
    p.factors.downhill = {1.0, 1.1, 1.5, 3.0};
    p.factors.crossing = {1.0, 1.0, 1.5};
    p.factors.width = {3.0, 1.5, 1.0};
    p.factors.limitedAccess = 1.5;
    p.exclusions = {
        ExclusionRule::stepsWithoutRamp(),
        ExclusionRule::wheelchairNo(),
        ExclusionRule::inclineAbove(12.0),
        ExclusionRule::widthBelow(0.8),
    };
    return p;
}

MobilityProfile elderlyProfile() {
    MobilityProfile p;
    p.key = profiles::ELDERLY;
    p.displayName = "Elderly";
    p.baseSpeedMps = 0.9;
    p.factors.surface = {1.0, 1.3, 1.6};
    p.factors.uphill = {1.0, 1.15, 1.5, 2.5};
    p.factors.downhill = {1.0, 1.1, 1.4, 2.2};
    p.factors.crossing = {1.0, 1.0, 2.0};
    p.factors.steps = 3.0;
    return p;
}

MobilityProfile pregnantProfile() {
    MobilityProfile p;
    p.key = profiles::PREGNANT;
    p.displayName = "Pregnant";
    p.baseSpeedMps = 1.1;
    p.factors.surface = {1.0, 1.2, 1.4};
    p.factors.uphill = {1.0, 1.1, 1.4, 2.0};
    p.factors.downhill = {1.0, 1.05, 1.3, 1.8};
    p.factors.crossing = {1.0, 1.0, 1.8};
    p.factors.steps = 2.0;
    return p;
}

MobilityProfile strollerProfile() {
    MobilityProfile p;
    p.key = profiles::STROLLER;
    p.displayName = "Caregiver with stroller";
    p.baseSpeedMps = 1.2;
    p.factors.surface = {1.0, 1.6, 2.2};
    p.factors.uphill = {1.0, 1.15, 1.6, 2.8};
    p.factors.downhill = {1.0, 1.1, 1.4, 2.2};
    p.factors.crossing = {1.0, 1.0, 1.5};
    p.factors.width = {2.5, 1.3, 1.0};
    p.factors.limitedAccess = 1.3;
    p.factors.steps = 50.0;
    p.exclusions = {ExclusionRule::widthBelow(0.7)};
    return p;
}

MobilityProfile temporaryImpairmentProfile() {
    MobilityProfile p;
    p.key = profiles::TEMPORARY_IMPAIRMENT;
    p.displayName = "Temporarily impaired (crutches, injury)";
    p.baseSpeedMps = 0.8;
    p.factors.surface = {1.0, 1.5, 2.0};
    p.factors.uphill = {1.0, 1.2, 1.7, 3.0};
    p.factors.downhill = {1.0, 1.15, 1.6, 2.8};
    p.factors.crossing = {1.0, 1.0, 1.8};
    p.factors.limitedAccess = 1.2;
    p.factors.steps = 4.0;
    return p;
}

MobilityProfile visuallyImpairedProfile() {
    MobilityProfile p;
    p.key = profiles::VISUALLY_IMPAIRED;
    p.displayName = "Visually impaired";
    p.baseSpeedMps = 1.1;
    p.factors.surface = {1.0, 1.2, 1.4};
    p.factors.crossing = {1.0, 1.0, 3.0};
    p.factors.width = {1.5, 1.0, 1.0};
    p.factors.steps = 1.5;
    return p;
}

}  // namespace

ProfileRegistry ProfileRegistry::builtin() {
    ProfileRegistry registry;
    registry.registerProfile(standardProfile());
    registry.registerProfile(wheelchairProfile());
    registry.registerProfile(elderlyProfile());
    registry.registerProfile(pregnantProfile());
    registry.registerProfile(strollerProfile());
    registry.registerProfile(temporaryImpairmentProfile());
    registry.registerProfile(visuallyImpairedProfile());
    return registry;
}

void ProfileRegistry::registerProfile(MobilityProfile profile) {
    profile.validate();

    const std::string key = profile.key;
    if (profiles_.find(key) != profiles_.end()) {
        throw std::invalid_argument("Profile '" + key + "' already registered");
    }

    profiles_.emplace(key, std::move(profile));
    order_.push_back(key);
}

bool ProfileRegistry::hasProfile(const std::string& key) const {
    return profiles_.find(key) != profiles_.end();
}

const MobilityProfile* ProfileRegistry::find(const std::string& key) const {
    auto it = profiles_.find(key);
    if (it == profiles_.end()) {
        return nullptr;
    }
    return &it->second;
}

const MobilityProfile& ProfileRegistry::get(const std::string& key) const {
    const MobilityProfile* profile = find(key);
    if (!profile) {
        throw std::out_of_range("Unknown mobility profile: " + key);
    }
    return *profile;
}

}  // namespace accessroute
