#include "actiscope/Utility.h"
#include "actiscope/Errors.h"

namespace actiscope {

std::string activity_type_to_string(ActivityType type) {
    switch (type) {
        case ActivityType::Walking:
            return "walking";
        case ActivityType::Running:
            return "running";
        case ActivityType::Standing:
            return "standing";
        case ActivityType::Sitting:
            return "sitting";
        case ActivityType::Lying:
            return "lying";
        case ActivityType::Cycling:
            return "cycling";
        case ActivityType::Unknown:
            return "unknown";
    }
    return "unknown";
}

ActivityType activity_type_from_string(const std::string& value) {
    for (ActivityType type : all_activity_types()) {
        if (activity_type_to_string(type) == value) {
            return type;
        }
    }
    throw ValidationError("Unknown activity type: " + value);
}

const std::vector<ActivityType>& all_activity_types() {
    static const std::vector<ActivityType> kTypes = {
        ActivityType::Walking,
        ActivityType::Running,
        ActivityType::Standing,
        ActivityType::Sitting,
        ActivityType::Lying,
        ActivityType::Cycling,
        ActivityType::Unknown,
    };
    return kTypes;
}

}  // namespace actiscope
