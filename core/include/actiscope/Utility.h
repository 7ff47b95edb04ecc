#pragma once

#include "actiscope/ActivityTypes.h"

#include <string>
#include <vector>

namespace actiscope {

std::string activity_type_to_string(ActivityType type);
ActivityType activity_type_from_string(const std::string& value);

// All labels in declaration order.
const std::vector<ActivityType>& all_activity_types();

}
