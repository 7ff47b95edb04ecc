#pragma once

#include "actiscope/ActivityTypes.h"

#include <istream>
#include <string>

namespace actiscope {

/**
 * Read "timestamp,x,y,z" rows into a batch.
 *
 * A leading header row and lines starting with '#' are skipped, blank lines
 * ignored. startTime is the first sample's timestamp (0 when empty).
 * @throws ValidationError naming the offending line on a malformed row
 */
AccelerationBatch read_csv_batch(std::istream& in, int samplingRateHz);

AccelerationBatch load_csv_batch(const std::string& path, int samplingRateHz);

}  // namespace actiscope
