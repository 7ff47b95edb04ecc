#pragma once

#include "actiscope/ActivityTypes.h"

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

namespace actiscope {

class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();

    // One row per (user id, batch id); a second save replaces the first.
    std::int64_t save_recognition(const RecognitionRequest& request, const RecognitionResult& result);

    std::vector<ActivitySegment> load_segments(const std::string& userId, const std::string& batchId) const;
    std::vector<ActivityPattern> load_patterns(const std::string& userId, const std::string& batchId) const;

  private:
    sqlite3* db_{nullptr};
};

}  // namespace actiscope
