#pragma once

#include <cstdint>
#include <string>

namespace commute::db::model {

/*
  Persistent sample row: one route alternative of one batch.

  IMPORTANT:
  - Rows of one batch share batch_id, batch_ts, origin_label and dest_label.
  - Rows are never updated or deleted by the sampler.
*/

struct SampleRecord {
  int64_t     id = 0;
  std::string created_at;

  std::string batch_id;
  std::string batch_ts;

  std::string origin_label;
  std::string dest_label;
  std::string description;

  int64_t meters = 0;
  double  miles  = 0.0;

  int64_t duration_seconds        = 0;
  int     duration_static_minutes = 0;  // no traffic
  int     duration_minutes        = 0;  // with traffic
};

}
