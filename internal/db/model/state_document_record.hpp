#pragma once

#include <cstdint>
#include <string>

namespace pipeline::db::model {

/*
  Row of the pipeline_state_document table.

  `document` is the JSON produced by persistence::EncodeJson.
  `revision` starts at 1 and grows by one per successful write.
*/
struct StateDocumentRecord {
  std::string workspace_id;
  std::string document;
  uint64_t    revision      = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace pipeline::db::model
