#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/event_row.hpp"

namespace eventcache::client {

/*
  Typed view of one provider response body.

      {
        "events":      [...],
        "links":       [{"rel": "Self" | "Next", "href": "<url>"}],
        "in_progress": true,                      (optional)
        "total_matched": 123 | "statistics": {"count": 123}   (optional)
      }
*/
struct QueryPage {
  std::vector<model::EventRow> events;

  std::optional<std::string> self_link;
  std::optional<std::string> next_link;

  // True while the provider is still computing the result.
  bool in_progress = false;

  std::optional<int64_t> total_matched;

  // Entries of `events` that could not be decoded into an object.
  size_t malformed_events = 0;
};

/*
  Decodes a response body.

  Throws util::ProtocolError for a non-JSON or non-object body, a `links`
  field that is not a list, or a Self/Next link without an href.
*/
QueryPage ParseQueryPage(std::string_view body, std::string_view timestamp_column);

} // namespace eventcache::client
