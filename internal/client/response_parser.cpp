#include "response_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cmath>

#include "internal/util/errors.hpp"

namespace eventcache::client {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

// Cap on how deep string-encoded payloads are unwrapped.
constexpr int kMaxEventNesting = 4;

bool ParseJson(std::string_view text, Value* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(std::string(text), out, options).ok();
}

bool LooksLikeJson(const std::string& text) {
  auto first = text.find_first_not_of(" \t\r\n");
  return first != std::string::npos && (text[first] == '[' || text[first] == '{');
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

const Value* FindField(const Struct& object, const std::string& name) {
  auto it = object.fields().find(name);
  return it == object.fields().end() ? nullptr : &it->second;
}

std::optional<int64_t> AsCount(const Value* value) {
  if (!value || value->kind_case() != Value::kNumberValue) return std::nullopt;
  const double number = value->number_value();
  if (!std::isfinite(number) || number < 0) return std::nullopt;
  return static_cast<int64_t>(number);
}

void DecodeEventList(const ListValue& list, std::string_view timestamp_column, QueryPage* page) {
  for (const auto& entry : list.values()) {
    if (entry.kind_case() == Value::kStructValue) {
      page->events.push_back(model::EventRow::FromStruct(entry.struct_value(), timestamp_column));
      continue;
    }

    // List of JSON-encoded objects.
    Value decoded;
    if (entry.kind_case() == Value::kStringValue && LooksLikeJson(entry.string_value()) &&
        ParseJson(entry.string_value(), &decoded) && decoded.kind_case() == Value::kStructValue) {
      page->events.push_back(model::EventRow::FromStruct(decoded.struct_value(), timestamp_column));
      continue;
    }

    ++page->malformed_events;
  }
}

void DecodeEvents(const Value& events, std::string_view timestamp_column, int depth, QueryPage* page) {
  if (depth > kMaxEventNesting) {
    throw util::ProtocolError("events payload nested too deeply");
  }

  switch (events.kind_case()) {
    case Value::kListValue:
      DecodeEventList(events.list_value(), timestamp_column, page);
      return;

    case Value::kStringValue: {
      // A JSON string encoding either the list itself or {"events": [...]}.
      Value decoded;
      if (!LooksLikeJson(events.string_value()) || !ParseJson(events.string_value(), &decoded)) {
        throw util::ProtocolError("events field is a string that does not encode JSON");
      }
      if (decoded.kind_case() == Value::kStructValue) {
        const Value* inner = FindField(decoded.struct_value(), "events");
        if (!inner) throw util::ProtocolError("encoded events object has no events field");
        DecodeEvents(*inner, timestamp_column, depth + 1, page);
        return;
      }
      DecodeEvents(decoded, timestamp_column, depth + 1, page);
      return;
    }

    case Value::kNullValue:
      return;

    default:
      throw util::ProtocolError("events field has unexpected type");
  }
}

void DecodeLinks(const Value& links, QueryPage* page) {
  if (links.kind_case() == Value::kNullValue) return;
  if (links.kind_case() != Value::kListValue) {
    throw util::ProtocolError("links field is not a list");
  }

  for (const auto& link : links.list_value().values()) {
    if (link.kind_case() != Value::kStructValue) {
      throw util::ProtocolError("links entry is not an object");
    }

    const Value* rel = FindField(link.struct_value(), "rel");
    if (!rel || rel->kind_case() != Value::kStringValue) continue;

    const std::string relation = Lower(rel->string_value());
    if (relation != "self" && relation != "next") continue;

    const Value* href = FindField(link.struct_value(), "href");
    if (!href || href->kind_case() != Value::kStringValue || href->string_value().empty()) {
      throw util::ProtocolError(rel->string_value() + " link has no href");
    }

    if (relation == "self") {
      page->self_link = href->string_value();
    } else {
      page->next_link = href->string_value();
    }
  }
}

} // namespace

QueryPage ParseQueryPage(std::string_view body, std::string_view timestamp_column) {
  Value root;
  if (!ParseJson(body, &root)) {
    throw util::ProtocolError("response body is not valid JSON");
  }
  if (root.kind_case() != Value::kStructValue) {
    throw util::ProtocolError("response body is not a JSON object");
  }

  const Struct& object = root.struct_value();
  QueryPage     page;

  if (const Value* links = FindField(object, "links")) {
    DecodeLinks(*links, &page);
  }

  if (const Value* events = FindField(object, "events")) {
    DecodeEvents(*events, timestamp_column, 0, &page);
  }

  const Value* in_progress = FindField(object, "in_progress");
  if (in_progress && in_progress->kind_case() == Value::kBoolValue) {
    page.in_progress = in_progress->bool_value();
  } else {
    page.in_progress = page.self_link.has_value();
  }

  page.total_matched = AsCount(FindField(object, "total_matched"));
  if (!page.total_matched) {
    const Value* statistics = FindField(object, "statistics");
    if (statistics && statistics->kind_case() == Value::kStructValue) {
      page.total_matched = AsCount(FindField(statistics->struct_value(), "count"));
    }
  }

  return page;
}

} // namespace eventcache::client
