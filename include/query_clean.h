#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "tracking_policy.h"

struct QueryParam {
  std::string name;                 // decoded, used for blocklist matching
  std::optional<std::string> value; // decoded; nullopt for a bare "flag"
  std::string raw;                  // segment exactly as it appeared
};

// application/x-www-form-urlencoded decoding ('+' is a space).
// Returns std::nullopt on a truncated or non-hex %-escape.
std::optional<std::string> form_decode(std::string_view s);

// Split a query (without the leading '?') into parameters, in order.
// Empty segments ("a=1&&b=2") are skipped. Fails with InvalidArgument on
// malformed percent-encoding.
absl::StatusOr<std::vector<QueryParam>> parse_query(std::string_view query);

// Remove every query parameter whose name is in `blocklist`.
// URLs without a query come back unchanged. Errors are InvalidArgument
// (the URL, or its query, does not parse).
absl::StatusOr<std::string> clean_url(const std::string& url,
                                      const std::vector<std::string>& blocklist);

// Remove the tracking parameters `policy` does not allow.
absl::StatusOr<std::string> untrack_url(const std::string& url,
                                        const TrackingPolicy& policy = TrackingPolicy{});

// True for the error clean_url/untrack_url return on unparseable input.
bool is_parse_error(const absl::Status& status);
