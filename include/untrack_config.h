#pragma once
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "tracking_policy.h"

struct UntrackConfig {
  TrackingPolicy policy;
  std::vector<std::string> extra_params; // removed in addition to the policy
};

// YAML layout:
//   allow:
//     utm: false
//     gclid: true
//   extra_params: [ref, mc_eid]
// Throws YAML::Exception on malformed documents or wrongly typed values.
UntrackConfig parse_untrack_config(const std::string& yaml_text);
UntrackConfig load_untrack_config(const std::string& path);

// Policy blocklist followed by the extra params not already in it.
std::vector<std::string> config_blocklist(const UntrackConfig& cfg);

absl::StatusOr<std::string> untrack_url(const std::string& url, const UntrackConfig& cfg);
