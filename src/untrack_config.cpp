#include "untrack_config.h"
#include "query_clean.h"
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>

static UntrackConfig from_node(const YAML::Node& root) {
  UntrackConfig c;
  if (!root || root.IsNull()) return c;

  // allow (optional): category key -> bool
  if (auto a = root["allow"]) {
    for (const auto& kv : a) {
      const std::string key = kv.first.as<std::string>();
      const TrackingCategory* cat = find_tracking_category(key);
      if (!cat) {
        fmt::print(stderr, "[url_untrack] WARN unknown tracking category '{}' ignored\n", key);
        continue;
      }
      c.policy.*(cat->allowed) = kv.second.as<bool>();
    }
  }

  // extra_params (optional)
  if (root["extra_params"]) c.extra_params = root["extra_params"].as<std::vector<std::string>>();

  return c;
}

UntrackConfig parse_untrack_config(const std::string& yaml_text) {
  return from_node(YAML::Load(yaml_text));
}

UntrackConfig load_untrack_config(const std::string& path) {
  UntrackConfig c = from_node(YAML::LoadFile(path));
  fmt::print(stderr, "[url_untrack] Loaded config '{}': {} blocked params ({} extra)\n",
             path, config_blocklist(c).size(), c.extra_params.size());
  return c;
}

std::vector<std::string> config_blocklist(const UntrackConfig& cfg) {
  std::set<std::string> resolved = resolve_blocklist(cfg.policy);
  std::vector<std::string> out(resolved.begin(), resolved.end());
  for (const auto& p : cfg.extra_params) {
    if (resolved.count(p)) continue;
    if (std::find(out.begin(), out.end(), p) != out.end()) continue;
    out.push_back(p);
  }
  return out;
}

absl::StatusOr<std::string> untrack_url(const std::string& url, const UntrackConfig& cfg) {
  return clean_url(url, config_blocklist(cfg));
}
