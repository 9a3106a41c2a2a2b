#pragma once
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Which tracking categories are allowed to stay on a URL.
// Default-constructed: nothing allowed, every known tracker is stripped.
struct TrackingPolicy {
  bool allow_utm = false;      // Urchin Tracking Module (utm_source, utm_medium, ...)
  bool allow_gclid = false;    // Google click identifier (also gbraid/wbraid)
  bool allow_gclsrc = false;   // Google Ads click source
  bool allow_dclid = false;    // DoubleClick click identifier, now Google
  bool allow_fbclid = false;   // Facebook click identifier
  bool allow_msclkid = false;  // Microsoft Advertising (Bing Ads) click identifier
  bool allow_zanpid = false;   // zanox click identifier, now Awin
};

struct TrackingCategory {
  const char* key;                 // name used in config files, e.g. "utm"
  bool TrackingPolicy::*allowed;   // flag that lets the category through
  std::vector<std::string> params; // exact parameter names
};

// Static category table, built once and never modified.
const std::vector<TrackingCategory>& tracking_categories();

// nullptr if no category has this key
const TrackingCategory* find_tracking_category(std::string_view key);

// Union of the parameter names of every category the policy does not allow.
std::set<std::string> resolve_blocklist(const TrackingPolicy& policy);
