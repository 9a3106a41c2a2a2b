#include "tracking_policy.h"

const std::vector<TrackingCategory>& tracking_categories() {
  static const std::vector<TrackingCategory> kCategories = {
    {"utm", &TrackingPolicy::allow_utm,
     {"utm_source", "utm_medium", "utm_campaign", "utm_term", "utm_content",
      "utm_id", "utm_source_platform", "utm_creative_format", "utm_marketing_tactic",
      "utm_name", "utm_cid", "utm_reader", "utm_referrer", "utm_social",
      "utm_social-type", "utm_brand", "utm_place", "utm_pubreferrer", "utm_swu",
      "utm_viz_id"}},
    {"gclid", &TrackingPolicy::allow_gclid, {"gclid", "gbraid", "wbraid"}},
    {"gclsrc", &TrackingPolicy::allow_gclsrc, {"gclsrc"}},
    {"dclid", &TrackingPolicy::allow_dclid, {"dclid"}},
    {"fbclid", &TrackingPolicy::allow_fbclid, {"fbclid"}},
    {"msclkid", &TrackingPolicy::allow_msclkid, {"msclkid", "mscklid"}},
    {"zanpid", &TrackingPolicy::allow_zanpid, {"zanpid"}},
  };
  return kCategories;
}

const TrackingCategory* find_tracking_category(std::string_view key) {
  for (const auto& c : tracking_categories()) {
    if (key == c.key) return &c;
  }
  return nullptr;
}

std::set<std::string> resolve_blocklist(const TrackingPolicy& policy) {
  std::set<std::string> out;
  for (const auto& c : tracking_categories()) {
    if (policy.*(c.allowed)) continue;
    out.insert(c.params.begin(), c.params.end());
  }
  return out;
}
