#include <gtest/gtest.h>
#include "tracking_policy.h"

TEST(TrackingPolicyTest, DefaultBlocksEveryCategory) {
  auto bl = resolve_blocklist(TrackingPolicy{});
  for (const auto& c : tracking_categories()) {
    for (const auto& p : c.params) EXPECT_EQ(bl.count(p), 1u) << c.key << ": " << p;
  }
  EXPECT_EQ(bl.count("utm_source"), 1u);
  EXPECT_EQ(bl.count("fbclid"), 1u);
  EXPECT_EQ(bl.count("name"), 0u);
}

TEST(TrackingPolicyTest, AllowedCategoryContributesNothing) {
  TrackingPolicy p;
  p.allow_gclid = true;
  p.allow_gclsrc = true;
  auto bl = resolve_blocklist(p);
  EXPECT_EQ(bl.count("gclid"), 0u);
  EXPECT_EQ(bl.count("gbraid"), 0u);
  EXPECT_EQ(bl.count("gclsrc"), 0u);
  EXPECT_EQ(bl.count("utm_medium"), 1u);
  EXPECT_EQ(bl.count("mscklid"), 1u);
}

TEST(TrackingPolicyTest, EverythingAllowedIsEmpty) {
  TrackingPolicy p;
  for (const auto& c : tracking_categories()) p.*(c.allowed) = true;
  EXPECT_TRUE(resolve_blocklist(p).empty());
}

TEST(TrackingPolicyTest, NoPrefixExpansion) {
  auto bl = resolve_blocklist(TrackingPolicy{});
  EXPECT_EQ(bl.count("utm_"), 0u);
  EXPECT_EQ(bl.count("UTM_SOURCE"), 0u);
}

TEST(TrackingPolicyTest, FindCategoryByKey) {
  const TrackingCategory* c = find_tracking_category("fbclid");
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->allowed, &TrackingPolicy::allow_fbclid);
  EXPECT_EQ(find_tracking_category("nope"), nullptr);
}
