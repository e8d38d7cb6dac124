#include "common/DomainNames.hpp"

#include <gtest/gtest.h>

#include <string>

namespace dn = dnspub::common::domain_names;

TEST(DomainNamesTest, CanonicalizeLowercasesAndStripsTrailingDot) {
  EXPECT_EQ(dn::canonicalize("Example.TLD."), "example.tld");
  EXPECT_EQ(dn::canonicalize("example.tld"), "example.tld");
  EXPECT_EQ(dn::canonicalize(""), "");
}

TEST(DomainNamesTest, ToAbsoluteAddsExactlyOneDot) {
  EXPECT_EQ(dn::toAbsolute("a.example"), "a.example.");
  EXPECT_EQ(dn::toAbsolute("A.Example."), "a.example.");
}

TEST(DomainNamesTest, LabelsSplitsOnDots) {
  const auto vLabels = dn::labels("ns1.a.example.");
  ASSERT_EQ(vLabels.size(), 3u);
  EXPECT_EQ(vLabels[0], "ns1");
  EXPECT_EQ(vLabels[2], "example");
}

TEST(DomainNamesTest, IsValidAcceptsHostNames) {
  EXPECT_TRUE(dn::isValid("a.example"));
  EXPECT_TRUE(dn::isValid("xn--bcher-kva.example."));
  EXPECT_TRUE(dn::isValid("_dmarc.a.example"));
  EXPECT_TRUE(dn::isValid("a-b.example"));
}

TEST(DomainNamesTest, IsValidRejectsMalformedNames) {
  EXPECT_FALSE(dn::isValid(""));
  EXPECT_FALSE(dn::isValid("a..example"));
  EXPECT_FALSE(dn::isValid("-a.example"));
  EXPECT_FALSE(dn::isValid("a-.example"));
  EXPECT_FALSE(dn::isValid("a b.example"));
  EXPECT_FALSE(dn::isValid(std::string(64, 'a') + ".example"));

  std::string sLong;
  while (sLong.size() < 260) sLong += "abcdefghi.";
  EXPECT_FALSE(dn::isValid(sLong + "example"));
}

TEST(DomainNamesTest, IsUnderRequiresLabelBoundary) {
  EXPECT_TRUE(dn::isUnder("a.example", "example"));
  EXPECT_TRUE(dn::isUnder("ns1.a.example.", "a.example"));
  EXPECT_TRUE(dn::isUnder("A.EXAMPLE", "example."));
  EXPECT_FALSE(dn::isUnder("example", "example"));
  EXPECT_FALSE(dn::isUnder("aexample", "example"));
  EXPECT_FALSE(dn::isUnder("a.other", "example"));
  EXPECT_FALSE(dn::isUnder("a.example", ""));
}

TEST(DomainNamesTest, SuperordinateDomainIsTldPlusOneLabel) {
  EXPECT_EQ(dn::superordinateDomain("ns1.a.example", "example"), "a.example");
  EXPECT_EQ(dn::superordinateDomain("a.example", "example"), "a.example");
  EXPECT_EQ(dn::superordinateDomain("x.y.b.co.uk", "co.uk"), "b.co.uk");
}

TEST(DomainNamesTest, SuperordinateDomainIsEmptyOutsideTld) {
  EXPECT_FALSE(dn::superordinateDomain("ns1.a.other", "example").has_value());
  EXPECT_FALSE(dn::superordinateDomain("example", "example").has_value());
}
