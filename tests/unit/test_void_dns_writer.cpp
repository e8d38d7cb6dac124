#include "writers/VoidDnsWriter.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using dnspub::writers::VoidDnsWriter;

TEST(VoidDnsWriterTest, AcceptsAndDiscardsEverything) {
  VoidDnsWriter vdw("example");
  EXPECT_NO_THROW(vdw.publishDomain("a.example"));
  EXPECT_NO_THROW(vdw.publishHost("ns1.a.example"));
  EXPECT_NO_THROW(vdw.commit());
  EXPECT_TRUE(vdw.committed());
}

TEST(VoidDnsWriterTest, StillSingleUse) {
  VoidDnsWriter vdw("example");
  vdw.commit();
  EXPECT_THROW(vdw.publishDomain("a.example"), std::logic_error);
  EXPECT_THROW(vdw.commit(), std::logic_error);
}
