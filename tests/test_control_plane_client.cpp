#include <gtest/gtest.h>

#include "control_plane/control_plane_client.hpp"

namespace hookrelay {

TEST(RequestTargetTest, EncodesSegmentsAndParams) {
  EXPECT_EQ(MakeRequestTarget({"sources"}), "/sources");
  EXPECT_EQ(MakeRequestTarget({"sources"}, {{"name", "shop"}}),
            "/sources?name=shop");
  EXPECT_EQ(MakeRequestTarget({"destinations"},
                              {{"type", "CLI"}, {"name", "box&name=x"}}),
            "/destinations?type=CLI&name=box%26name=x");
  EXPECT_EQ(MakeRequestTarget({"events", "evt 1/2", "retry"}),
            "/events/evt%201%2F2/retry");
  EXPECT_EQ(MakeRequestTarget({"cli-attempts", "atm_1"}),
            "/cli-attempts/atm_1");
}

} // namespace hookrelay
