#include <gtest/gtest.h>

#include "my_error_codes.hpp"
#include "tunnel/frame_assembler.hpp"

namespace hookrelay {

namespace {

AttemptFrame MakePart(const std::string &id, int index, int total,
                      std::string body) {
  AttemptFrame frame;
  frame.attempt.attempt_id = id;
  frame.attempt.body = std::move(body);
  if (index == 0) {
    frame.attempt.connection_id = "web_1";
    frame.attempt.method = "POST";
    frame.attempt.path = "/hook";
  }
  frame.part = FramePart{index, total};
  return frame;
}

} // namespace

TEST(FrameAssemblerTest, UnsplitFramePassesThrough) {
  FrameAssembler assembler;
  AttemptFrame frame;
  frame.attempt.attempt_id = "a";
  frame.attempt.body = "whole";
  auto r = assembler.Add(frame);
  ASSERT_TRUE(r.is_ok());
  ASSERT_TRUE(r.value().has_value());
  EXPECT_EQ(r.value()->body, "whole");
  EXPECT_EQ(assembler.pending(), 0u);
}

TEST(FrameAssemblerTest, OutOfOrderPartsReassemble) {
  FrameAssembler assembler;
  auto r2 = assembler.Add(MakePart("a", 2, 3, "C"));
  ASSERT_TRUE(r2.is_ok());
  EXPECT_FALSE(r2.value().has_value());
  auto r0 = assembler.Add(MakePart("a", 0, 3, "A"));
  ASSERT_TRUE(r0.is_ok());
  EXPECT_FALSE(r0.value().has_value());
  EXPECT_EQ(assembler.pending(), 1u);

  auto r1 = assembler.Add(MakePart("a", 1, 3, "B"));
  ASSERT_TRUE(r1.is_ok());
  ASSERT_TRUE(r1.value().has_value());
  const auto &done = *r1.value();
  EXPECT_EQ(done.body, "ABC");
  EXPECT_EQ(done.connection_id, "web_1");
  EXPECT_EQ(done.path, "/hook");
  EXPECT_EQ(assembler.pending(), 0u);
}

TEST(FrameAssemblerTest, DuplicatePartIsRejected) {
  FrameAssembler assembler;
  ASSERT_TRUE(assembler.Add(MakePart("a", 0, 2, "A")).is_ok());
  auto dup = assembler.Add(MakePart("a", 0, 2, "A"));
  ASSERT_TRUE(dup.is_err());
  EXPECT_EQ(dup.error().code, my_errors::JSON::DECODE_ERROR);
  EXPECT_EQ(assembler.pending(), 0u);
}

TEST(FrameAssemblerTest, ChangedPartCountIsRejected) {
  FrameAssembler assembler;
  ASSERT_TRUE(assembler.Add(MakePart("a", 0, 2, "A")).is_ok());
  EXPECT_TRUE(assembler.Add(MakePart("a", 1, 3, "B")).is_err());
}

TEST(FrameAssemblerTest, OversizedPartCountIsRejected) {
  FrameAssembler assembler;
  auto r = assembler.Add(MakePart("a", 0, kMaxAttemptParts + 1, "A"));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::JSON::DECODE_ERROR);
  EXPECT_EQ(assembler.pending(), 0u);

  auto bad_index = assembler.Add(MakePart("b", 5, 2, "A"));
  ASSERT_TRUE(bad_index.is_err());
  EXPECT_EQ(assembler.pending(), 0u);
}

TEST(FrameAssemblerTest, PendingLimit) {
  FrameAssembler assembler(2);
  ASSERT_TRUE(assembler.Add(MakePart("a", 0, 2, "A")).is_ok());
  ASSERT_TRUE(assembler.Add(MakePart("b", 0, 2, "A")).is_ok());
  auto r = assembler.Add(MakePart("c", 0, 2, "A"));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::LISTEN::OVERLOADED);
}

TEST(FrameAssemblerTest, BodyByteCap) {
  FrameAssembler assembler(8, 4);
  ASSERT_TRUE(assembler.Add(MakePart("a", 0, 2, "abc")).is_ok());
  auto r = assembler.Add(MakePart("a", 1, 2, "de"));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::LISTEN::OVERLOADED);
  EXPECT_EQ(assembler.pending(), 0u);
}

} // namespace hookrelay
