//===- unittests/Basic/BinaryCodingTests.cpp ------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "memobuild/Basic/BinaryCoding.h"
#include "memobuild/Basic/FileInfo.h"

#include "gtest/gtest.h"

using namespace memobuild;
using namespace memobuild::basic;

namespace {

TEST(BinaryCodingTests, integersAreLittleEndian) {
  BinaryEncoder encoder;
  encoder.write(uint16_t(0xABCD));
  encoder.write(uint32_t(0x01234567));
  EXPECT_EQ(encoder.contents(),
            std::vector<uint8_t>({ 0xCD, 0xAB, 0x67, 0x45, 0x23, 0x01 }));

  BinaryDecoder decoder(encoder.getBytes());
  uint16_t a;
  uint32_t b;
  decoder.read(a);
  decoder.read(b);
  EXPECT_EQ(a, 0xABCD);
  EXPECT_EQ(b, 0x01234567U);
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTests, strings) {
  BinaryEncoder encoder;
  encoder.writeString("hello");
  encoder.writeString(StringRef("a\0b", 3));

  BinaryDecoder decoder(encoder.getBytes());
  std::string s1, s2;
  decoder.readString(s1);
  decoder.readString(s2);
  EXPECT_EQ(s1, "hello");
  EXPECT_EQ(s2, std::string("a\0b", 3));
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTests, truncatedInputLatchesError) {
  BinaryEncoder encoder;
  encoder.writeString("hello");
  StringRef bytes = encoder.getBytes();

  // Drop the last byte of the string.
  BinaryDecoder decoder(bytes.drop_back());
  std::string s;
  decoder.readString(s);
  EXPECT_TRUE(decoder.hadError());
  EXPECT_FALSE(decoder.finish());

  // A length larger than the stream does not read out of bounds.
  BinaryEncoder lengthOnly;
  lengthOnly.write(uint64_t(1) << 40);
  BinaryDecoder badLength(lengthOnly.getBytes());
  badLength.readString(s);
  EXPECT_TRUE(badLength.hadError());
  EXPECT_EQ(s, "");
}

TEST(BinaryCodingTests, trailingBytesFailFinish) {
  BinaryEncoder encoder;
  encoder.write(uint8_t(1));
  encoder.write(uint8_t(2));

  BinaryDecoder decoder(encoder.getBytes());
  uint8_t value;
  decoder.read(value);
  EXPECT_FALSE(decoder.hadError());
  EXPECT_FALSE(decoder.finish());
  EXPECT_EQ(decoder.getRemaining(), 1U);
}

TEST(BinaryCodingTests, fileTimestamp) {
  FileTimestamp timestamp{ 1234567890, 999999999 };
  BinaryEncoder encoder;
  encoder.write(timestamp);

  BinaryDecoder decoder(encoder.getBytes());
  FileTimestamp decoded{ 0, 0 };
  decoder.read(decoded);
  EXPECT_TRUE(decoder.finish());
  EXPECT_EQ(decoded, timestamp);
}

}
