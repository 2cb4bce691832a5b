//===- unittests/Basic/HashingTest.cpp ------------------------------------===//
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

#include "memobuild/Basic/FileInfo.h"
#include "memobuild/Basic/Hashing.h"

#include "gtest/gtest.h"

#include <vector>

using namespace memobuild;
using namespace memobuild::basic;

namespace {

TEST(HashingTest, hex) {
  EXPECT_EQ(toHex(StringRef("\x01\xab\xff", 3)), "01abff");
  EXPECT_EQ(toHex(StringRef()), "");

  std::vector<uint8_t> bytes;
  EXPECT_TRUE(fromHex("01ABff", bytes));
  EXPECT_EQ(bytes, std::vector<uint8_t>({ 0x01, 0xab, 0xff }));
  EXPECT_TRUE(fromHex("", bytes));
  EXPECT_TRUE(bytes.empty());

  EXPECT_FALSE(fromHex("abc", bytes));
  EXPECT_FALSE(fromHex("zz", bytes));
}

TEST(HashingTest, sha256) {
  EXPECT_EQ(computeSHA256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// The test cases of RFC 4231.
TEST(HashingTest, hmacSHA256) {
  std::vector<uint8_t> key1(20, 0x0b);
  EXPECT_EQ(toHex(computeHMACSHA256(key1, "Hi There")),
            "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");

  std::vector<uint8_t> key2 = { 'J', 'e', 'f', 'e' };
  EXPECT_EQ(toHex(computeHMACSHA256(key2, "what do ya want for nothing?")),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

  // Keys longer than a block are hashed first.
  std::vector<uint8_t> key6(131, 0xaa);
  EXPECT_EQ(toHex(computeHMACSHA256(
                key6, "Test Using Larger Than Block-Size Key - Hash Key First")),
            "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54");
}

TEST(HashingTest, constantTimeEquals) {
  EXPECT_TRUE(constantTimeEquals("", ""));
  EXPECT_TRUE(constantTimeEquals("abc", "abc"));
  EXPECT_FALSE(constantTimeEquals("abc", "abd"));
  EXPECT_FALSE(constantTimeEquals("abc", "ab"));
}

TEST(HashingTest, fileChecksum) {
  EXPECT_EQ(FileChecksum::getChecksumForData("").asHex(),
            "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(FileChecksum::getChecksumForData("hello").asHex(),
            "5d41402abc4b2a76b9719d911017c592");
}

}
