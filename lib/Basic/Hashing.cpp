//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "memobuild/Basic/Hashing.h"

#include "llvm/Support/SHA256.h"

using namespace memobuild;
using namespace memobuild::basic;

namespace {

/// The block size of SHA-256, in bytes.
const size_t SHA256BlockSize = 64;

int hexDigitValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}

std::string basic::toHex(ArrayRef<uint8_t> data) {
  static const char digits[] = "0123456789abcdef";
  std::string result;
  result.reserve(data.size() * 2);
  for (uint8_t byte: data) {
    result.push_back(digits[byte >> 4]);
    result.push_back(digits[byte & 0xF]);
  }
  return result;
}

std::string basic::toHex(StringRef data) {
  return toHex(ArrayRef<uint8_t>(
                   reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

bool basic::fromHex(StringRef hex, std::vector<uint8_t>& result) {
  if (hex.size() % 2 != 0)
    return false;

  result.clear();
  result.reserve(hex.size() / 2);
  for (size_t i = 0, e = hex.size(); i != e; i += 2) {
    int hi = hexDigitValue(hex[i]);
    int lo = hexDigitValue(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    result.push_back(uint8_t((hi << 4) | lo));
  }
  return true;
}

SHA256Digest basic::computeSHA256(StringRef data) {
  return llvm::SHA256::hash(ArrayRef<uint8_t>(
                   reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::string basic::computeSHA256Hex(StringRef data) {
  return toHex(computeSHA256(data));
}

SHA256Digest basic::computeHMACSHA256(ArrayRef<uint8_t> key,
                                      StringRef message) {
  // Keys longer than the block size are hashed first; shorter keys are zero
  // padded.
  uint8_t block[SHA256BlockSize] = {0};
  if (key.size() > SHA256BlockSize) {
    SHA256Digest keyDigest = llvm::SHA256::hash(key);
    std::copy(keyDigest.begin(), keyDigest.end(), block);
  } else {
    std::copy(key.begin(), key.end(), block);
  }

  uint8_t innerPad[SHA256BlockSize];
  uint8_t outerPad[SHA256BlockSize];
  for (size_t i = 0; i != SHA256BlockSize; ++i) {
    innerPad[i] = block[i] ^ 0x36;
    outerPad[i] = block[i] ^ 0x5c;
  }

  llvm::SHA256 inner;
  inner.update(ArrayRef<uint8_t>(innerPad, SHA256BlockSize));
  inner.update(message);
  std::string innerDigest = inner.final().str();

  llvm::SHA256 outer;
  outer.update(ArrayRef<uint8_t>(outerPad, SHA256BlockSize));
  outer.update(innerDigest);
  StringRef outerDigest = outer.final();

  SHA256Digest result;
  std::copy(outerDigest.begin(), outerDigest.end(), result.begin());
  return result;
}

bool basic::constantTimeEquals(StringRef lhs, StringRef rhs) {
  if (lhs.size() != rhs.size())
    return false;

  uint8_t difference = 0;
  for (size_t i = 0, e = lhs.size(); i != e; ++i)
    difference |= uint8_t(lhs[i]) ^ uint8_t(rhs[i]);
  return difference == 0;
}
