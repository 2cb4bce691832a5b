//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_BASIC_HASHING_H
#define MEMOBUILD_BASIC_HASHING_H

#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace memobuild {
namespace basic {

typedef std::array<uint8_t, 32> SHA256Digest;

/// Encode \arg data as lowercase hexadecimal.
std::string toHex(ArrayRef<uint8_t> data);

/// Encode \arg data as lowercase hexadecimal.
std::string toHex(StringRef data);

/// Decode a hexadecimal string (of either case).
///
/// \returns True on success, false if \arg hex has an odd length or contains
/// a non-hexadecimal character.
bool fromHex(StringRef hex, std::vector<uint8_t>& result);

/// Compute the SHA-256 digest of \arg data.
SHA256Digest computeSHA256(StringRef data);

/// Compute the SHA-256 digest of \arg data as lowercase hexadecimal.
std::string computeSHA256Hex(StringRef data);

/// Compute the HMAC-SHA-256 (RFC 2104) of \arg message with the given key.
SHA256Digest computeHMACSHA256(ArrayRef<uint8_t> key, StringRef message);

/// Compare two byte strings without short-circuiting on the first difference.
bool constantTimeEquals(StringRef lhs, StringRef rhs);

}
}

#endif
