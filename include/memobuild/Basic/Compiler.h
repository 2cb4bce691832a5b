//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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
//
// Compiler support and compatibility macros.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_BASIC_COMPILER_H
#define MEMOBUILD_BASIC_COMPILER_H

/// MEMOBUILD_DELETED_FUNCTION - Expands to = delete. Use to mark functions as
/// uncallable. Member functions with this should be declared private.
///
/// class DontCopy {
/// private:
///   DontCopy(const DontCopy&) MEMOBUILD_DELETED_FUNCTION;
///   DontCopy &operator =(const DontCopy&) MEMOBUILD_DELETED_FUNCTION;
/// public:
///   ...
/// };
#define MEMOBUILD_DELETED_FUNCTION = delete

/// MEMOBUILD_UNUSED - Mark a variable or function as possibly unused.
#if defined(__GNUC__) || defined(__clang__)
#define MEMOBUILD_UNUSED __attribute__((unused))
#else
#define MEMOBUILD_UNUSED
#endif

#endif
