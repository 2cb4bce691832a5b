//===- LLVM.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_BASIC_LLVM_H
#define MEMOBUILD_BASIC_LLVM_H

// This header makes the LLVM support types memobuild uses throughout its
// interfaces available unqualified in the memobuild namespace.

// llvm::None is an enumerator, it cannot be forward declared.
#include "llvm/ADT/None.h"

namespace llvm {
  class StringRef;
  class Twine;
  template <typename T, unsigned N> class SmallVector;
  template <unsigned N> class SmallString;
  template <typename T> class ArrayRef;
  template <typename T> class Optional;
  class raw_ostream;
}

namespace memobuild {
  using llvm::ArrayRef;
  using llvm::None;
  using llvm::Optional;
  using llvm::SmallString;
  using llvm::SmallVector;
  using llvm::StringRef;
  using llvm::Twine;
  using llvm::raw_ostream;
}

#endif
