//===- Memo.h ---------------------------------------------------*- C++ -*-===//
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
// This file defines the memoization records which let the make engine notice
// changes to a rule's arguments and value files that timestamps cannot show.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_CORE_MEMO_H
#define MEMOBUILD_CORE_MEMO_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Value.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace memobuild {
namespace basic {
class FileSystem;
}

namespace core {

class ContentHashCache;

/// The encodings available for memoization records.
enum class MemoKind {
  /// The argument tree is rendered as a canonical string, which is hashed if
  /// it is long.
  StringHash,

  /// The argument tree is binary encoded and protected with an HMAC-SHA-256
  /// under a caller supplied key.
  Authenticated,
};

/// Error for a saved authenticated memoization record which fails verification.
///
/// The record was either modified or written with a different key. Neither is
/// treated as a plain out-of-date record.
class MemoAuthenticationError
    : public llvm::ErrorInfo<MemoAuthenticationError> {
  std::string path;

public:
  static char ID;

  MemoAuthenticationError(StringRef path) : path(path.str()) {}

  StringRef getPath() const { return path; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }
};

/// Error for a saved memoization record written with a different encoding.
class MemoTypeMismatchError : public llvm::ErrorInfo<MemoTypeMismatchError> {
  std::string path;
  std::string expectedType;
  std::string foundType;

public:
  static char ID;

  MemoTypeMismatchError(StringRef path, StringRef expectedType,
                        StringRef foundType)
      : path(path.str()), expectedType(expectedType.str()),
        foundType(foundType.str()) {}

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }
};

/// A value file reachable from a rule's arguments.
///
/// The digest of a value file is only computed when a comparison gets as far
/// as needing it.
struct LazyMemoFile {
  /// The position of the file in the argument tree, e.g. "$[0][2]".
  std::string key;

  /// The path of the file.
  std::string path;
};

/// The memoization record of a rule, computed from its arguments when the rule
/// is registered.
class Memo {
  Memo(const Memo&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const Memo&) MEMOBUILD_DELETED_FUNCTION;

protected:
  std::vector<LazyMemoFile> lazyFiles;

  explicit Memo(std::vector<LazyMemoFile> lazyFiles)
      : lazyFiles(std::move(lazyFiles)) {}

public:
  virtual ~Memo();

  virtual MemoKind getKind() const = 0;

  /// Get the value files the record covers.
  ArrayRef<LazyMemoFile> getLazyFiles() const { return lazyFiles; }

  /// Compare the record against the one saved at \arg path.
  ///
  /// The argument part is compared first; value file digests are computed
  /// (through \arg cache) only if it matches.
  ///
  /// \returns True if the saved record matches, false if it is absent,
  /// unreadable, or different, or if a value file cannot be hashed. An error
  /// is returned only for a record of the wrong encoding or, for authenticated
  /// records, one which fails verification.
  virtual llvm::Expected<bool>
  compareToSaved(basic::FileSystem& fs, ContentHashCache& cache,
                 const std::string& path) const = 0;

  /// Save the record, with the current value file digests, to \arg path.
  ///
  /// Missing parent directories are created.
  virtual llvm::Error save(basic::FileSystem& fs, ContentHashCache& cache,
                           const std::string& path) const = 0;

  /// Get the type name recorded in saved records of the given encoding.
  static StringRef getTypeName(MemoKind kind);
};

/// Compute the memoization view of an argument tree.
///
/// Files are replaced by None, with value files additionally appended to \arg
/// lazyFiles keyed by their position; atoms are replaced by (the memoization
/// view of) their memo value.
///
/// \returns The view, or an error if \arg args contains a reference cycle.
llvm::Expected<Value> getMemoValue(const Value& args,
                                   std::vector<LazyMemoFile>& lazyFiles);

/// Render a memoization view as a canonical string.
///
/// Equal trees render identically, dictionary keys and set elements are in
/// canonical order, and every scalar is tagged with its type.
std::string getCanonicalString(const Value& memoValue);

/// Creates the memoization records of the rules of one store.
class MemoFactory {
  MemoKind kind = MemoKind::StringHash;
  std::vector<uint8_t> key;

  MemoFactory(MemoKind kind, std::vector<uint8_t> key)
      : kind(kind), key(std::move(key)) {}

public:
  /// Create a factory for string-hash records.
  MemoFactory() {}

  /// Create a factory for the given encoding.
  ///
  /// \returns An error if \arg kind is \see MemoKind::Authenticated and
  /// \arg key is empty.
  static llvm::Expected<MemoFactory> create(MemoKind kind,
                                            ArrayRef<uint8_t> key = None);

  /// Create a factory, with the key given as a hexadecimal string.
  static llvm::Expected<MemoFactory> createWithHexKey(MemoKind kind,
                                                      StringRef hexKey);

  MemoKind getKind() const { return kind; }

  /// Create the record for the given argument tree.
  ///
  /// \returns An error if the tree is cyclic or, for authenticated records, if
  /// it does not survive an encoding round trip unchanged.
  llvm::Expected<std::unique_ptr<Memo>> createMemo(const Value& args) const;
};

}
}

#endif
