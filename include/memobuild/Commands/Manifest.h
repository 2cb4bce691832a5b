//===- Manifest.h -----------------------------------------------*- C++ -*-===//
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
// This file defines the JSON rule manifest read by the memobuild tool:
//
//   {
//     "rules": [
//       { "name": "hello", "outputs": ["out/hello.txt"], "action": "write",
//         "args": [{"output": 0}, "Hello"], "kwargs": {} }
//     ],
//     "groups": { "all": ["hello"] }
//   }
//
// Arguments map JSON values to rule argument values; objects with a single
// tag key denote the other kinds: {"file": p}, {"vfile": p}, {"path": p},
// {"bytes": hex}, {"tuple": [...]}, {"set": [...]} and {"output": i}, the i-th
// output of the rule. Outputs are paths, or {"vfile": p} for value files.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_COMMANDS_MANIFEST_H
#define MEMOBUILD_COMMANDS_MANIFEST_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Memo.h"
#include "memobuild/Core/RuleStore.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace memobuild {
namespace commands {

/// A loaded rule manifest.
class Manifest {
  core::RuleStore store;

  /// The rules, by name.
  llvm::StringMap<core::RuleID> rules;

  /// The groups, by name.
  llvm::StringMap<std::unique_ptr<core::RuleGroup>> groups;

  Manifest(const Manifest&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const Manifest&) MEMOBUILD_DELETED_FUNCTION;

  friend class ManifestLoader;

public:
  explicit Manifest(core::MemoFactory memoFactory);
  ~Manifest();

  core::RuleStore& getStore() { return store; }
  const core::RuleStore& getStore() const { return store; }

  /// Find a rule by name.
  llvm::Optional<core::RuleID> lookupRule(StringRef name) const;

  /// Find a group by name.
  const core::RuleGroup* lookupGroup(StringRef name) const;

  /// Resolve the targets named on a command line.
  ///
  /// Each name is a group, a rule, or an output path. With no names, every
  /// rule is a target.
  llvm::Expected<std::vector<core::RuleID>>
  resolveTargets(ArrayRef<std::string> names) const;
};

/// Load a manifest from \arg contents.
///
/// The builtin actions are registered in the manifest's store before its rules
/// are read.
///
/// \param filename The name of the manifest, for diagnostics.
llvm::Expected<std::unique_ptr<Manifest>>
loadManifest(StringRef contents, StringRef filename,
             core::MemoFactory memoFactory);

/// Load the manifest at \arg path.
llvm::Expected<std::unique_ptr<Manifest>>
loadManifestFile(StringRef path, core::MemoFactory memoFactory);

}
}

#endif
