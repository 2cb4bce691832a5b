//===-- RuleStore.cpp -----------------------------------------------------===//
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

#include "memobuild/Core/RuleStore.h"

#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>

using namespace memobuild;
using namespace memobuild::core;

namespace {

/// Rewrites the file references of an argument tree with normalized paths.
class FileNormalizer {
  llvm::SmallPtrSet<const void*, 16> active;

public:
  llvm::Expected<Value> normalize(const Value& value) {
    if (value.isFile()) {
      auto file = value.getFile();
      return Value::makeFile(RuleStore::normalizePath(file.path), file.kind);
    }
    if (value.isAtom() && value.isOpaqueAtom())
      return value;
    if (!value.isAtom() && !value.isContainer())
      return value;

    const void* identity = value.getStorageIdentity();
    if (!active.insert(identity).second) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "arguments contain a reference cycle");
    }
    auto result = normalizeContents(value);
    active.erase(identity);
    return result;
  }

private:
  llvm::Expected<Value> normalizeContents(const Value& value) {
    if (value.isAtom()) {
      auto real = normalize(value.getAtomReal());
      if (!real)
        return real.takeError();
      auto memo = normalize(value.getAtomMemo());
      if (!memo)
        return memo.takeError();
      return Value::makeAtom(std::move(*real), std::move(*memo));
    }

    if (value.isDict()) {
      Value::EntryList entries;
      for (const auto& entry: value.getEntries()) {
        auto key = normalize(entry.first);
        if (!key)
          return key.takeError();
        auto item = normalize(entry.second);
        if (!item)
          return item.takeError();
        entries.emplace_back(std::move(*key), std::move(*item));
      }
      return Value::makeDict(std::move(entries));
    }

    Value::ElementList elements;
    for (const auto& element: value.getElements()) {
      auto item = normalize(element);
      if (!item)
        return item.takeError();
      elements.push_back(std::move(*item));
    }
    switch (value.getKind()) {
    case Value::Kind::List:
      return Value::makeList(std::move(elements));
    case Value::Kind::Tuple:
      return Value::makeTuple(std::move(elements));
    default:
      return Value::makeSet(std::move(elements));
    }
  }
};

/// Collect the file references of an (acyclic) argument tree, outside atoms
/// and dictionary keys.
void collectFiles(const Value& value, std::vector<FileRef>& files_out) {
  if (value.isFile()) {
    files_out.push_back(value.getFile());
  } else if (value.isDict()) {
    for (const auto& entry: value.getEntries())
      collectFiles(entry.second, files_out);
  } else if (value.isSequence()) {
    for (const auto& element: value.getElements())
      collectFiles(element, files_out);
  }
}

StringRef getFileKindName(FileKind kind) {
  return kind == FileKind::Value ? "value file" : "plain file";
}

}

RuleStore::RuleStore(MemoFactory memoFactory)
    : memoFactory(std::move(memoFactory)) {}

RuleStore::~RuleStore() {}

std::string RuleStore::normalizePath(StringRef path) {
  llvm::SmallString<256> result(path);
  // Leave the path relative if the working directory is unavailable.
  if (!llvm::sys::fs::make_absolute(result))
    llvm::sys::path::remove_dots(result, /*remove_dot_dot=*/true);
  return result.str().str();
}

llvm::Optional<RuleID> RuleStore::getProducer(StringRef path) const {
  auto it = producers.find(path);
  if (it == producers.end())
    return llvm::None;
  return it->second;
}

ArrayRef<RuleID> RuleStore::getDependencies(RuleID id) const {
  return rules[id]->getDependencies();
}

StringRef RuleStore::getRuleName(RuleID id) const {
  return rules[id]->getName();
}

llvm::Expected<RuleID> RuleStore::addRule(RuleDescription description) {
  RuleID id = rules.size();
  std::string name = description.name;
  if (description.outputs.empty()) {
    return llvm::make_error<GraphError>(
        "rule '" + name + "' has no outputs");
  }
  if (name.empty())
    name = normalizePath(description.outputs.front().path);

  if (!description.action.isValid()) {
    return llvm::make_error<GraphError>("rule '" + name + "' has no action");
  }
  if (!description.args.isTuple() || !description.kwargs.isDict()) {
    return llvm::make_error<GraphError>(
        "rule '" + name + "' must bind a tuple of positional arguments and "
        "a dictionary of keyword arguments");
  }
  for (const auto& entry: description.kwargs.getEntries()) {
    if (!entry.first.isString()) {
      return llvm::make_error<GraphError>(
          "rule '" + name + "' has a keyword argument with a non-string key");
    }
  }

  // Every path this rule uses, with the kind it is used with.
  llvm::StringMap<FileKind> ruleKinds;
  auto checkKind = [&](const FileRef& file) -> llvm::Error {
    FileKind expected = file.kind;
    auto it = fileKinds.find(file.path);
    if (it != fileKinds.end())
      expected = it->second;
    auto ruleIt = ruleKinds.find(file.path);
    if (ruleIt != ruleKinds.end())
      expected = ruleIt->second;
    if (expected != file.kind) {
      return llvm::make_error<GraphError>(
          "rule '" + name + "' uses '" + file.path + "' as a " +
          getFileKindName(file.kind).str() +
          ", but it is used elsewhere as a " + getFileKindName(expected).str());
    }
    ruleKinds[file.path] = file.kind;
    return llvm::Error::success();
  };

  // Check the outputs.
  std::vector<FileRef> outputs;
  llvm::StringSet<> outputPaths;
  for (const auto& output: description.outputs) {
    FileRef file{ normalizePath(output.path), output.kind };
    if (!outputPaths.insert(file.path).second) {
      return llvm::make_error<GraphError>(
          "rule '" + name + "' declares output '" + file.path + "' twice");
    }
    auto producer = producers.find(file.path);
    if (producer != producers.end()) {
      return llvm::make_error<GraphError>(
          "output '" + file.path + "' of rule '" + name +
          "' is already produced by rule '" +
          rules[producer->second]->getName() + "'");
    }
    auto consumer = originalConsumers.find(file.path);
    if (consumer != originalConsumers.end()) {
      return llvm::make_error<GraphError>(
          "output '" + file.path + "' of rule '" + name +
          "' is already an original input of rule '" +
          rules[consumer->second]->getName() + "'");
    }
    if (auto error = checkKind(file))
      return std::move(error);
    outputs.push_back(std::move(file));
  }

  // Normalize the arguments.
  FileNormalizer normalizer;
  auto args = normalizer.normalize(description.args);
  if (!args) {
    return llvm::make_error<GraphError>(
        "rule '" + name + "': " + llvm::toString(args.takeError()));
  }
  auto kwargs = normalizer.normalize(description.kwargs);
  if (!kwargs) {
    return llvm::make_error<GraphError>(
        "rule '" + name + "': " + llvm::toString(kwargs.takeError()));
  }

  // Find the inputs.
  std::vector<FileRef> files;
  collectFiles(*args, files);
  collectFiles(*kwargs, files);

  std::vector<RuleInput> inputs;
  std::vector<RuleID> dependencies;
  llvm::StringSet<> inputPaths;
  for (const auto& file: files) {
    if (auto error = checkKind(file))
      return std::move(error);
    if (outputPaths.count(file.path) || !inputPaths.insert(file.path).second)
      continue;

    RuleInput input;
    input.file = file;
    auto producer = producers.find(file.path);
    input.isOriginal = producer == producers.end();
    if (!input.isOriginal)
      dependencies.push_back(producer->second);
    inputs.push_back(std::move(input));
  }
  std::sort(dependencies.begin(), dependencies.end());
  dependencies.erase(std::unique(dependencies.begin(), dependencies.end()),
                     dependencies.end());

  auto memo = memoFactory.createMemo(Value::makeTuple({ *args, *kwargs }));
  if (!memo) {
    return llvm::make_error<GraphError>(
        "unable to memoize the arguments of rule '" + name + "': " +
        llvm::toString(memo.takeError()));
  }

  auto resolvedArgs = resolveActionArguments(*args);
  if (!resolvedArgs)
    return resolvedArgs.takeError();
  auto resolvedKwargs = resolveActionArguments(*kwargs);
  if (!resolvedKwargs)
    return resolvedKwargs.takeError();

  // Commit the rule.
  for (const auto& output: outputs)
    producers[output.path] = id;
  for (const auto& input: inputs) {
    if (input.isOriginal)
      originalConsumers.try_emplace(input.file.path, id);
  }
  for (const auto& entry: ruleKinds)
    fileKinds[entry.getKey()] = entry.getValue();

  rules.emplace_back(new Rule(id, std::move(name), std::move(outputs),
                              std::move(inputs), std::move(dependencies),
                              std::move(description.action),
                              std::move(*resolvedArgs),
                              std::move(*resolvedKwargs), std::move(*memo)));
  return id;
}

// MARK: Selections

RuleSelection::~RuleSelection() {}

llvm::Error RuleGroup::addRule(RuleID id) {
  if (id >= store.size()) {
    return llvm::make_error<GraphError>(
        "invalid rule id " + Twine(id) + " in group '" + name + "'");
  }
  ids.push_back(id);
  return llvm::Error::success();
}

llvm::Error RuleGroup::addSelection(const RuleSelection& selection) {
  if (&selection.getStore() != &store) {
    return llvm::make_error<GraphError>(
        "group '" + name + "' cannot contain rules of another rule store");
  }
  for (RuleID id: selection.getRuleIDs())
    ids.push_back(id);
  return llvm::Error::success();
}

llvm::Expected<std::vector<RuleID>>
core::collectTargets(ArrayRef<const RuleSelection*> selections,
                     const RuleStore** store_out) {
  const RuleStore* store = nullptr;
  std::vector<RuleID> result;
  llvm::DenseSet<RuleID> seen;

  for (const auto* selection: selections) {
    if (!store) {
      store = &selection->getStore();
    } else if (store != &selection->getStore()) {
      return llvm::make_error<GraphError>(
          "the selected rules belong to more than one rule store");
    }
    for (RuleID id: selection->getRuleIDs()) {
      if (seen.insert(id).second)
        result.push_back(id);
    }
  }

  if (store_out)
    *store_out = store;
  return std::move(result);
}
