//===-- Action.cpp --------------------------------------------------------===//
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

#include "memobuild/Core/Action.h"

#include "llvm/ADT/SmallPtrSet.h"

#include <exception>

using namespace memobuild;
using namespace memobuild::core;

llvm::Error Action::invoke(const ActionContext& context) const {
  try {
    return body(context);
  } catch (const std::exception& e) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "uncaught exception: %s", e.what());
  } catch (...) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "uncaught exception of an unknown type");
  }
}

void ActionRegistry::registerAction(StringRef name, ActionFn body) {
  actions[name] = std::move(body);
}

llvm::Optional<Action> ActionRegistry::lookup(StringRef name) const {
  auto it = actions.find(name);
  if (it == actions.end())
    return llvm::None;
  return Action(name, it->second, /*registered=*/true);
}

namespace {

class ArgumentResolver {
  llvm::SmallPtrSet<const void*, 16> active;

public:
  llvm::Expected<Value> resolve(const Value& value) {
    if (value.isAtom() && value.isOpaqueAtom())
      return value;
    if (!value.isAtom() && !value.isContainer())
      return value;

    const void* identity = value.getStorageIdentity();
    if (!active.insert(identity).second) {
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "action arguments contain a reference cycle");
    }
    auto result = resolveContents(value);
    active.erase(identity);
    return result;
  }

private:
  llvm::Expected<Value> resolveContents(const Value& value) {
    if (value.isAtom())
      return resolve(value.getAtomReal());

    if (value.isDict()) {
      Value::EntryList entries;
      for (const auto& entry: value.getEntries()) {
        auto key = resolve(entry.first);
        if (!key)
          return key.takeError();
        auto item = resolve(entry.second);
        if (!item)
          return item.takeError();
        entries.emplace_back(std::move(*key), std::move(*item));
      }
      return Value::makeDict(std::move(entries));
    }

    Value::ElementList elements;
    for (const auto& element: value.getElements()) {
      auto item = resolve(element);
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

Value makeFileList(ArrayRef<FileRef> files) {
  Value::ElementList elements;
  for (const auto& file: files)
    elements.push_back(Value::makeFile(file));
  return Value::makeList(std::move(elements));
}

bool getFileList(const Value& value, std::vector<FileRef>& files_out) {
  if (!value.isList())
    return false;
  for (const auto& element: value.getElements()) {
    if (!element.isFile())
      return false;
    files_out.push_back(element.getFile());
  }
  return true;
}

}

llvm::Expected<Value> core::resolveActionArguments(const Value& value) {
  ArgumentResolver resolver;
  return resolver.resolve(value);
}

llvm::Expected<std::string>
core::encodeActionPayload(StringRef name, const ActionContext& context) {
  return encodeValue(Value::makeTuple({
        Value::makeString(name),
        context.getArgs(),
        context.getKeywordArgs(),
        makeFileList(context.getOutputs()),
        makeFileList(context.getInputs()) }));
}

llvm::Expected<ActionContext>
core::decodeActionPayload(StringRef payload, std::string& name_out) {
  auto decoded = decodeValue(payload);
  if (!decoded)
    return decoded.takeError();

  auto malformed = []() {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "malformed action payload");
  };

  if (!decoded->isTuple() || decoded->getElements().size() != 5)
    return malformed();
  const auto& fields = decoded->getElements();
  if (!fields[0].isString() || !fields[1].isTuple() || !fields[2].isDict())
    return malformed();

  std::vector<FileRef> outputs, inputs;
  if (!getFileList(fields[3], outputs) || !getFileList(fields[4], inputs))
    return malformed();

  name_out = fields[0].getString().str();
  return ActionContext(fields[1], fields[2], std::move(outputs),
                       std::move(inputs));
}
