//===-- Manifest.cpp ------------------------------------------------------===//
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

#include "memobuild/Commands/Manifest.h"

#include "memobuild/Basic/Hashing.h"
#include "memobuild/Commands/BuiltinActions.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

using namespace memobuild;
using namespace memobuild::commands;
using namespace memobuild::core;

namespace json = llvm::json;

#pragma mark - Manifest implementation

namespace memobuild {
namespace commands {

class ManifestLoader {
  Manifest& manifest;
  std::string filename;

  llvm::Error makeError(const Twine& context, const Twine& message) {
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        (Twine(filename) + ": " + context + ": " + message).str().c_str());
  }

  llvm::Expected<Value> convertArgument(const json::Value& value,
                                        ArrayRef<FileRef> outputs,
                                        const std::string& context) {
    switch (value.kind()) {
    case json::Value::Null:
      return Value::makeNone();
    case json::Value::Boolean:
      return Value::makeBool(*value.getAsBoolean());
    case json::Value::Number:
      if (auto integer = value.getAsInteger())
        return Value::makeInt(*integer);
      return Value::makeFloat(*value.getAsNumber());
    case json::Value::String:
      return Value::makeString(*value.getAsString());
    case json::Value::Array: {
      auto elements = convertArray(*value.getAsArray(), outputs, context);
      if (!elements)
        return elements.takeError();
      return Value::makeList(std::move(*elements));
    }
    case json::Value::Object:
      return convertObject(*value.getAsObject(), outputs, context);
    }
    llvm_unreachable("unexpected JSON kind");
  }

  llvm::Expected<Value::ElementList> convertArray(const json::Array& array,
                                                  ArrayRef<FileRef> outputs,
                                                  const std::string& context) {
    Value::ElementList elements;
    for (unsigned i = 0, e = array.size(); i != e; ++i) {
      auto element = convertArgument(array[i], outputs,
                                     context + "[" + std::to_string(i) + "]");
      if (!element)
        return element.takeError();
      elements.push_back(std::move(*element));
    }
    return std::move(elements);
  }

  llvm::Expected<Value> convertObject(const json::Object& object,
                                      ArrayRef<FileRef> outputs,
                                      const std::string& context) {
    if (object.size() == 1) {
      const auto& entry = *object.begin();
      StringRef tag = entry.first;
      const json::Value& value = entry.second;
      std::string tagContext = context + "." + tag.str();

      if (tag == "file" || tag == "vfile" || tag == "path") {
        auto path = value.getAsString();
        if (!path)
          return makeError(tagContext, "expected a string");
        if (tag == "path")
          return Value::makePath(*path);
        return Value::makeFile(*path, tag == "vfile" ? FileKind::Value :
                               FileKind::Plain);
      }
      if (tag == "bytes") {
        auto hex = value.getAsString();
        std::vector<uint8_t> bytes;
        if (!hex || !basic::fromHex(*hex, bytes))
          return makeError(tagContext, "expected a hexadecimal string");
        return Value::makeBytes(
            StringRef(reinterpret_cast<const char*>(bytes.data()),
                      bytes.size()));
      }
      if (tag == "tuple" || tag == "set") {
        auto array = value.getAsArray();
        if (!array)
          return makeError(tagContext, "expected an array");
        auto elements = convertArray(*array, outputs, tagContext);
        if (!elements)
          return elements.takeError();
        if (tag == "tuple")
          return Value::makeTuple(std::move(*elements));
        return Value::makeSet(std::move(*elements));
      }
      if (tag == "output") {
        auto index = value.getAsInteger();
        if (!index || *index < 0 || *index >= (int64_t)outputs.size())
          return makeError(tagContext, "expected the index of an output");
        return Value::makeFile(outputs[*index]);
      }
    }

    Value::EntryList entries;
    for (const auto& entry: object) {
      StringRef key = entry.first;
      auto item = convertArgument(entry.second, outputs,
                                  context + "." + key.str());
      if (!item)
        return item.takeError();
      entries.emplace_back(Value::makeString(key), std::move(*item));
    }
    return Value::makeDict(std::move(entries));
  }

  llvm::Error loadRule(const json::Value& value, unsigned index) {
    std::string context = "rules[" + std::to_string(index) + "]";
    const json::Object* object = value.getAsObject();
    if (!object)
      return makeError(context, "expected an object");

    for (const auto& entry: *object) {
      StringRef key = entry.first;
      if (key != "name" && key != "outputs" && key != "action" &&
          key != "args" && key != "kwargs")
        return makeError(context, "unexpected key '" + key + "'");
    }

    RuleDescription description;
    if (const json::Value* name = object->get("name")) {
      auto string = name->getAsString();
      if (!string)
        return makeError(context + ".name", "expected a string");
      description.name = string->str();
    }

    // Outputs.
    const json::Array* outputs = object->getArray("outputs");
    if (!outputs)
      return makeError(context + ".outputs", "expected an array");
    for (unsigned i = 0, e = outputs->size(); i != e; ++i) {
      const json::Value& output = (*outputs)[i];
      std::string outputContext =
        context + ".outputs[" + std::to_string(i) + "]";
      if (auto path = output.getAsString()) {
        description.outputs.push_back(FileRef{ path->str(), FileKind::Plain });
        continue;
      }
      const json::Object* tagged = output.getAsObject();
      llvm::Optional<StringRef> path;
      if (tagged && tagged->size() == 1)
        path = tagged->getString("vfile");
      if (!path)
        return makeError(outputContext,
                         "expected a path or a {\"vfile\": path}");
      description.outputs.push_back(FileRef{ path->str(), FileKind::Value });
    }

    // Action.
    auto actionName = object->getString("action");
    if (!actionName)
      return makeError(context + ".action", "expected a string");
    auto action = manifest.store.getActionRegistry().lookup(*actionName);
    if (!action)
      return makeError(context + ".action",
                       "unknown action '" + *actionName + "'");
    description.action = std::move(*action);

    // Arguments.
    if (const json::Value* args = object->get("args")) {
      const json::Array* array = args->getAsArray();
      if (!array)
        return makeError(context + ".args", "expected an array");
      auto elements = convertArray(*array, description.outputs,
                                   context + ".args");
      if (!elements)
        return elements.takeError();
      description.args = Value::makeTuple(std::move(*elements));
    }
    if (const json::Value* kwargs = object->get("kwargs")) {
      const json::Object* kwargsObject = kwargs->getAsObject();
      if (!kwargsObject)
        return makeError(context + ".kwargs", "expected an object");
      Value::EntryList entries;
      for (const auto& entry: *kwargsObject) {
        StringRef key = entry.first;
        auto item = convertArgument(entry.second, description.outputs,
                                    context + ".kwargs." + key.str());
        if (!item)
          return item.takeError();
        entries.emplace_back(Value::makeString(key), std::move(*item));
      }
      description.kwargs = Value::makeDict(std::move(entries));
    }

    std::string name = description.name;
    if (!name.empty() && manifest.rules.count(name))
      return makeError(context, "duplicate rule name '" + name + "'");

    auto id = manifest.store.addRule(std::move(description));
    if (!id)
      return makeError(context, llvm::toString(id.takeError()));
    manifest.rules[manifest.store.getRule(*id).getName()] = *id;
    return llvm::Error::success();
  }

  llvm::Error loadGroup(StringRef name, const json::Object& groups,
                        llvm::StringSet<>& visiting) {
    if (manifest.groups.count(name))
      return llvm::Error::success();

    std::string context = "groups." + name.str();
    if (manifest.rules.count(name))
      return makeError(context, "a rule is already named '" + name + "'");
    if (!visiting.insert(name).second)
      return makeError(context, "group contains itself");

    const json::Array* members = groups.getArray(name);
    if (!members)
      return makeError(context, "expected an array");

    std::unique_ptr<RuleGroup> group(new RuleGroup(manifest.store, name));
    for (unsigned i = 0, e = members->size(); i != e; ++i) {
      std::string memberContext = context + "[" + std::to_string(i) + "]";
      auto member = (*members)[i].getAsString();
      if (!member)
        return makeError(memberContext, "expected a string");

      if (groups.get(*member)) {
        if (auto error = loadGroup(*member, groups, visiting))
          return error;
        if (auto error = group->addSelection(*manifest.groups[*member]))
          return error;
        continue;
      }

      auto rule = manifest.lookupRule(*member);
      if (!rule)
        return makeError(memberContext,
                         "unknown rule or group '" + *member + "'");
      if (auto error = group->addRule(*rule))
        return error;
    }

    visiting.erase(name);
    manifest.groups[name] = std::move(group);
    return llvm::Error::success();
  }

public:
  ManifestLoader(Manifest& manifest, StringRef filename)
      : manifest(manifest), filename(filename.str()) {}

  llvm::Error load(StringRef contents) {
    auto root = json::parse(contents);
    if (!root)
      return makeError("<root>", llvm::toString(root.takeError()));

    const json::Object* object = root->getAsObject();
    if (!object)
      return makeError("<root>", "expected an object");
    for (const auto& entry: *object) {
      StringRef key = entry.first;
      if (key != "rules" && key != "groups")
        return makeError("<root>", "unexpected key '" + key + "'");
    }

    if (const json::Value* rules = object->get("rules")) {
      const json::Array* array = rules->getAsArray();
      if (!array)
        return makeError("rules", "expected an array");
      for (unsigned i = 0, e = array->size(); i != e; ++i) {
        if (auto error = loadRule((*array)[i], i))
          return error;
      }
    }

    if (const json::Value* groups = object->get("groups")) {
      const json::Object* groupsObject = groups->getAsObject();
      if (!groupsObject)
        return makeError("groups", "expected an object");
      llvm::StringSet<> visiting;
      for (const auto& entry: *groupsObject) {
        if (auto error = loadGroup(entry.first, *groupsObject, visiting))
          return error;
      }
    }

    return llvm::Error::success();
  }
};

}
}

Manifest::Manifest(MemoFactory memoFactory) : store(std::move(memoFactory)) {
  registerBuiltinActions(store.getActionRegistry());
}

Manifest::~Manifest() {}

llvm::Optional<RuleID> Manifest::lookupRule(StringRef name) const {
  auto it = rules.find(name);
  if (it == rules.end())
    return llvm::None;
  return it->second;
}

const RuleGroup* Manifest::lookupGroup(StringRef name) const {
  auto it = groups.find(name);
  if (it == groups.end())
    return nullptr;
  return it->second.get();
}

llvm::Expected<std::vector<RuleID>>
Manifest::resolveTargets(ArrayRef<std::string> names) const {
  // The selections of targets named by a rule or output.
  std::vector<std::unique_ptr<RuleGroup>> ruleSelections;
  std::vector<const RuleSelection*> selections;

  if (names.empty()) {
    ruleSelections.emplace_back(new RuleGroup(store, "<all>"));
    for (RuleID id = 0, e = store.size(); id != e; ++id) {
      if (auto error = ruleSelections.back()->addRule(id))
        return std::move(error);
    }
    selections.push_back(ruleSelections.back().get());
  }

  for (const auto& name: names) {
    if (const RuleGroup* group = lookupGroup(name)) {
      selections.push_back(group);
      continue;
    }

    auto rule = lookupRule(name);
    if (!rule)
      rule = store.getProducer(RuleStore::normalizePath(name));
    if (!rule) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "unknown target '%s'", name.c_str());
    }
    ruleSelections.emplace_back(new RuleGroup(store, name));
    if (auto error = ruleSelections.back()->addRule(*rule))
      return std::move(error);
    selections.push_back(ruleSelections.back().get());
  }

  return collectTargets(selections);
}

#pragma mark - Manifest loading

llvm::Expected<std::unique_ptr<Manifest>>
commands::loadManifest(StringRef contents, StringRef filename,
                       MemoFactory memoFactory) {
  std::unique_ptr<Manifest> manifest(new Manifest(std::move(memoFactory)));
  ManifestLoader loader(*manifest, filename);
  if (auto error = loader.load(contents))
    return std::move(error);
  return std::move(manifest);
}

llvm::Expected<std::unique_ptr<Manifest>>
commands::loadManifestFile(StringRef path, MemoFactory memoFactory) {
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(),
                                   "unable to read manifest '%s': %s",
                                   path.str().c_str(),
                                   buffer.getError().message().c_str());
  }
  return loadManifest((*buffer)->getBuffer(), path, std::move(memoFactory));
}
