//===- BuiltinActions.h -----------------------------------------*- C++ -*-===//
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
// This file declares the actions available to rule manifests:
//
//   write(output, text)        Write a string or byte string to a file.
//   concat(output, parts...)   Write the concatenation of the parts; files
//                              contribute their contents, other values their
//                              string form.
//   copy(input, output)        Copy a file.
//   shell(command)             Run a command with /bin/sh.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_COMMANDS_BUILTINACTIONS_H
#define MEMOBUILD_COMMANDS_BUILTINACTIONS_H

#include "memobuild/Basic/LLVM.h"

#include <string>

namespace memobuild {
namespace core {
class ActionRegistry;
class Value;
}

namespace commands {

/// Register the builtin actions in \arg registry.
void registerBuiltinActions(core::ActionRegistry& registry);

/// Get the string form of a value, as the concat action writes it.
///
/// Strings, byte strings and paths contribute their contents; other values
/// their diagnostic rendition.
std::string getValueText(const core::Value& value);

}
}

#endif
