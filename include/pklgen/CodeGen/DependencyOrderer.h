//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deterministic emission ordering for generated namespace members.
///
/// Python evaluates base classes when a class statement runs, and the module
/// class refers to every other declaration, so emission order is constrained:
///
/// 1. Type aliases precede every class and enum.
/// 2. A class follows its superclass when both live in the same namespace.
/// 3. The module class is the last class.
/// 4. Otherwise reflected declaration order is kept.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_DEPENDENCY_ORDERER_H
#define PKLGEN_CODEGEN_DEPENDENCY_ORDERER_H

#include "pklgen/CodeGen/GeneratedMember.h"

#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief Computes the emission order of one namespace's members.
///
/// @details
/// Classes and enums form a graph with `superclass -> subclass` edges and a
/// synthetic edge from every other class or enum to the module class. The
/// graph is sorted with Kahn's algorithm, always taking the ready member with
/// the smallest declaration index. Superclasses outside the member set add no
/// edge. A cycle is an internal consistency failure.
///
/// @param[in] members Generated members in any order.
/// @return Pointers into `members` in emission order, or an internal error.
llvm::Expected<std::vector<const GeneratedMember*>> orderMembers(llvm::ArrayRef<GeneratedMember> members);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_DEPENDENCY_ORDERER_H
