//===- ElaborationError.h - Structured configuration errors -----*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// Builder for the errors reported while the call graph is elaborated.
//
// Usage:
//   return ElaborationError("cam.push")
//       .setCategory(ErrorCategory::CyclicCallGraph)
//       .setDetails("a -> b -> a")
//       .setReason("a method may not call itself")
//       .setSolution("break the cycle")
//       .build();
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_ELABORATIONERROR_H
#define LATCH_CORE_ELABORATIONERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>

namespace latch {

enum class ErrorCategory {
  DuplicateName,
  CyclicCallGraph,
  MultipleCalls,
  ConflictingCalls,
  MissingDefinition,
  AmbiguousPriority,
  InvalidCallSite,
  AlreadyElaborated,
  Custom
};

class ElaborationError {
public:
  explicit ElaborationError(llvm::StringRef subject) : subject(subject.str()) {}

  ElaborationError &setCategory(ErrorCategory category);
  ElaborationError &setCategory(llvm::StringRef customCategory);
  ElaborationError &setDetails(llvm::StringRef details);
  ElaborationError &setReason(llvm::StringRef reason);
  ElaborationError &setSolution(llvm::StringRef solution);

  /// Render the message.
  std::string str() const;

  /// Produce an llvm::Error carrying the rendered message.
  llvm::Error build() const;

private:
  llvm::StringRef getCategoryString() const;

  std::string subject;
  ErrorCategory category = ErrorCategory::Custom;
  std::string customCategory;
  std::string details;
  std::string reason;
  std::string solution;
};

} // namespace latch

#endif // LATCH_CORE_ELABORATIONERROR_H
