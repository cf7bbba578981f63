//===- ElaborationError.cpp - Structured configuration errors -------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/ElaborationError.h"
#include "llvm/Support/raw_ostream.h"

namespace latch {

ElaborationError &ElaborationError::setCategory(ErrorCategory category) {
  this->category = category;
  return *this;
}

ElaborationError &
ElaborationError::setCategory(llvm::StringRef customCategory) {
  this->category = ErrorCategory::Custom;
  this->customCategory = customCategory.str();
  return *this;
}

ElaborationError &ElaborationError::setDetails(llvm::StringRef details) {
  this->details = details.str();
  return *this;
}

ElaborationError &ElaborationError::setReason(llvm::StringRef reason) {
  this->reason = reason.str();
  return *this;
}

ElaborationError &ElaborationError::setSolution(llvm::StringRef solution) {
  this->solution = solution.str();
  return *this;
}

llvm::StringRef ElaborationError::getCategoryString() const {
  switch (category) {
  case ErrorCategory::DuplicateName:
    return "duplicate name";
  case ErrorCategory::CyclicCallGraph:
    return "cyclic call graph";
  case ErrorCategory::MultipleCalls:
    return "multiple calls";
  case ErrorCategory::ConflictingCalls:
    return "conflicting calls";
  case ErrorCategory::MissingDefinition:
    return "missing definition";
  case ErrorCategory::AmbiguousPriority:
    return "ambiguous priority";
  case ErrorCategory::InvalidCallSite:
    return "invalid call site";
  case ErrorCategory::AlreadyElaborated:
    return "already elaborated";
  case ErrorCategory::Custom:
    return customCategory;
  }
  return "unknown error";
}

std::string ElaborationError::str() const {
  std::string message;
  llvm::raw_string_ostream os(message);
  os << "[" << subject << "] Elaboration failed - " << getCategoryString();
  if (!details.empty())
    os << ": " << details;
  if (!reason.empty())
    os << ". Reason: " << reason;
  if (!solution.empty())
    os << ". Solution: " << solution;
  return os.str();
}

llvm::Error ElaborationError::build() const {
  return llvm::make_error<llvm::StringError>(str(),
                                             llvm::inconvertibleErrorCode());
}

} // namespace latch
