//===- PriorityEncoder.h - Multi-output priority encoders -------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// This file declares the priority encoders used for arbitration. Given a
// request vector they select up to K winners, lowest index first. The ring
// variant only considers a cyclic window of indices and orders the requests
// by their position inside that window.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_SUPPORT_PRIORITYENCODER_H
#define LATCH_SUPPORT_PRIORITYENCODER_H

#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/SmallVector.h"

namespace latch {

/// One output of an encoder: the selected index and whether it is valid.
struct EncoderOutput {
  unsigned index = 0;
  bool valid = false;

  bool operator==(const EncoderOutput &other) const {
    return valid == other.valid && (!valid || index == other.index);
  }
  bool operator!=(const EncoderOutput &other) const {
    return !(*this == other);
  }
};

/// Priority encoder with multiple outputs.
///
/// The first output is the lowest set request bit, the second output the next
/// one and so on. Outputs that have no request left are marked invalid.
/// Once an index is granted it is excluded from the subsequent outputs.
class MultiPriorityEncoder {
public:
  MultiPriorityEncoder(unsigned inputWidth, unsigned outputCount);

  unsigned getInputWidth() const { return inputWidth; }
  unsigned getOutputCount() const { return outputCount; }

  /// Encode a request vector of exactly `inputWidth` bits.
  llvm::SmallVector<EncoderOutput, 4> encode(const llvm::BitVector &requests) const;

  /// Single-output encoding of an arbitrary request vector.
  static EncoderOutput createSimple(const llvm::BitVector &requests);

private:
  unsigned inputWidth;
  unsigned outputCount;
};

/// Priority encoder restricted to the cyclic window [first, last).
///
/// If `last < first` the window wraps from `inputWidth - 1` back to 0. An
/// empty window (`first == last`) selects nothing. Priority is determined by
/// the position inside the window, not by the absolute index.
class RingMultiPriorityEncoder {
public:
  RingMultiPriorityEncoder(unsigned inputWidth, unsigned outputCount);

  unsigned getInputWidth() const { return inputWidth; }
  unsigned getOutputCount() const { return outputCount; }

  llvm::SmallVector<EncoderOutput, 4> encode(const llvm::BitVector &requests,
                                             unsigned first,
                                             unsigned last) const;

  static EncoderOutput createSimple(const llvm::BitVector &requests,
                                    unsigned first, unsigned last);

private:
  unsigned inputWidth;
  unsigned outputCount;
};

} // namespace latch

#endif // LATCH_SUPPORT_PRIORITYENCODER_H
