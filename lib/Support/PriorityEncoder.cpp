//===- PriorityEncoder.cpp - Multi-output priority encoders ---------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// The encoders are evaluated as a priority chain: every output takes the
// lowest remaining request and masks it out for the outputs after it.
//
//===----------------------------------------------------------------------===//

#include "latch/Support/PriorityEncoder.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

namespace latch {

MultiPriorityEncoder::MultiPriorityEncoder(unsigned inputWidth,
                                           unsigned outputCount)
    : inputWidth(inputWidth), outputCount(outputCount) {
  if (inputWidth == 0 || outputCount == 0)
    llvm::report_fatal_error("MultiPriorityEncoder needs a non-zero input "
                             "width and output count");
}

llvm::SmallVector<EncoderOutput, 4>
MultiPriorityEncoder::encode(const llvm::BitVector &requests) const {
  if (requests.size() != inputWidth)
    llvm::report_fatal_error(llvm::Twine("MultiPriorityEncoder: expected ") +
                             llvm::Twine(inputWidth) + " request bits, got " +
                             llvm::Twine(requests.size()));

  llvm::SmallVector<EncoderOutput, 4> outputs(outputCount);
  int next = requests.find_first();
  for (unsigned i = 0; i < outputCount && next != -1; ++i) {
    outputs[i].index = static_cast<unsigned>(next);
    outputs[i].valid = true;
    next = requests.find_next(next);
  }
  return outputs;
}

EncoderOutput MultiPriorityEncoder::createSimple(const llvm::BitVector &requests) {
  EncoderOutput out;
  int first = requests.find_first();
  if (first != -1) {
    out.index = static_cast<unsigned>(first);
    out.valid = true;
  }
  return out;
}

RingMultiPriorityEncoder::RingMultiPriorityEncoder(unsigned inputWidth,
                                                   unsigned outputCount)
    : inputWidth(inputWidth), outputCount(outputCount) {
  if (inputWidth == 0 || outputCount == 0)
    llvm::report_fatal_error("RingMultiPriorityEncoder needs a non-zero input "
                             "width and output count");
}

llvm::SmallVector<EncoderOutput, 4>
RingMultiPriorityEncoder::encode(const llvm::BitVector &requests,
                                 unsigned first, unsigned last) const {
  if (requests.size() != inputWidth)
    llvm::report_fatal_error(llvm::Twine("RingMultiPriorityEncoder: expected ") +
                             llvm::Twine(inputWidth) + " request bits, got " +
                             llvm::Twine(requests.size()));
  if (first >= inputWidth || last >= inputWidth)
    llvm::report_fatal_error("RingMultiPriorityEncoder: window bound out of "
                             "range");

  // Unroll the ring into a doubled vector so that the window becomes a
  // contiguous range [first, last) with last possibly past inputWidth.
  unsigned end = last < first ? last + inputWidth : last;

  llvm::SmallVector<EncoderOutput, 4> outputs(outputCount);
  unsigned produced = 0;
  for (unsigned pos = first; pos < end && produced < outputCount; ++pos) {
    unsigned index = pos % inputWidth;
    if (!requests.test(index))
      continue;
    outputs[produced].index = index;
    outputs[produced].valid = true;
    ++produced;
  }
  return outputs;
}

EncoderOutput RingMultiPriorityEncoder::createSimple(
    const llvm::BitVector &requests, unsigned first, unsigned last) {
  RingMultiPriorityEncoder encoder(requests.size(), 1);
  return encoder.encode(requests, first, last).front();
}

} // namespace latch
