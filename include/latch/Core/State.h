//===- State.h - Registered and combinational state -------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// State elements owned by components. Registers are double-buffered: reads
// observe the value committed at the last clock edge, writes are scheduled
// and applied by commit(). Each element accepts a single write per cycle.
// Wires hold a value for the current cycle only.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_STATE_H
#define LATCH_CORE_STATE_H

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include <string>
#include <vector>

namespace latch {

class Component;

/// Base class of everything a component commits at the clock edge.
class StateElement {
public:
  StateElement(Component &owner, llvm::StringRef name);
  virtual ~StateElement();

  StateElement(const StateElement &) = delete;
  StateElement &operator=(const StateElement &) = delete;

  const std::string &getName() const { return name; }
  Component &getOwner() const { return owner; }

  /// Apply the writes scheduled during the current cycle.
  virtual void commit() = 0;

  /// Restore the initial value.
  virtual void reset() = 0;

protected:
  [[noreturn]] void reportDoubleWrite(llvm::StringRef what) const;

private:
  Component &owner;
  std::string name;
};

/// A single register.
template <typename T> class Reg : public StateElement {
public:
  Reg(Component &owner, llvm::StringRef name, T init = T())
      : StateElement(owner, name), initValue(init), value(init), next(init) {}

  const T &read() const { return value; }

  void write(T v) {
    if (written)
      reportDoubleWrite("register");
    next = std::move(v);
    written = true;
  }

  bool isWritten() const { return written; }

  /// Value that will be visible after the next edge.
  const T &peekNext() const { return written ? next : value; }

  void commit() override {
    if (written)
      value = next;
    written = false;
  }

  void reset() override {
    value = initValue;
    next = initValue;
    written = false;
  }

private:
  T initValue;
  T value;
  T next;
  bool written = false;
};

/// A fixed-size array of registers addressed by index.
template <typename T> class RegArray : public StateElement {
public:
  RegArray(Component &owner, llvm::StringRef name, unsigned size,
           T init = T())
      : StateElement(owner, name), initValue(init), values(size, init),
        next(size, init), written(size, false) {}

  unsigned size() const { return values.size(); }

  const T &read(unsigned index) const {
    checkIndex(index);
    return values[index];
  }

  void write(unsigned index, T v) {
    checkIndex(index);
    if (written[index])
      reportDoubleWrite("register array element " + std::to_string(index));
    next[index] = std::move(v);
    written[index] = true;
    dirty.push_back(index);
  }

  bool isWritten(unsigned index) const {
    checkIndex(index);
    return written[index];
  }

  const T &peekNext(unsigned index) const {
    checkIndex(index);
    return written[index] ? next[index] : values[index];
  }

  void commit() override {
    for (unsigned index : dirty) {
      values[index] = next[index];
      written[index] = false;
    }
    dirty.clear();
  }

  void reset() override {
    for (unsigned i = 0, e = values.size(); i < e; ++i) {
      values[i] = initValue;
      next[i] = initValue;
      written[i] = false;
    }
    dirty.clear();
  }

private:
  void checkIndex(unsigned index) const {
    if (index >= values.size())
      llvm::report_fatal_error(llvm::Twine("Index ") + llvm::Twine(index) +
                               " out of range for '" + getName() + "'");
  }

  T initValue;
  llvm::SmallVector<T, 0> values;
  llvm::SmallVector<T, 0> next;
  std::vector<bool> written;
  llvm::SmallVector<unsigned, 8> dirty;
};

/// Combinational signal: set during a cycle, cleared at the edge.
template <typename T> class Wire : public StateElement {
public:
  Wire(Component &owner, llvm::StringRef name, T defaultValue = T())
      : StateElement(owner, name), defaultValue(defaultValue),
        value(defaultValue) {}

  void set(T v) {
    if (driven)
      reportDoubleWrite("wire");
    value = std::move(v);
    driven = true;
  }

  /// The driven value, or the default when nothing drove the wire.
  const T &get() const { return value; }
  bool isDriven() const { return driven; }

  void commit() override {
    value = defaultValue;
    driven = false;
  }

  void reset() override { commit(); }

private:
  T defaultValue;
  T value;
  bool driven = false;
};

} // namespace latch

#endif // LATCH_CORE_STATE_H
