//===- Layout.h - Method data shapes ----------------------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// A Layout names the fields of a method's inputs or outputs together with
// their bit widths. A Record carries one value per field. Values are
// llvm::APInt so that fields of any width can be modelled exactly.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_LAYOUT_H
#define LATCH_CORE_LAYOUT_H

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace latch {

struct Field {
  std::string name;
  unsigned width;
};

class Record;

/// Ordered list of named, fixed-width fields. Copies share storage.
class Layout {
public:
  Layout();
  Layout(std::initializer_list<Field> fields);
  explicit Layout(std::vector<Field> fields);

  unsigned size() const { return fields->size(); }
  bool empty() const { return fields->empty(); }
  const Field &operator[](unsigned i) const { return (*fields)[i]; }

  std::vector<Field>::const_iterator begin() const { return fields->begin(); }
  std::vector<Field>::const_iterator end() const { return fields->end(); }

  /// Sum of all field widths.
  unsigned getWidth() const;

  /// Index of the field called `name`, if any.
  std::optional<unsigned> lookup(llvm::StringRef name) const;

  /// Split a packed value into a record; the first field occupies the
  /// lowest bits.
  Record unpack(const llvm::APInt &bits) const;

  bool operator==(const Layout &other) const;
  bool operator!=(const Layout &other) const { return !(*this == other); }

  void print(llvm::raw_ostream &os) const;

private:
  std::shared_ptr<const std::vector<Field>> fields;
};

/// Values for every field of a layout.
class Record {
public:
  Record() = default;
  explicit Record(Layout layout);
  /// Initialize the fields in layout order.
  Record(Layout layout, std::initializer_list<uint64_t> values);

  const Layout &getLayout() const { return layout; }

  const llvm::APInt &get(llvm::StringRef name) const;
  uint64_t getZExt(llvm::StringRef name) const;
  const llvm::APInt &getAt(unsigned index) const { return values[index]; }

  /// Set a field; the value is truncated or zero-extended to the field width.
  Record &set(llvm::StringRef name, const llvm::APInt &value);
  Record &set(llvm::StringRef name, uint64_t value);

  /// Concatenate all fields, first field in the lowest bits.
  llvm::APInt pack() const;

  bool operator==(const Record &other) const;
  bool operator!=(const Record &other) const { return !(*this == other); }

  void print(llvm::raw_ostream &os) const;

private:
  unsigned indexOf(llvm::StringRef name) const;

  Layout layout;
  llvm::SmallVector<llvm::APInt, 4> values;
};

/// Make a value of exactly `width` bits from `value`, dropping high bits.
llvm::APInt makeValue(unsigned width, uint64_t value);

/// Adjust `value` to `width` bits, truncating or zero-extending.
llvm::APInt fitValue(unsigned width, const llvm::APInt &value);

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Layout &l) {
  l.print(os);
  return os;
}

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Record &r) {
  r.print(os);
  return os;
}

} // namespace latch

#endif // LATCH_CORE_LAYOUT_H
