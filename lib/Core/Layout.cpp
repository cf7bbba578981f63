//===- Layout.cpp - Method data shapes ------------------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Layout.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include <optional>

namespace latch {

static std::shared_ptr<const std::vector<Field>>
makeFields(std::vector<Field> fields) {
  llvm::StringSet<> seen;
  for (const auto &field : fields) {
    if (field.width == 0)
      llvm::report_fatal_error(llvm::Twine("Layout field '") + field.name +
                               "' has zero width");
    if (!seen.insert(field.name).second)
      llvm::report_fatal_error(llvm::Twine("Layout field '") + field.name +
                               "' declared twice");
  }
  return std::make_shared<const std::vector<Field>>(std::move(fields));
}

Layout::Layout() : fields(std::make_shared<const std::vector<Field>>()) {}

Layout::Layout(std::initializer_list<Field> fields)
    : fields(makeFields(std::vector<Field>(fields))) {}

Layout::Layout(std::vector<Field> fields) : fields(makeFields(std::move(fields))) {}

unsigned Layout::getWidth() const {
  unsigned width = 0;
  for (const auto &field : *fields)
    width += field.width;
  return width;
}

std::optional<unsigned> Layout::lookup(llvm::StringRef name) const {
  for (unsigned i = 0, e = fields->size(); i < e; ++i)
    if ((*fields)[i].name == name)
      return i;
  return std::nullopt;
}

Record Layout::unpack(const llvm::APInt &bits) const {
  llvm::APInt value = fitValue(getWidth(), bits);
  Record record(*this);
  unsigned offset = 0;
  for (const auto &field : *fields) {
    record.set(field.name, value.extractBits(field.width, offset));
    offset += field.width;
  }
  return record;
}

bool Layout::operator==(const Layout &other) const {
  if (fields == other.fields)
    return true;
  if (fields->size() != other.fields->size())
    return false;
  for (unsigned i = 0, e = fields->size(); i < e; ++i) {
    const Field &a = (*fields)[i];
    const Field &b = (*other.fields)[i];
    if (a.name != b.name || a.width != b.width)
      return false;
  }
  return true;
}

void Layout::print(llvm::raw_ostream &os) const {
  os << "{";
  bool first = true;
  for (const auto &field : *fields) {
    if (!first)
      os << ", ";
    first = false;
    os << field.name << ":" << field.width;
  }
  os << "}";
}

//===----------------------------------------------------------------------===//
// Record
//===----------------------------------------------------------------------===//

Record::Record(Layout layout) : layout(std::move(layout)) {
  for (const auto &field : this->layout)
    values.push_back(llvm::APInt(field.width, 0));
}

Record::Record(Layout layout, std::initializer_list<uint64_t> init)
    : Record(std::move(layout)) {
  if (init.size() != values.size())
    llvm::report_fatal_error(llvm::Twine("Record initializer has ") +
                             llvm::Twine(init.size()) + " values for " +
                             llvm::Twine(values.size()) + " fields");
  unsigned i = 0;
  for (uint64_t v : init) {
    values[i] = makeValue(this->layout[i].width, v);
    ++i;
  }
}

unsigned Record::indexOf(llvm::StringRef name) const {
  auto index = layout.lookup(name);
  if (!index) {
    std::string desc;
    llvm::raw_string_ostream os(desc);
    os << layout;
    llvm::report_fatal_error(llvm::Twine("Record has no field '") + name +
                             "' in layout " + os.str());
  }
  return *index;
}

const llvm::APInt &Record::get(llvm::StringRef name) const {
  return values[indexOf(name)];
}

uint64_t Record::getZExt(llvm::StringRef name) const {
  const llvm::APInt &value = get(name);
  if (value.getActiveBits() > 64)
    llvm::report_fatal_error(llvm::Twine("Record field '") + name +
                             "' does not fit into 64 bits");
  return value.getZExtValue();
}

Record &Record::set(llvm::StringRef name, const llvm::APInt &value) {
  unsigned index = indexOf(name);
  values[index] = fitValue(layout[index].width, value);
  return *this;
}

Record &Record::set(llvm::StringRef name, uint64_t value) {
  unsigned index = indexOf(name);
  values[index] = makeValue(layout[index].width, value);
  return *this;
}

llvm::APInt Record::pack() const {
  unsigned width = layout.getWidth();
  if (width == 0)
    return llvm::APInt(1, 0);
  llvm::APInt result(width, 0);
  unsigned offset = 0;
  for (const auto &value : values) {
    result.insertBits(value, offset);
    offset += value.getBitWidth();
  }
  return result;
}

bool Record::operator==(const Record &other) const {
  if (layout != other.layout)
    return false;
  for (unsigned i = 0, e = values.size(); i < e; ++i)
    if (values[i] != other.values[i])
      return false;
  return true;
}

void Record::print(llvm::raw_ostream &os) const {
  os << "{";
  for (unsigned i = 0, e = values.size(); i < e; ++i) {
    if (i)
      os << ", ";
    os << layout[i].name << "=";
    values[i].print(os, /*isSigned=*/false);
  }
  os << "}";
}

llvm::APInt makeValue(unsigned width, uint64_t value) {
  return fitValue(width, llvm::APInt(64, value));
}

llvm::APInt fitValue(unsigned width, const llvm::APInt &value) {
  if (width == 0)
    return llvm::APInt(1, 0);
  return value.zextOrTrunc(width);
}

} // namespace latch
