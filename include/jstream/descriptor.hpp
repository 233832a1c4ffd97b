#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jstream {

enum class serial_kind {
  boolean,
  int8,
  int16,
  int32,
  int64,
  float32,
  float64,
  character,
  string,
  enumeration,
  object,
  list,
  map,
  polymorphic,
  inline_value
};

// Immutable schema node. Composite kinds own their element descriptors through shared_ptr so
// copies are cheap and serializers can hand out function-local statics.
class descriptor {
public:
  static constexpr int unknown_name = -3;

  struct element {
    std::string name;
    std::shared_ptr<const descriptor> desc; // null for enum constants
  };

  static descriptor primitive(serial_kind kind) {
    descriptor d;
    d.kind_ = kind;
    d.name_ = default_name(kind);
    return d;
  }

  static descriptor object(std::string name, std::vector<std::pair<std::string, descriptor>> elements) {
    descriptor d;
    d.kind_ = serial_kind::object;
    d.name_ = std::move(name);
    d.elements_.reserve(elements.size());
    for (auto& kv : elements) {
      d.elements_.push_back(element{std::move(kv.first), std::make_shared<const descriptor>(std::move(kv.second))});
    }
    d.build_index();
    return d;
  }

  static descriptor list(descriptor element_desc) {
    descriptor d;
    d.kind_ = serial_kind::list;
    d.name_ = "list<" + element_desc.name_ + ">";
    d.elements_.push_back(element{"0", std::make_shared<const descriptor>(std::move(element_desc))});
    return d;
  }

  static descriptor map(descriptor key_desc, descriptor value_desc) {
    descriptor d;
    d.kind_ = serial_kind::map;
    d.name_ = "map<" + key_desc.name_ + "," + value_desc.name_ + ">";
    d.elements_.push_back(element{"0", std::make_shared<const descriptor>(std::move(key_desc))});
    d.elements_.push_back(element{"1", std::make_shared<const descriptor>(std::move(value_desc))});
    return d;
  }

  static descriptor enumeration(std::string name, std::vector<std::string> constants) {
    descriptor d;
    d.kind_ = serial_kind::enumeration;
    d.name_ = std::move(name);
    d.elements_.reserve(constants.size());
    for (auto& c : constants) d.elements_.push_back(element{std::move(c), nullptr});
    d.build_index();
    return d;
  }

  // Wrapper object {"type": <discriminator>, "value": <payload>}.
  static descriptor polymorphic(std::string base_name) {
    descriptor d;
    d.kind_ = serial_kind::polymorphic;
    d.name_ = std::move(base_name);
    descriptor payload;
    payload.kind_ = serial_kind::object;
    payload.name_ = d.name_ + ".value";
    d.elements_.push_back(element{"type", std::make_shared<const descriptor>(primitive(serial_kind::string))});
    d.elements_.push_back(element{"value", std::make_shared<const descriptor>(std::move(payload))});
    return d;
  }

  static descriptor inline_value(std::string name, descriptor underlying, bool is_unsigned = false) {
    descriptor d;
    d.kind_ = serial_kind::inline_value;
    d.name_ = std::move(name);
    d.unsigned_ = is_unsigned;
    d.elements_.push_back(element{"0", std::make_shared<const descriptor>(std::move(underlying))});
    return d;
  }

  static descriptor nullable(descriptor d) {
    d.nullable_ = true;
    return d;
  }

  serial_kind kind() const noexcept { return kind_; }
  const std::string& serial_name() const noexcept { return name_; }
  bool is_nullable() const noexcept { return nullable_; }
  bool is_unsigned_numeric() const noexcept { return unsigned_; }

  std::size_t element_count() const noexcept { return elements_.size(); }

  const std::string& element_name(std::size_t index) const { return at(index).name; }

  const descriptor& element_descriptor(std::size_t index) const {
    const element& e = at(index);
    if (!e.desc) throw std::runtime_error("jstream: enum constant '" + e.name + "' has no element descriptor");
    return *e.desc;
  }

  bool is_element_nullable(std::size_t index) const { return element_descriptor(index).is_nullable(); }

  int element_index(std::string_view name) const noexcept {
    if (!index_.empty()) {
      const auto it = index_.find(name);
      return it == index_.end() ? unknown_name : it->second;
    }
    for (std::size_t i = 0; i < elements_.size(); ++i) {
      if (elements_[i].name == name) return static_cast<int>(i);
    }
    return unknown_name;
  }

private:
  static constexpr std::size_t kLinearLookupMax = 8;

  descriptor() = default;

  static const char* default_name(serial_kind kind) noexcept {
    switch (kind) {
      case serial_kind::boolean: return "boolean";
      case serial_kind::int8: return "byte";
      case serial_kind::int16: return "short";
      case serial_kind::int32: return "int";
      case serial_kind::int64: return "long";
      case serial_kind::float32: return "float";
      case serial_kind::float64: return "double";
      case serial_kind::character: return "char";
      case serial_kind::string: return "string";
      case serial_kind::enumeration: return "enum";
      case serial_kind::object: return "object";
      case serial_kind::list: return "list";
      case serial_kind::map: return "map";
      case serial_kind::polymorphic: return "polymorphic";
      case serial_kind::inline_value: return "inline";
    }
    return "unknown";
  }

  const element& at(std::size_t index) const {
    if (index >= elements_.size()) {
      throw std::out_of_range("jstream: element index " + std::to_string(index) + " out of range for '" + name_ + "'");
    }
    return elements_[index];
  }

  void build_index() {
    if (elements_.size() <= kLinearLookupMax) return;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
      // First declaration wins on duplicate names, matching the linear scan.
      index_.emplace(elements_[i].name, static_cast<int>(i));
    }
  }

  serial_kind kind_{serial_kind::object};
  std::string name_;
  bool nullable_{false};
  bool unsigned_{false};
  std::vector<element> elements_;
  std::map<std::string, int, std::less<>> index_;
};

} // namespace jstream
