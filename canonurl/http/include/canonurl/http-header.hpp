#pragma once

#include <string>
#include <string_view>

namespace canonurl::http {

// Represents a single HTTP header field owned by a response.
class Header {
 public:
  Header(std::string_view name, std::string_view value) : _name(name), _value(value) {}

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::string_view value() const noexcept { return _value; }

  void setValue(std::string_view value) { _value.assign(value); }

  bool operator==(const Header&) const = default;

 private:
  std::string _name;
  std::string _value;
};

}  // namespace canonurl::http
