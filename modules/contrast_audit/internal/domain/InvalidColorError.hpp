#pragma once

#include <stdexcept>
#include <string>

namespace ContrastAudit::Domain {

// Thrown when a color literal cannot be normalized
class InvalidColorError : public std::invalid_argument {
  public:
    explicit InvalidColorError(const std::string& value)
        : std::invalid_argument("Invalid color value: '" + value + "'"), value_(value) {}

    const std::string& value() const { return value_; }

  private:
    std::string value_;
};

}  // namespace ContrastAudit::Domain
