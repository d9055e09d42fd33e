#pragma once

#include "Logger.hpp"

#include <exception>
#include <string>

namespace Drop {

class BaseException : public std::exception {
public:
  explicit BaseException(const std::string &input) : message(input) {
    debug("Exception: {}", input);
  }

  [[nodiscard]] auto what() const noexcept -> const char * override {
    return message.c_str();
  }

private:
  std::string message;
};

// An unrecognised or malformed channel message.
class ProtocolException : public BaseException {
public:
  ProtocolException(const std::string &method_name, const std::string &input)
      : BaseException(input), method(method_name) {}

  [[nodiscard]] auto get_method() const -> const std::string & {
    return method;
  }

private:
  std::string method;
};

// Precondition violation by the caller, e.g. registering a listener twice.
class StateMisuseException : public BaseException {
public:
  using BaseException::BaseException;
};

class MaterializationException : public BaseException {
public:
  using BaseException::BaseException;
};

} // namespace Drop
