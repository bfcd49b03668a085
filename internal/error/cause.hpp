#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <string>

namespace faultline {

/*
  Causal error capability.

  Chains are walked iteratively through Next(); renderers bound the walk.
*/
class Cause {
 public:
  virtual ~Cause() = default;

  virtual std::string  Render() const = 0;
  virtual const Cause* Next() const noexcept {
    return nullptr;
  }
};

/*
  Snapshot of a std::exception and its std::nested_exception chain.
*/
class ExceptionCause final : public Cause {
 public:
  static constexpr std::size_t kMaxNestedDepth = 64;

  explicit ExceptionCause(std::string message) : message_(std::move(message)) {
  }

  static std::unique_ptr<ExceptionCause> FromException(const std::exception& e);
  static std::unique_ptr<ExceptionCause> FromExceptionPtr(std::exception_ptr ptr);

  std::string Render() const override {
    return message_;
  }

  const Cause* Next() const noexcept override {
    return next_.get();
  }

 private:
  std::string                     message_;
  std::unique_ptr<ExceptionCause> next_;
};

} // namespace faultline
