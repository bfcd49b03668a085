#include "internal/error/cause.hpp"

#include <utility>

namespace faultline {

namespace {

// Returns the message of `ptr` and the exception it nests, if any.
std::pair<std::string, std::exception_ptr> Unwrap(const std::exception_ptr& ptr) {
  try {
    std::rethrow_exception(ptr);
  } catch (const std::exception& e) {
    const auto* nested = dynamic_cast<const std::nested_exception*>(&e);
    return {e.what(), nested ? nested->nested_ptr() : nullptr};
  } catch (...) {
    return {"unknown exception", nullptr};
  }
}

} // namespace

std::unique_ptr<ExceptionCause> ExceptionCause::FromException(const std::exception& e) {
  auto head = std::make_unique<ExceptionCause>(e.what());

  const auto* nested = dynamic_cast<const std::nested_exception*>(&e);
  if (nested && nested->nested_ptr()) {
    head->next_ = FromExceptionPtr(nested->nested_ptr());
  }
  return head;
}

std::unique_ptr<ExceptionCause> ExceptionCause::FromExceptionPtr(std::exception_ptr ptr) {
  std::unique_ptr<ExceptionCause> head;
  ExceptionCause*                 tail = nullptr;

  for (std::size_t depth = 0; ptr && depth < kMaxNestedDepth; ++depth) {
    auto [message, next] = Unwrap(ptr);
    auto node            = std::make_unique<ExceptionCause>(std::move(message));
    auto* raw            = node.get();
    if (tail) {
      tail->next_ = std::move(node);
    } else {
      head = std::move(node);
    }
    tail = raw;
    ptr  = next;
  }
  return head;
}

} // namespace faultline
