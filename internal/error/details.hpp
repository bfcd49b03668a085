#pragma once

#include <string>
#include <variant>

#include <google/protobuf/struct.pb.h>

namespace faultline {

/*
  Structured data attached to an error: a JSON value or plain text.
*/
class Details {
 public:
  static Details Json(google::protobuf::Value value) {
    return Details(Payload(std::in_place_index<0>, std::move(value)));
  }

  static Details Text(std::string text) {
    return Details(Payload(std::in_place_index<1>, std::move(text)));
  }

  const google::protobuf::Value* AsJson() const noexcept {
    return std::get_if<0>(&payload_);
  }

  const std::string* AsText() const noexcept {
    return std::get_if<1>(&payload_);
  }

 private:
  using Payload = std::variant<google::protobuf::Value, std::string>;

  explicit Details(Payload payload) : payload_(std::move(payload)) {
  }

  Payload payload_;
};

} // namespace faultline
