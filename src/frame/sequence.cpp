#include "blobspec/frame/sequence.hpp"

#include "blobspec/frame/value.hpp"

#include <spdlog/spdlog.h>

namespace blobspec::frame {

LazySequence::LazySequence(FrameContext context, core::Cursor& cursor, TypeSpec element)
    : context_(context), cursor_(&cursor), element_(std::move(element)) {}

bool LazySequence::done() const noexcept {
  return failed_ || cursor_ == nullptr || cursor_->exhausted();
}

std::error_code LazySequence::next(Value& out) {
  if (done()) {
    return core::make_error_code(core::errc::out_of_bounds);
  }
  const auto before = cursor_->position();
  Value v;
  auto ec = context_.decode_frame(*cursor_, element_, v);
  if (!ec && cursor_->position() == before) {
    spdlog::debug("blobspec: sequence element '{}' consumed no bytes at offset {}", element_.tag, before);
    ec = core::make_error_code(core::errc::invalid_argument);
  }
  if (ec) {
    failed_ = true;
    return ec;
  }
  ++produced_;
  out = std::move(v);
  return {};
}

std::error_code LazySequence::collect(std::vector<Value>& out) {
  while (!done()) {
    Value v;
    auto ec = next(v);
    if (ec) {
      return ec;
    }
    out.push_back(std::move(v));
  }
  return {};
}

}  // namespace blobspec::frame
