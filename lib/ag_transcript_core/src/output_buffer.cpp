#include "ag/transcript/output_buffer.hpp"

namespace ag::transcript {

std::string OutputBuffer::Guard::copy(std::size_t from) const {
  if (from >= bytes_->size())
    return {};
  return bytes_->substr(from);
}

std::shared_ptr<OutputBuffer> OutputBuffer::create() {
  return std::make_shared<OutputBuffer>();
}

void OutputBuffer::append(std::string_view bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  bytes_.append(bytes);
}

void OutputBuffer::assign(std::string_view bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  bytes_.assign(bytes);
}

void OutputBuffer::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  bytes_.clear();
}

std::optional<OutputBuffer::Guard> OutputBuffer::lock() {
  if (poisoned())
    return std::nullopt;
  std::unique_lock<std::mutex> guard(mutex_);
  return Guard(std::move(guard), bytes_);
}

} // namespace ag::transcript
