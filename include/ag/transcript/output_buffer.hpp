#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ag::transcript {

/**
 * @brief Lock-guarded byte sink shared between an output reader thread and
 * the render thread.
 *
 * Writers append; a reset shrinks the buffer, which readers detect through
 * the length. A writer that fails mid-write poisons the buffer, after which
 * lock() yields no guard.
 */
class OutputBuffer {
public:
  class Guard {
  public:
    std::size_t size() const noexcept { return bytes_->size(); }
    // Copies bytes [from, size()). `from` past the end yields nothing.
    std::string copy(std::size_t from = 0) const;

  private:
    friend class OutputBuffer;
    Guard(std::unique_lock<std::mutex> lock, const std::string &bytes)
        : lock_(std::move(lock)), bytes_(&bytes) {}

    std::unique_lock<std::mutex> lock_;
    const std::string *bytes_;
  };

  static std::shared_ptr<OutputBuffer> create();

  void append(std::string_view bytes);
  void assign(std::string_view bytes);
  void clear();

  void poison() noexcept { poisoned_.store(true); }
  bool poisoned() const noexcept { return poisoned_.load(); }

  std::optional<Guard> lock();

private:
  std::mutex mutex_;
  std::string bytes_;
  std::atomic<bool> poisoned_{false};
};

using OutputHandle = std::shared_ptr<OutputBuffer>;

} // namespace ag::transcript
