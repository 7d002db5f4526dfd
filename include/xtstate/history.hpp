#ifndef XTSTATE_HISTORY_HPP
#define XTSTATE_HISTORY_HPP

#include <cstdint>
#include <memory_resource>
#include <string>
#include <utility>
#include <vector>

namespace xtstate {

// One recorded slot change. Read-only once appended.
//
// Allocator-aware so a history_log keeps every identifier in its own memory
// resource, copies included.
class history_entry {
  std::pmr::string identifier_;
  bool value_;
  std::int64_t timestamp_ms_;

public:
  using allocator_type = std::pmr::polymorphic_allocator<>;

  history_entry(std::pmr::string identifier, bool value, std::int64_t timestamp_ms)
      : identifier_(std::move(identifier)), value_(value),
        timestamp_ms_(timestamp_ms) {}

  history_entry(std::pmr::string identifier, bool value, std::int64_t timestamp_ms,
                const allocator_type &alloc)
      : identifier_(std::move(identifier), alloc), value_(value),
        timestamp_ms_(timestamp_ms) {}

  history_entry(const history_entry &) = default;
  history_entry(history_entry &&) noexcept = default;
  history_entry &operator=(const history_entry &) = default;
  history_entry &operator=(history_entry &&) = default;

  history_entry(const history_entry &other, const allocator_type &alloc)
      : identifier_(other.identifier_, alloc), value_(other.value_),
        timestamp_ms_(other.timestamp_ms_) {}

  history_entry(history_entry &&other, const allocator_type &alloc)
      : identifier_(std::move(other.identifier_), alloc), value_(other.value_),
        timestamp_ms_(other.timestamp_ms_) {}

  allocator_type get_allocator() const noexcept {
    return identifier_.get_allocator();
  }

  const std::pmr::string &identifier() const noexcept { return identifier_; }
  bool value() const noexcept { return value_; }

  // Milliseconds since the Unix epoch, as reported by the clock policy
  std::int64_t timestamp_ms() const noexcept { return timestamp_ms_; }

  bool operator==(const history_entry &other) const {
    return identifier_ == other.identifier_ && value_ == other.value_ &&
           timestamp_ms_ == other.timestamp_ms_;
  }
};

// Append order is chronological order: updates are serialized.
using history_log = std::pmr::vector<history_entry>;

} // namespace xtstate

#endif // XTSTATE_HISTORY_HPP
