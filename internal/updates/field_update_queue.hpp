#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/model/field_values.hpp"
#include "internal/updates/field_filler.hpp"

namespace draft::updates {

/*
  Coalesces rapid field edits into one document regeneration.

  Every QueueUpdate re-arms a trailing debounce timer. When it elapses
  with no further updates the pending values (last write per field) are
  filled into the live buffer and the callback runs once with the result
  and the values flushed. The result becomes the live buffer unless a
  newer buffer was queued meanwhile.

  One background thread, joined on destruction. Updates still pending at
  destruction are dropped; call Flush() first to keep them.
*/
class FieldUpdateQueue {
 public:
  // Runs on the flushing thread (timer thread or the Flush() caller) while
  // flushes are serialized. It must not call Flush() on the same queue
  // (throws InvalidState) and must not destroy the queue.
  using FlushCallback = std::function<void(const std::shared_ptr<arrow::Buffer>& updated, const model::FieldValues& flushed)>;

  static constexpr std::chrono::milliseconds kDefaultDebounce{300};

  FieldUpdateQueue(std::shared_ptr<FieldFiller> filler, FlushCallback on_flush, std::chrono::milliseconds debounce = kDefaultDebounce);
  ~FieldUpdateQueue();

  FieldUpdateQueue(const FieldUpdateQueue&)            = delete;
  FieldUpdateQueue& operator=(const FieldUpdateQueue&) = delete;

  // buffer may be null to keep the current live buffer.
  void QueueUpdate(const std::shared_ptr<arrow::Buffer>& buffer, const std::string& field_name, const model::FieldValue& value);

  // Drains now and cancels the timer. Filler / callback errors propagate.
  // Throws InvalidState when called from inside the flush callback.
  void Flush();

  std::size_t PendingCount() const;

 private:
  struct Batch {
    std::shared_ptr<arrow::Buffer> source;
    model::FieldValues             values;
    uint64_t                       generation = 0;
  };

  void Run();

  // requires mutex_
  std::optional<Batch> TakeBatchLocked();

  // requires flush_mutex_
  void Apply(const Batch& batch);

  std::shared_ptr<FieldFiller> filler_;
  FlushCallback                on_flush_;
  std::chrono::milliseconds    debounce_;

  // serializes Apply so flushes reach the callback in order
  std::mutex flush_mutex_;

  // thread currently inside on_flush_, default id otherwise
  std::atomic<std::thread::id> callback_thread_{};

  mutable std::mutex                                   mutex_;
  std::condition_variable                              cv_;
  std::shared_ptr<arrow::Buffer>                       live_buffer_;
  model::FieldValues                                   pending_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  uint64_t                                             generation_ = 0;
  bool                                                 shutdown_   = false;

  std::thread thread_;
};

} // namespace draft::updates
