#include "field_update_queue.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/buffer.hpp"
#include "internal/util/errors.hpp"

namespace draft::updates {

using observability::IntField;
using observability::StringField;
using observability::UintField;

FieldUpdateQueue::FieldUpdateQueue(std::shared_ptr<FieldFiller> filler, FlushCallback on_flush, std::chrono::milliseconds debounce)
    : filler_(std::move(filler)), on_flush_(std::move(on_flush)), debounce_(debounce) {
  if (!filler_) {
    throw std::invalid_argument("field update queue requires a filler");
  }
  thread_ = std::thread(&FieldUpdateQueue::Run, this);
}

FieldUpdateQueue::~FieldUpdateQueue() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    if (!pending_.fields().empty()) {
      DRAFT_LOG_DEBUG("field updates dropped at shutdown", {UintField("pending", pending_.fields_size())});
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void FieldUpdateQueue::QueueUpdate(const std::shared_ptr<arrow::Buffer>& buffer, const std::string& field_name, const model::FieldValue& value) {
  if (field_name.empty()) {
    throw util::InvalidArgument("field name must not be empty");
  }

  {
    std::lock_guard lock(mutex_);
    if (buffer) {
      live_buffer_ = util::CopyBuffer(*buffer);
      generation_++;
    } else if (!live_buffer_) {
      throw util::InvalidArgument("queue update " + field_name + ": no document buffer");
    }

    (*pending_.mutable_fields())[field_name] = value;
    deadline_                                = std::chrono::steady_clock::now() + debounce_;
  }
  cv_.notify_all();
}

void FieldUpdateQueue::Flush() {
  if (callback_thread_.load() == std::this_thread::get_id()) {
    throw util::InvalidState("field update queue: Flush() called from the flush callback");
  }

  std::scoped_lock flush_lock(flush_mutex_);

  std::optional<Batch> batch;
  {
    std::lock_guard lock(mutex_);
    batch = TakeBatchLocked();
  }
  cv_.notify_all();

  if (batch) Apply(*batch);
}

std::size_t FieldUpdateQueue::PendingCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(pending_.fields_size());
}

// ------------------------------------------------------------
// Timer thread
// ------------------------------------------------------------

void FieldUpdateQueue::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (!deadline_) {
      cv_.wait(lock, [&] { return shutdown_ || deadline_.has_value(); });
      continue;
    }

    const auto deadline = *deadline_;
    const bool rearmed  = cv_.wait_until(lock, deadline, [&] { return shutdown_ || !deadline_ || *deadline_ != deadline; });
    if (rearmed) continue;

    // lock order: flush_mutex_ before mutex_
    lock.unlock();
    {
      std::scoped_lock flush_lock(flush_mutex_);

      std::optional<Batch> batch;
      {
        std::lock_guard inner(mutex_);
        if (!shutdown_ && deadline_ && *deadline_ <= std::chrono::steady_clock::now()) {
          batch = TakeBatchLocked();
        }
      }

      if (batch) {
        try {
          Apply(*batch);
        } catch (const std::exception& e) {
          DRAFT_LOG_ERROR("field update flush failed", {IntField("fields", batch->values.fields_size()), StringField("error", e.what())});
        }
      }
    }
    lock.lock();
  }
}

std::optional<FieldUpdateQueue::Batch> FieldUpdateQueue::TakeBatchLocked() {
  deadline_.reset();
  if (pending_.fields().empty()) return std::nullopt;

  Batch batch;
  batch.source     = live_buffer_;
  batch.generation = generation_;
  batch.values.Swap(&pending_);
  return batch;
}

void FieldUpdateQueue::Apply(const Batch& batch) {
  auto updated = filler_->Fill(*batch.source, batch.values);
  if (!updated) {
    throw std::runtime_error("field filler returned no document");
  }

  {
    std::lock_guard lock(mutex_);
    if (generation_ == batch.generation) {
      live_buffer_ = util::CopyBuffer(*updated);
    }
  }

  DRAFT_LOG_DEBUG("field updates flushed", {IntField("fields", batch.values.fields_size()), UintField("size_bytes", updated->size())});

  if (!on_flush_) return;

  callback_thread_.store(std::this_thread::get_id());
  try {
    on_flush_(updated, batch.values);
  } catch (const std::exception&) {
    callback_thread_.store(std::thread::id{});
    throw;
  }
  callback_thread_.store(std::thread::id{});
}

} // namespace draft::updates
