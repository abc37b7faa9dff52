#include "internal/updates/field_update_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/buffer.hpp"
#include "internal/util/errors.hpp"

namespace {

using draft::model::FieldValues;
using draft::model::NumberValue;
using draft::model::StringValue;
using draft::updates::FieldFiller;
using draft::updates::FieldUpdateQueue;
using draft::util::BufferFromString;

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
}

// Appends "[name=json,...]" in field name order; records what it was given.
class RecordingFiller final : public FieldFiller {
 public:
  std::shared_ptr<arrow::Buffer> Fill(const arrow::Buffer& source, const FieldValues& values) override {
    std::lock_guard lock(mutex_);
    const std::string input(reinterpret_cast<const char*>(source.data()), static_cast<size_t>(source.size()));
    sources_.push_back(input);
    if (fail_) {
      throw std::runtime_error("filler failed");
    }

    std::map<std::string, std::string> sorted;
    for (const auto& [name, value] : values.fields()) {
      sorted.emplace(name, draft::model::ToJson(value));
    }

    std::string out = input + "[";
    for (const auto& [name, json] : sorted) {
      out += name + "=" + json + ",";
    }
    out += "]";
    return BufferFromString(out);
  }

  void SetFail(bool fail) {
    std::lock_guard lock(mutex_);
    fail_ = fail;
  }

  std::vector<std::string> Sources() {
    std::lock_guard lock(mutex_);
    return sources_;
  }

 private:
  std::mutex               mutex_;
  std::vector<std::string> sources_;
  bool                     fail_ = false;
};

struct Flushes {
  std::mutex               mutex;
  std::vector<std::string> outputs;
  std::vector<FieldValues> values;

  FieldUpdateQueue::FlushCallback Callback() {
    return [this](const std::shared_ptr<arrow::Buffer>& updated, const FieldValues& flushed) {
      std::lock_guard lock(mutex);
      outputs.push_back(AsString(updated));
      values.push_back(flushed);
    };
  }

  size_t Count() {
    std::lock_guard lock(mutex);
    return outputs.size();
  }
};

bool WaitFor(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return done();
}

void TestDebounceCoalescesUpdates() {
  auto    filler = std::make_shared<RecordingFiller>();
  Flushes flushes;

  FieldUpdateQueue queue(filler, flushes.Callback(), std::chrono::milliseconds{50});

  queue.QueueUpdate(BufferFromString("base"), "name", StringValue("A"));
  queue.QueueUpdate(nullptr, "name", StringValue("B"));
  queue.QueueUpdate(nullptr, "age", NumberValue(7));
  assert(queue.PendingCount() == 2);

  assert(WaitFor([&] { return flushes.Count() >= 1; }, std::chrono::milliseconds{2000}));
  // no second flush trails the first
  std::this_thread::sleep_for(std::chrono::milliseconds{200});
  assert(flushes.Count() == 1);
  assert(queue.PendingCount() == 0);

  assert(filler->Sources().size() == 1);
  assert(filler->Sources()[0] == "base");

  const auto& flushed = flushes.values[0];
  assert(flushed.fields_size() == 2);
  assert(flushed.fields().at("name").string_value() == "B");
  assert(flushed.fields().at("age").number_value() == 7);
  assert(flushes.outputs[0].rfind("base[age=", 0) == 0);
  assert(flushes.outputs[0].find(",name=") != std::string::npos);
}

void TestFlushDrainsImmediately() {
  auto    filler = std::make_shared<RecordingFiller>();
  Flushes flushes;

  FieldUpdateQueue queue(filler, flushes.Callback(), std::chrono::seconds{10});

  // nothing pending: no fill, no callback
  queue.Flush();
  assert(flushes.Count() == 0);

  queue.QueueUpdate(BufferFromString("doc"), "x", StringValue("1"));
  queue.Flush();
  assert(flushes.Count() == 1);
  assert(queue.PendingCount() == 0);

  queue.Flush();
  assert(flushes.Count() == 1);
}

void TestFilledBufferBecomesLiveBuffer() {
  auto    filler = std::make_shared<RecordingFiller>();
  Flushes flushes;

  FieldUpdateQueue queue(filler, flushes.Callback(), std::chrono::seconds{10});

  queue.QueueUpdate(BufferFromString("v0"), "a", StringValue("1"));
  queue.Flush();
  queue.QueueUpdate(nullptr, "b", StringValue("2"));
  queue.Flush();

  auto sources = filler->Sources();
  assert(sources.size() == 2);
  assert(sources[1] == flushes.outputs[0]);

  // an explicit buffer replaces the live one
  queue.QueueUpdate(BufferFromString("fresh"), "c", StringValue("3"));
  queue.Flush();
  assert(filler->Sources().back() == "fresh");
}

void TestFillerErrorsPropagateFromFlush() {
  auto    filler = std::make_shared<RecordingFiller>();
  Flushes flushes;

  FieldUpdateQueue queue(filler, flushes.Callback(), std::chrono::seconds{10});

  filler->SetFail(true);
  queue.QueueUpdate(BufferFromString("doc"), "x", StringValue("1"));

  bool threw = false;
  try {
    queue.Flush();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(flushes.Count() == 0);
  assert(queue.PendingCount() == 0);

  // the queue keeps working once the filler recovers
  filler->SetFail(false);
  queue.QueueUpdate(nullptr, "x", StringValue("2"));
  queue.Flush();
  assert(flushes.Count() == 1);
}

void TestInvalidUpdatesAreRejected() {
  Flushes          flushes;
  FieldUpdateQueue queue(std::make_shared<RecordingFiller>(), flushes.Callback(), std::chrono::seconds{10});

  bool no_buffer = false;
  try {
    queue.QueueUpdate(nullptr, "x", StringValue("1"));
  } catch (const draft::util::InvalidArgument&) {
    no_buffer = true;
  }
  assert(no_buffer);

  bool no_name = false;
  try {
    queue.QueueUpdate(BufferFromString("doc"), "", StringValue("1"));
  } catch (const draft::util::InvalidArgument&) {
    no_name = true;
  }
  assert(no_name);
  assert(queue.PendingCount() == 0);

  bool no_filler = false;
  try {
    FieldUpdateQueue broken(nullptr, flushes.Callback());
  } catch (const std::invalid_argument&) {
    no_filler = true;
  }
  assert(no_filler);
}

void TestCallbackCannotReenterFlush() {
  auto              filler = std::make_shared<RecordingFiller>();
  FieldUpdateQueue* self   = nullptr;
  std::atomic<int>  calls{0};
  std::atomic<bool> reentry_rejected{false};

  FieldUpdateQueue queue(
      filler,
      [&](const std::shared_ptr<arrow::Buffer>&, const FieldValues&) {
        if (calls.fetch_add(1) > 0) return;
        try {
          self->Flush();
        } catch (const draft::util::InvalidState&) {
          reentry_rejected = true;
        }
        // queueing from the callback is allowed and lands in the next batch
        self->QueueUpdate(nullptr, "y", StringValue("2"));
      },
      std::chrono::seconds{10});
  self = &queue;

  queue.QueueUpdate(BufferFromString("doc"), "x", StringValue("1"));
  queue.Flush();
  assert(reentry_rejected);
  assert(calls == 1);
  assert(queue.PendingCount() == 1);

  // the guard is cleared once the callback returns
  queue.Flush();
  assert(calls == 2);
  assert(queue.PendingCount() == 0);
}

void TestDestructionDropsPendingUpdates() {
  auto    filler = std::make_shared<RecordingFiller>();
  Flushes flushes;
  {
    FieldUpdateQueue queue(filler, flushes.Callback(), std::chrono::seconds{10});
    queue.QueueUpdate(BufferFromString("doc"), "x", StringValue("1"));
  }
  assert(flushes.Count() == 0);
  assert(filler->Sources().empty());
}

} // namespace

int main() {
  TestDebounceCoalescesUpdates();
  TestFlushDrainsImmediately();
  TestFilledBufferBecomesLiveBuffer();
  TestFillerErrorsPropagateFromFlush();
  TestInvalidUpdatesAreRejected();
  TestCallbackCannotReenterFlush();
  TestDestructionDropsPendingUpdates();

  std::cout << "draft_manager_unit_field_update_queue: pass\n";
  return 0;
}
