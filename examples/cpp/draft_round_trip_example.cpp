#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/updates/field_update_queue.hpp"
#include "internal/util/buffer.hpp"

namespace {

// Stand-in for a real PDF form library: appends the values as a trailer
// comment so every fill produces a distinct, still-PDF-looking buffer.
class TrailerFieldFiller final : public draft::updates::FieldFiller {
 public:
  std::shared_ptr<arrow::Buffer> Fill(const arrow::Buffer& source, const draft::model::FieldValues& values) override {
    std::string out(reinterpret_cast<const char*>(source.data()), static_cast<size_t>(source.size()));
    out += "\n% fields " + draft::model::ToJson(values) + "\n";
    return draft::util::BufferFromString(out);
  }
};

std::string SamplePdf() {
  return "%PDF-1.7\n1 0 obj << /Type /Catalog >> endobj\ntrailer << /Root 1 0 R >>\n%%EOF\n";
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config path; defaults run on the memory backend.
  draft::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    config = draft::config::ConfigLoader::LoadFromYaml(argv[1]);
  } else {
    config.mutable_database()->mutable_memory();
    config.mutable_mirror()->set_disabled(true);
  }

  draft::observability::InitializeLogging(config);

  auto app    = draft::factory::Build(config);
  auto engine = app.engine;

  const std::string document_id = "example-contract";

  auto original = draft::util::BufferFromString(SamplePdf());
  if (!draft::util::IsValidPdfBuffer(original)) {
    std::cerr << "sample buffer is not a PDF\n";
    return 1;
  }

  draft::model::FieldValues initial;
  (*initial.mutable_fields())["buyer_name"] = draft::model::StringValue("Ada");
  auto saved = engine->SaveDraft(document_id, original, initial);
  std::cout << "saved version " << saved.version << " checksum " << saved.checksum.value_or("-") << '\n';

  // Coalesce a burst of edits into one regeneration, then persist it.
  {
    draft::updates::FieldUpdateQueue queue(
        std::make_shared<TrailerFieldFiller>(),
        [&](const std::shared_ptr<arrow::Buffer>& updated, const draft::model::FieldValues& flushed) {
          auto merged = engine->GetFieldValues(document_id).value_or(draft::model::FieldValues{});
          for (const auto& [name, value] : flushed.fields()) {
            (*merged.mutable_fields())[name] = value;
          }
          auto next = engine->SaveDraft(document_id, updated, merged);
          std::cout << "flushed " << flushed.fields_size() << " field(s) into version " << next.version << '\n';
        },
        app.update_debounce);

    auto live = engine->LoadDraft(document_id);
    queue.QueueUpdate(live, "buyer_name", draft::model::StringValue("Ada Lovelace"));
    queue.QueueUpdate(nullptr, "vin", draft::model::StringValue("1HGCM82633A004352"));
    queue.QueueUpdate(nullptr, "financed", draft::model::BoolValue(true));
    queue.Flush();
  }

  for (const auto& version : engine->GetVersionHistory(document_id)) {
    std::cout << "history v" << version.version << " " << version.size_bytes << " bytes\n";
  }
  for (const auto& change : engine->GetChangeHistory(document_id)) {
    std::cout << "change " << change.field_name << " -> " << draft::model::ToJson(change.new_value) << '\n';
  }

  engine->MarkFinalizing(document_id);
  engine->MarkFinalized(document_id);

  auto reloaded = engine->LoadDraft(document_id);
  if (!reloaded || !draft::util::IsValidPdfBuffer(reloaded)) {
    std::cerr << "finalized draft could not be reloaded\n";
    return 1;
  }

  const auto stats = engine->GetStorageStats();
  std::cout << "drafts=" << stats.draft_count << " versions=" << stats.version_count << " bytes=" << stats.total_size_bytes
            << " cache_bytes=" << stats.cache_bytes << '\n';

  draft::observability::ShutdownLogging();
  return 0;
}
