#include "internal/tts/synthesis_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using chunkscribe::tts::SpeechSynthesisService;
using chunkscribe::testing::FakeSynthesizer;
using chunkscribe::testing::Near;

struct Fixture {
  std::shared_ptr<chunkscribe::cache::ArtifactCache> cache;
  std::shared_ptr<FakeSynthesizer>                   synthesizer = std::make_shared<FakeSynthesizer>();
  std::shared_ptr<SpeechSynthesisService>            service;

  Fixture() {
    cache = std::make_shared<chunkscribe::cache::ArtifactCache>(std::make_shared<chunkscribe::db::memory::MemoryRepository>(),
                                                                std::make_shared<chunkscribe::storage::RamBlobStore>(), chunkscribe::cache::CachePolicy{});

    chunkscribe::runtime::config::TextToSpeechConfig config;
    config.set_model("tts-1");
    config.set_default_voice("alloy");
    config.set_default_format("mp3");
    config.set_timeout_ms(1'000);
    service = std::make_shared<SpeechSynthesisService>(cache, synthesizer, config);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRepeatedRequestIsServedFromCache() {
  Fixture f;

  const auto first = f.service->Synthesize("Tell me about yourself.", "", "");
  assert(!first.was_cached);
  assert(first.entry.kind == "tts");
  assert(first.entry.content_type == "audio/mpeg");
  assert(Near(first.entry.duration_seconds, 1.6));

  const auto second = f.service->Synthesize("Tell me about yourself.", "alloy", "mp3");
  assert(second.was_cached);
  assert(second.entry.key == first.entry.key);
  assert(f.synthesizer->Calls() == 1);

  const auto stored = f.cache->Read(first.entry.key);
  assert(stored.data->ToString() == "audio:alloy:mp3:Tell me about yourself.");
}

void TestEveryInputChangesTheKey() {
  Fixture f;

  const auto base   = f.service->Synthesize("Question one", "alloy", "mp3");
  const auto voice  = f.service->Synthesize("Question one", "echo", "mp3");
  const auto format = f.service->Synthesize("Question one", "alloy", "wav");
  const auto text   = f.service->Synthesize("Question two", "alloy", "mp3");

  assert(base.entry.key != voice.entry.key);
  assert(base.entry.key != format.entry.key);
  assert(base.entry.key != text.entry.key);
  assert(format.entry.content_type == "audio/wav");
  assert(f.synthesizer->Calls() == 4);
}

void TestInvalidRequestsNeverReachTheProvider() {
  Fixture f;
  using chunkscribe::util::ValidationError;

  assert(Throws<ValidationError>([&] { f.service->Synthesize("", "", ""); }));
  assert(Throws<ValidationError>([&] { f.service->Synthesize("   \n", "", ""); }));
  assert(Throws<ValidationError>([&] { f.service->Synthesize(std::string(chunkscribe::tts::kMaxSynthesisTextLength + 1, 'a'), "", ""); }));
  assert(Throws<ValidationError>([&] { f.service->Synthesize("hello", std::string(65, 'v'), ""); }));
  assert(Throws<ValidationError>([&] { f.service->Synthesize("hello", "", "xyz"); }));

  assert(f.synthesizer->Calls() == 0);
}

void TestProviderFailureIsNotCached() {
  Fixture f;
  f.synthesizer->SetFailing(true);

  assert(Throws<std::runtime_error>([&] { f.service->Synthesize("hello", "", ""); }));
  assert(f.cache->Stats().entries == 0);

  f.synthesizer->SetFailing(false);
  const auto retry = f.service->Synthesize("hello", "", "");
  assert(!retry.was_cached);
  assert(f.synthesizer->Calls() == 2);
}

void TestDurationEstimate() {
  assert(SpeechSynthesisService::EstimateDurationSeconds("") == 1.0);
  assert(SpeechSynthesisService::EstimateDurationSeconds("one") == 1.0);

  std::string words;
  for (int i = 0; i < 300; ++i) words += "word ";
  assert(Near(SpeechSynthesisService::EstimateDurationSeconds(words), 120.0));
}

void TestContentTypes() {
  assert(SpeechSynthesisService::ContentTypeFor("mp3") == "audio/mpeg");
  assert(SpeechSynthesisService::ContentTypeFor("opus") == "audio/opus");
  assert(SpeechSynthesisService::ContentTypeFor("flac") == "audio/flac");
  assert(SpeechSynthesisService::ContentTypeFor("ogg").empty());
}

} // namespace

int main() {
  TestRepeatedRequestIsServedFromCache();
  TestEveryInputChangesTheKey();
  TestInvalidRequestsNeverReachTheProvider();
  TestProviderFailureIsNotCached();
  TestDurationEstimate();
  TestContentTypes();

  std::cout << "chunkscribe_unit_synthesis_service: pass\n";
  return 0;
}
