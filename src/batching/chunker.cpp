#include <clearhouse/batching/chunker.hpp>

#include <spdlog/spdlog.h>

using namespace clearhouse::schema;

namespace clearhouse::batching {

chunker::chunker(grouper& grouper, chunking_policy_t policy)
    : grouper_{grouper}, policy_{policy} {}

bool chunker::due(const lane& l, const timestamp_milliseconds_t now) const {
  if (l.size() >= policy_.max_chunk_size) {
    return true;
  }
  auto oldest = l.oldest_arrival();
  return oldest && now >= *oldest && (now - *oldest) >= policy_.batch_timeout;
}

std::vector<std::shared_ptr<lane>> chunker::due_lanes(
    const timestamp_milliseconds_t now) const {
  auto result = std::vector<std::shared_ptr<lane>>{};
  for (auto& l : grouper_.lanes()) {
    if (due(*l, now)) {
      result.push_back(std::move(l));
    }
  }
  return result;
}

std::optional<chunk_t> chunker::form(lane& l,
                                     const timestamp_milliseconds_t now,
                                     const bool force) {
  if (!force && !due(l, now)) {
    return std::nullopt;
  }
  auto chunk = l.take(policy_.max_chunk_size, now);
  if (!chunk) {
    return std::nullopt;
  }
  grouper_.release(chunk->members.size());
  spdlog::info("formed chunk {}#{} with {} members", to_string(chunk->lane),
               chunk->sequence, chunk->members.size());
  return chunk;
}

void chunker::requeue(lane& l, std::vector<transaction_intent_t> intents) {
  if (intents.empty()) {
    return;
  }
  grouper_.restore(intents.size());
  spdlog::warn("requeued {} intents at the head of lane {}", intents.size(),
               to_string(l.key()));
  l.requeue_front(std::move(intents));
}

}  // namespace clearhouse::batching
