#pragma once

#include <clearhouse/batching/grouper.hpp>
#include <clearhouse/batching/lane.hpp>
#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace clearhouse::batching {

struct chunking_policy_t final {
  size_t max_chunk_size{1000};
  clearhouse::schema::duration_milliseconds_t batch_timeout{5000};
};

/// Size-or-timeout trigger that slices lanes into chunks.
class chunker final {
 public:
  chunker(grouper& grouper, chunking_policy_t policy);

  /// True when the lane holds a full chunk or its oldest member has waited
  /// at least the batch timeout.
  bool due(const lane& l, clearhouse::schema::timestamp_milliseconds_t now)
      const;

  /// Lanes that are due at `now`, in key order.
  std::vector<std::shared_ptr<lane>> due_lanes(
      clearhouse::schema::timestamp_milliseconds_t now) const;

  /// Take the lane's next chunk if it is due (or at all, with `force`).
  std::optional<clearhouse::schema::chunk_t> form(
      lane& l,
      clearhouse::schema::timestamp_milliseconds_t now,
      bool force = false);

  /// Return members of a processed chunk to the head of their lane.
  void requeue(lane& l,
               std::vector<clearhouse::schema::transaction_intent_t> intents);

  const chunking_policy_t& policy() const { return policy_; }

 private:
  grouper& grouper_;
  chunking_policy_t policy_;
};

}  // namespace clearhouse::batching
