#include <clearhouse/optimizer/fallback_assigner.hpp>

#include <spdlog/spdlog.h>

#include <map>
#include <string>
#include <tuple>

using namespace clearhouse::schema;

namespace clearhouse::optimizer {

std::vector<batch_t> assign_fallback(const chunk_t& chunk,
                                     const pricing_t& pricing,
                                     const limits_t& limits) {
  auto split = split_feasible(chunk, limits);

  using group_key_t = std::tuple<counterparty_id_t, std::string, std::string>;
  auto group_index = std::map<group_key_t, size_t>{};
  auto groups = std::vector<std::vector<size_t>>{};
  for (const auto index : split.feasible) {
    const auto& intent = chunk.members[index];
    auto key = group_key_t{intent.counterparty_id, intent.currencies.source,
                           intent.currencies.destination};
    auto [it, inserted] = group_index.try_emplace(key, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[it->second].push_back(index);
  }

  auto batches = std::vector<std::vector<size_t>>{};
  auto open = std::vector<size_t>{};
  auto exposure = std::map<counterparty_id_t, cost_t>{};
  auto close = [&] {
    if (!open.empty()) {
      batches.push_back(std::move(open));
      open.clear();
      exposure.clear();
    }
  };

  for (const auto& group : groups) {
    for (const auto index : group) {
      const auto& intent = chunk.members[index];
      auto cap = exposure_cap(limits, intent.counterparty_id);
      auto amount = major_amount(intent);
      auto over_size = open.size() >= limits.max_batch_size;
      auto over_exposure =
          cap && (exposure[intent.counterparty_id] + amount) > *cap;
      if (over_size || over_exposure) {
        close();
      }
      exposure[intent.counterparty_id] += amount;
      open.push_back(index);
    }
  }
  close();

  spdlog::debug("fallback assigned chunk {}#{} into {} batches ({} infeasible)",
                to_string(chunk.lane), chunk.sequence, batches.size(),
                split.infeasible.size());
  return assemble(chunk, std::move(batches), batch_status_t::fallback, split,
                  pricing);
}

}  // namespace clearhouse::optimizer
