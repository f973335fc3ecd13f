#include <clearhouse/optimizer/solver.hpp>

#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_dec_float.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <utility>

using namespace clearhouse::schema;

namespace clearhouse::optimizer {

namespace {

using steady_clock_t = std::chrono::steady_clock;

constexpr auto kCheckInterval = uint64_t{1024};
constexpr auto kEpsilon = 1e-9;

struct item_t final {
  size_t index{};
  amount_t amount{};
};

struct bin_t final {
  amount_t sum{};
  uint32_t count{};
};

/// Largest amount in minor units that still satisfies a major-unit cap.
amount_t to_minor_cap(const std::optional<cost_t>& cap,
                      const currency_pair_t& currencies) {
  if (!cap) {
    return std::numeric_limits<amount_t>::max();
  }
  auto currency = find_currency(currencies.source);
  auto scale = cost_t{1};
  for (auto i = 0; currency && i < currency->minor_units; ++i) {
    scale *= 10;
  }
  cost_t scaled = boost::multiprecision::floor(*cap * scale);
  if (scaled >= cost_t{std::numeric_limits<amount_t>::max()}) {
    return std::numeric_limits<amount_t>::max();
  }
  return scaled.convert_to<amount_t>();
}

/// Branch and bound packing of one counterparty's items into wires.
class wire_packer final {
 public:
  wire_packer(std::vector<item_t> items,
              const amount_t cap,
              const uint32_t max_size,
              const double discount,
              const steady_clock_t::time_point deadline,
              const std::stop_token& stop,
              uint64_t& nodes)
      : items_{std::move(items)},
        cap_{cap},
        max_size_{max_size},
        discount_{discount},
        deadline_{deadline},
        stop_{stop},
        nodes_{nodes} {
    std::ranges::stable_sort(items_, std::ranges::greater{}, &item_t::amount);
    assignment_.resize(items_.size());
  }

  /// Returns wires as lists of chunk indices, or the reason the search ended
  /// early.
  std::variant<std::vector<std::vector<size_t>>, solver_failure_reason> run() {
    seed_first_fit_decreasing();
    if (best_value_ > lower_bound(0) + kEpsilon) {
      search(0);
    }
    if (aborted_) {
      return *aborted_;
    }
    auto wires = std::vector<std::vector<size_t>>(best_bins_);
    for (size_t i = 0; i < items_.size(); ++i) {
      wires[best_assignment_[i]].push_back(items_[i].index);
    }
    return wires;
  }

 private:
  double objective(const size_t wires, const size_t consolidated) const {
    return static_cast<double>(wires) -
           (discount_ * static_cast<double>(consolidated));
  }

  double value_of(const std::vector<bin_t>& bins) const {
    auto consolidated = static_cast<size_t>(std::ranges::count_if(
        bins, [](const bin_t& bin) { return bin.count >= 2; }));
    return objective(bins.size(), consolidated);
  }

  /// Cheapest objective any completion of the current partial packing can
  /// reach: at least as many wires as are open or forced by the caps, and
  /// at most floor(n / 2) of them consolidated.
  double lower_bound(const size_t open_bins) const {
    auto n = items_.size();
    auto wires = std::max<size_t>({open_bins, minimum_wires_, 1});
    return objective(wires, std::min(wires, n / 2));
  }

  bool fits(const bin_t& bin, const item_t& item) const {
    return bin.count < max_size_ && item.amount <= cap_ - bin.sum;
  }

  void seed_first_fit_decreasing() {
    auto total = amount_t{};
    for (const auto& item : items_) {
      total += item.amount;
    }
    auto n = items_.size();
    auto by_size = (n + max_size_ - 1) / max_size_;
    auto by_amount = cap_ == std::numeric_limits<amount_t>::max()
                         ? size_t{1}
                         : static_cast<size_t>((total + cap_ - 1) / cap_);
    minimum_wires_ = std::max(by_size, by_amount);

    auto bins = std::vector<bin_t>{};
    for (size_t i = 0; i < n; ++i) {
      auto it = std::ranges::find_if(
          bins, [&](const bin_t& bin) { return fits(bin, items_[i]); });
      if (it == std::end(bins)) {
        bins.push_back(bin_t{});
        it = std::prev(std::end(bins));
      }
      it->sum += items_[i].amount;
      ++it->count;
      best_assignment_.push_back(
          static_cast<size_t>(std::distance(std::begin(bins), it)));
    }
    best_bins_ = bins.size();
    best_value_ = value_of(bins);
  }

  bool should_stop() {
    if (aborted_) {
      return true;
    }
    if ((++nodes_ % kCheckInterval) != 0) {
      return false;
    }
    if (stop_.stop_requested()) {
      aborted_ = solver_failure_reason::cancelled;
    } else if (steady_clock_t::now() >= deadline_) {
      aborted_ = solver_failure_reason::timeout;
    }
    return aborted_.has_value();
  }

  void search(const size_t i) {
    if (should_stop()) {
      return;
    }
    if (i == items_.size()) {
      auto value = value_of(bins_);
      if (value < best_value_ - kEpsilon) {
        best_value_ = value;
        best_bins_ = bins_.size();
        best_assignment_ = assignment_;
      }
      return;
    }
    if (lower_bound(bins_.size()) >= best_value_ - kEpsilon) {
      return;
    }

    const auto& item = items_[i];
    auto tried = std::vector<std::pair<amount_t, uint32_t>>{};
    for (size_t b = 0; b < bins_.size(); ++b) {
      if (!fits(bins_[b], item)) {
        continue;
      }
      // Bins with the same fill are interchangeable.
      auto state = std::pair{bins_[b].sum, bins_[b].count};
      if (std::ranges::find(tried, state) != std::end(tried)) {
        continue;
      }
      tried.push_back(state);
      bins_[b].sum += item.amount;
      ++bins_[b].count;
      assignment_[i] = b;
      search(i + 1);
      bins_[b].sum -= item.amount;
      --bins_[b].count;
      if (aborted_) {
        return;
      }
    }

    if (lower_bound(bins_.size() + 1) >= best_value_ - kEpsilon) {
      return;
    }
    bins_.push_back(bin_t{.sum = item.amount, .count = 1});
    assignment_[i] = bins_.size() - 1;
    search(i + 1);
    bins_.pop_back();
  }

  std::vector<item_t> items_;
  amount_t cap_{};
  uint32_t max_size_{};
  double discount_{};
  steady_clock_t::time_point deadline_;
  const std::stop_token& stop_;
  uint64_t& nodes_;
  size_t minimum_wires_{1};
  std::vector<bin_t> bins_;
  std::vector<size_t> assignment_;
  std::vector<size_t> best_assignment_;
  size_t best_bins_{};
  double best_value_{};
  std::optional<solver_failure_reason> aborted_;
};

struct wire_t final {
  counterparty_id_t counterparty;
  std::vector<size_t> members;
};

/// First-fit-decreasing packing of wires into batches, one wire per
/// counterparty per batch.
std::vector<std::vector<size_t>> pack_wires(std::vector<wire_t> wires,
                                            const uint32_t max_batch_size) {
  std::ranges::sort(wires, [](const wire_t& lhs, const wire_t& rhs) {
    if (lhs.members.size() != rhs.members.size()) {
      return lhs.members.size() > rhs.members.size();
    }
    return lhs.members.front() < rhs.members.front();
  });

  struct open_batch_t final {
    std::vector<size_t> members;
    std::vector<counterparty_id_t> counterparties;
  };
  auto batches = std::vector<open_batch_t>{};
  for (auto& wire : wires) {
    auto it = std::ranges::find_if(batches, [&](const open_batch_t& batch) {
      return batch.members.size() + wire.members.size() <= max_batch_size &&
             std::ranges::find(batch.counterparties, wire.counterparty) ==
                 std::end(batch.counterparties);
    });
    if (it == std::end(batches)) {
      batches.emplace_back();
      it = std::prev(std::end(batches));
    }
    it->members.insert(std::end(it->members), std::begin(wire.members),
                       std::end(wire.members));
    it->counterparties.push_back(std::move(wire.counterparty));
  }

  auto groups = std::vector<std::vector<size_t>>{};
  groups.reserve(batches.size());
  for (auto& batch : batches) {
    groups.push_back(std::move(batch.members));
  }
  return groups;
}

}  // namespace

solver::solver(pricing_t pricing, limits_t limits)
    : pricing_{std::move(pricing)}, limits_{std::move(limits)} {}

solve_result_t solver::solve(const chunk_t& chunk,
                             const std::chrono::milliseconds budget,
                             std::stop_token stop) const {
  if (stop.stop_requested()) {
    return solver_failure{.reason = solver_failure_reason::cancelled,
                          .detail = "cancelled before start"};
  }
  if (limits_.max_batch_size == 0) {
    return solver_failure{.reason = solver_failure_reason::internal,
                          .detail = "max batch size is zero"};
  }
  if (budget <= std::chrono::milliseconds::zero()) {
    return solver_failure{.reason = solver_failure_reason::timeout,
                          .detail = "no solver budget"};
  }
  auto deadline = steady_clock_t::now() + budget;
  auto split = split_feasible(chunk, limits_);

  auto by_counterparty = std::map<counterparty_id_t, std::vector<item_t>>{};
  for (const auto index : split.feasible) {
    const auto& intent = chunk.members[index];
    by_counterparty[intent.counterparty_id].push_back(
        item_t{.index = index, .amount = intent.amount});
  }

  auto discount = pricing_.consolidation_discount.convert_to<double>();
  auto nodes = uint64_t{};
  auto wires = std::vector<wire_t>{};
  for (auto& [counterparty, items] : by_counterparty) {
    auto cap = to_minor_cap(exposure_cap(limits_, counterparty),
                            chunk.lane.currencies);
    auto packer = wire_packer{std::move(items), cap, limits_.max_batch_size,
                              discount, deadline, stop, nodes};
    auto packed = packer.run();
    if (auto* reason = std::get_if<solver_failure_reason>(&packed)) {
      auto detail = *reason == solver_failure_reason::timeout
                        ? "budget of " + std::to_string(budget.count()) +
                              "ms exhausted after " + std::to_string(nodes) +
                              " nodes"
                        : std::string{"stop requested"};
      return solver_failure{.reason = *reason, .detail = std::move(detail)};
    }
    for (auto& members : std::get<std::vector<std::vector<size_t>>>(packed)) {
      wires.push_back(
          wire_t{.counterparty = counterparty, .members = std::move(members)});
    }
  }

  auto groups = pack_wires(std::move(wires), limits_.max_batch_size);
  spdlog::debug("solver packed chunk {}#{} into {} batches after {} nodes",
                to_string(chunk.lane), chunk.sequence, groups.size(), nodes);
  return assemble(chunk, std::move(groups), batch_status_t::optimal, split,
                  pricing_);
}

}  // namespace clearhouse::optimizer
