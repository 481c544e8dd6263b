/* SearchStore — per-run record arena with open and closed node sets. */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

// Index of a record in the store's arena.
using RecordIndex = std::int32_t;
inline constexpr RecordIndex kNoRecord = -1;

// Best-known state of one node during a run. Records are immutable: an
// improvement for the same node is a new record that replaces the old one in
// the open set. parent always refers to an earlier record, so the parent
// chain is acyclic.
struct SearchRecord {
  NodeId node { kNoNode };
  EdgeId via_edge { kNoEdge };       // kNoEdge only for the source record
  RecordIndex parent { kNoRecord };  // kNoRecord only for the source record
  Cost g { 0.0 };                    // Cost from the source
  Cost h { 0.0 };                    // Estimate to the target
  Cost rank { 0.0 };                 // g + h

  SearchRecord() = default;
  SearchRecord(NodeId n, EdgeId e, RecordIndex p, Cost g_cost, Cost h_cost)
      : node(n), via_edge(e), parent(p), g(g_cost), h(h_cost), rank(g_cost + h_cost) {}
};

// SearchStore owns all records of a single run. The open set maps a node to
// its current open record; the closed set maps a node to the record it was
// expanded with. A node is in at most one of the two sets.
//
// Selection returns the open record with minimal rank. Ties are broken by
// record creation order (the earlier record wins), which makes runs
// reproducible for a given graph and cost model.
class SearchStore {
public:
  SearchStore() = default;

  // Drop all records and both sets.
  void reset() noexcept;

  // Create the source record {g=0, h} and put it in the open set.
  RecordIndex open_source(NodeId source, Cost h);

  // Create a record reached from parent over via_edge and make it the open
  // record for node, replacing any previous open record and removing any
  // closed record (re-opening).
  RecordIndex open_record(NodeId node, EdgeId via_edge, RecordIndex parent, Cost g, Cost h);

  [[nodiscard]] std::optional<RecordIndex> find_open(NodeId node) const;
  [[nodiscard]] std::optional<RecordIndex> find_closed(NodeId node) const;

  // Best open record, or std::nullopt if the open set is empty. The record
  // stays open until close() is called.
  [[nodiscard]] std::optional<RecordIndex> peek_best();

  // Move node's open record to the closed set.
  void close(RecordIndex idx);

  [[nodiscard]] const SearchRecord& record(RecordIndex idx) const {
    return records_[static_cast<std::size_t>(idx)];
  }

  [[nodiscard]] bool open_empty() const noexcept { return open_.empty(); }
  [[nodiscard]] std::size_t open_size() const noexcept { return open_.size(); }
  [[nodiscard]] std::size_t closed_size() const noexcept { return closed_.size(); }
  [[nodiscard]] std::size_t record_count() const noexcept { return records_.size(); }

private:
  RecordIndex push(SearchRecord rec);

  std::vector<SearchRecord> records_ {};
  std::unordered_map<NodeId, RecordIndex> open_ {};
  std::unordered_map<NodeId, RecordIndex> closed_ {};

  // Min-heap on (rank, index). Entries whose record is no longer the open
  // record of its node are stale and skipped lazily.
  using QItem = std::pair<Cost, RecordIndex>;
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> heap_ {};
};

} // namespace graphsearch::core
