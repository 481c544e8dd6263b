#include "graphsearch/core/search_store.hpp"

#include <functional>
#include <stdexcept>
#include <string>

namespace graphsearch::core {

void SearchStore::reset() noexcept {
  records_.clear();
  open_.clear();
  closed_.clear();
  heap_ = decltype(heap_){};
}

RecordIndex SearchStore::push(SearchRecord rec) {
  auto idx = static_cast<RecordIndex>(records_.size());
  records_.push_back(rec);
  heap_.emplace(rec.rank, idx);
  return idx;
}

RecordIndex SearchStore::open_source(NodeId source, Cost h) {
  auto idx = push(SearchRecord(source, kNoEdge, kNoRecord, 0.0, h));
  closed_.erase(source);
  open_[source] = idx;
  return idx;
}

RecordIndex SearchStore::open_record(NodeId node, EdgeId via_edge, RecordIndex parent,
                                     Cost g, Cost h) {
  if (parent < 0 || static_cast<std::size_t>(parent) >= records_.size()) {
    throw std::out_of_range("SearchStore::open_record: parent " + std::to_string(parent) +
                            " is not a record of this run");
  }
  auto idx = push(SearchRecord(node, via_edge, parent, g, h));
  closed_.erase(node);
  open_[node] = idx;
  return idx;
}

std::optional<RecordIndex> SearchStore::find_open(NodeId node) const {
  auto it = open_.find(node);
  if (it == open_.end()) return std::nullopt;
  return it->second;
}

std::optional<RecordIndex> SearchStore::find_closed(NodeId node) const {
  auto it = closed_.find(node);
  if (it == closed_.end()) return std::nullopt;
  return it->second;
}

std::optional<RecordIndex> SearchStore::peek_best() {
  while (!heap_.empty()) {
    auto idx = heap_.top().second;
    auto it = open_.find(records_[static_cast<std::size_t>(idx)].node);
    if (it != open_.end() && it->second == idx) return idx;
    heap_.pop();  // superseded or already closed
  }
  return std::nullopt;
}

void SearchStore::close(RecordIndex idx) {
  const NodeId node = record(idx).node;
  auto it = open_.find(node);
  if (it == open_.end() || it->second != idx) {
    throw std::logic_error("SearchStore::close: record is not the open record of its node");
  }
  open_.erase(it);
  closed_[node] = idx;
}

} // namespace graphsearch::core
