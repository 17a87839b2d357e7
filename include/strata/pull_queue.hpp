#pragma once

// strata/pull_queue.hpp — Addresses waiting for the next background pull.

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "strata/selector.hpp"

namespace strata {

class PullQueue {
 public:
  void add(const std::vector<LoadEntry>& entries) {
    for (const auto& e : entries) entries_.emplace(e.dedup_key(), e);
  }

  // Drains the queue.
  std::vector<LoadEntry> consume() {
    std::vector<LoadEntry> out;
    out.reserve(entries_.size());
    for (auto& [key, e] : entries_) out.push_back(std::move(e));
    entries_.clear();
    return out;
  }

  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }

 private:
  std::map<std::string, LoadEntry> entries_;
};

}  // namespace strata
