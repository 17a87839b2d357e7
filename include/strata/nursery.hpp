#pragma once

// strata/nursery.hpp — Optimistic overlay of staged, unconfirmed revisions.
//
// An entry lives from push() staging until its transaction resolves. remove()
// only drops the entry if it is still the one that push staged: a later push
// stacked on the same address owns the slot by then and keeps it.

#include <cstddef>
#include <map>
#include <string>
#include <utility>

#include "strata/revision.hpp"

namespace strata {

class Nursery {
 public:
  const Revision* get(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second.revision;
  }

  bool contains(const std::string& key) const { return entries_.contains(key); }
  std::size_t size() const { return entries_.size(); }

  void put(const Revision& revision) {
    entries_[revision.key()] = Staged{revision, reference(revision)};
  }

  bool remove(const Revision& staged) {
    auto it = entries_.find(staged.key());
    if (it == entries_.end() || it->second.ref != reference(staged)) return false;
    entries_.erase(it);
    return true;
  }

 private:
  struct Staged {
    Revision revision;
    std::string ref;
  };

  std::map<std::string, Staged> entries_;
};

}  // namespace strata
