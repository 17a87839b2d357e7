#pragma once

// strata/revision.hpp — Addresses, revisions and the causal chain between them.
//
// A Revision moves through three states at one address:
//   unclaimed  (is absent, cause absent)  "the remote had nothing here"
//   asserted   (is present, cause present)
//   retracted  (is absent, cause present)
//
// INVARIANTS:
//   - reference(r) covers {the, of, is?, cause?}. since is excluded: the remote
//     assigns it after the client has already chained on the reference.
//   - Every assertion names a cause. The first assertion at an address names
//     the genesis reference (reference of the unclaimed revision).
//   - reconcile() is the only ordering rule: strictly greater since wins, ties
//     keep what is already held.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "strata/jsonlite.hpp"
#include "strata/types.hpp"

namespace strata {

struct Address {
  std::string the;  // attribute kind, e.g. "application/json"
  std::string of;   // entity reference

  // Stable map key "of/the".
  std::string key() const { return of + "/" + the; }

  bool operator==(const Address& o) const { return the == o.the && of == o.of; }
  bool operator<(const Address& o) const { return key() < o.key(); }
};

// Splits "of/the" at the first '/'. Entity references never contain '/';
// attribute kinds usually do.
std::optional<Address> parse_address_key(const std::string& key);

constexpr std::int64_t kUnclaimedSince = -1;

struct Revision {
  std::string the;
  std::string of;
  std::optional<jsonlite::Value> is;
  std::optional<std::string> cause;
  std::int64_t since{kUnclaimedSince};

  Address address() const { return Address{the, of}; }
  std::string key() const { return of + "/" + the; }
  bool unclaimed() const { return !is && !cause; }
  bool retracted() const { return !is && cause.has_value(); }
};

using RevisionMap = std::map<std::string, Revision>;

Revision unclaimed_revision(const Address& address);

// Content hash of a revision (BLAKE3, "fact:" domain).
std::string reference(const Revision& revision);

// Cause named by the first assertion at an address.
std::string genesis_reference(const Address& address);

Result<Unit> validate_revision(const Revision& revision);

// Merge policy. Returns the winner: the present side when one is null,
// otherwise incoming only when its since is strictly greater.
const Revision* reconcile(const Revision* existing, const Revision* incoming);
using ReconcileFn = const Revision* (*)(const Revision*, const Revision*);

// ---------------------------------------------------------------------------
// Intents
// ---------------------------------------------------------------------------

struct Assert {
  Address address;
  jsonlite::Value value;
};

struct Retract {
  Address address;
};

using Intent = std::variant<Assert, Retract>;

const Address& intent_address(const Intent& intent);

// Pure causal-chain construction. current is whatever the caller reads at the
// address (nursery overlay first, then heap), or null when nothing is known.
// Returns nullopt when the intent is a no-op (retracting an absent value).
std::optional<Revision> build_revision(const Revision* current, const Intent& intent);

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

struct Commit {
  std::int64_t since{kUnclaimedSince};
  // Commit-log head after the transaction.
  std::optional<Revision> head;
  // Revisions promoted to the heap, since assigned.
  std::vector<Revision> revisions;
  // Address keys the remote refused inside an otherwise accepted transaction.
  std::vector<std::string> rejected;
};

// ---------------------------------------------------------------------------
// Archive codec {the, of, is?, cause?, since}
// ---------------------------------------------------------------------------

jsonlite::Object revision_to_archive(const Revision& revision);
std::string revision_to_json(const Revision& revision);
Result<Revision> revision_from_archive(const jsonlite::Value& archive);

}  // namespace strata
