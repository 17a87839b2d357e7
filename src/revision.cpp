#include "strata/revision.hpp"

#include "strata/hash.hpp"

namespace strata {

namespace {

jsonlite::Object fact_body(const Revision& r) {
  jsonlite::Object o;
  o["the"] = r.the;
  o["of"] = r.of;
  if (r.is) o["is"] = *r.is;
  if (r.cause) o["cause"] = *r.cause;
  return o;
}

}  // namespace

std::optional<Address> parse_address_key(const std::string& key) {
  const auto slash = key.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= key.size()) {
    return std::nullopt;
  }
  return Address{key.substr(slash + 1), key.substr(0, slash)};
}

Revision unclaimed_revision(const Address& address) {
  Revision r;
  r.the = address.the;
  r.of = address.of;
  r.since = kUnclaimedSince;
  return r;
}

std::string reference(const Revision& revision) {
  return fact_hash(jsonlite::to_json(fact_body(revision)));
}

std::string genesis_reference(const Address& address) {
  return reference(unclaimed_revision(address));
}

Result<Unit> validate_revision(const Revision& revision) {
  if (revision.the.empty() || revision.of.empty()) {
    return make_error(ErrorCode::invalid_revision, "revision has an empty address",
                      {revision.key()});
  }
  if (revision.of.find('/') != std::string::npos) {
    return make_error(ErrorCode::invalid_revision, "entity reference contains '/'",
                      {revision.key()});
  }
  if (revision.is && !revision.cause) {
    return make_error(ErrorCode::invalid_revision, "asserted value without cause",
                      {revision.key()});
  }
  if (revision.cause && !valid_digest(*revision.cause)) {
    return make_error(ErrorCode::invalid_revision, "cause is not a content reference",
                      {revision.key()});
  }
  return Unit{};
}

const Revision* reconcile(const Revision* existing, const Revision* incoming) {
  if (!existing) return incoming;
  if (!incoming) return existing;
  return incoming->since > existing->since ? incoming : existing;
}

const Address& intent_address(const Intent& intent) {
  if (const auto* a = std::get_if<Assert>(&intent)) return a->address;
  return std::get<Retract>(intent).address;
}

std::optional<Revision> build_revision(const Revision* current, const Intent& intent) {
  if (const auto* a = std::get_if<Assert>(&intent)) {
    Revision r;
    r.the = a->address.the;
    r.of = a->address.of;
    r.is = a->value;
    // An unclaimed current carries nothing to chain on: fall back to genesis.
    r.cause = (current && current->cause) ? reference(*current)
                                          : genesis_reference(a->address);
    return r;
  }

  const auto& retract = std::get<Retract>(intent);
  if (!current || !current->is) return std::nullopt;
  Revision r;
  r.the = retract.address.the;
  r.of = retract.address.of;
  r.cause = reference(*current);
  return r;
}

jsonlite::Object revision_to_archive(const Revision& revision) {
  auto o = fact_body(revision);
  o["since"] = jsonlite::Value{static_cast<std::int64_t>(revision.since)};
  return o;
}

std::string revision_to_json(const Revision& revision) {
  return jsonlite::to_json(revision_to_archive(revision));
}

Result<Revision> revision_from_archive(const jsonlite::Value& archive) {
  const auto* o = jsonlite::as_object(archive);
  if (!o) return make_error(ErrorCode::protocol_error, "revision archive is not an object");

  Revision r;
  r.the = jsonlite::get_string(*o, "the");
  r.of = jsonlite::get_string(*o, "of");
  if (r.the.empty() || r.of.empty()) {
    return make_error(ErrorCode::protocol_error, "revision archive lacks the/of");
  }
  if (const auto* is = jsonlite::find(*o, "is")) r.is = *is;
  if (const auto* cause = jsonlite::find(*o, "cause")) {
    if (!cause->is_string()) {
      return make_error(ErrorCode::protocol_error, "revision cause is not a string", {r.key()});
    }
    r.cause = std::get<std::string>(cause->v);
  }
  r.since = jsonlite::get_i64(*o, "since", kUnclaimedSince);

  auto valid = validate_revision(r);
  if (!valid) return valid.error();
  return r;
}

}  // namespace strata
