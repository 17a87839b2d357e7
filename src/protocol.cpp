#include "strata/protocol.hpp"

#include "strata/hash.hpp"
#include "strata/version.hpp"

namespace strata::protocol {

namespace {

jsonlite::Array string_array(const std::vector<std::string>& items) {
  jsonlite::Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

Result<DeliverDoc> decode_doc(const jsonlite::Value& v) {
  const auto* o = jsonlite::as_object(v);
  if (!o) return make_error(ErrorCode::protocol_error, "deliver doc is not an object");
  DeliverDoc doc;
  doc.doc_id = jsonlite::get_string(*o, "docId");
  doc.kind = jsonlite::get_string(*o, "kind", "snapshot");
  if (doc.kind != "snapshot" && doc.kind != "delta") {
    return make_error(ErrorCode::protocol_error, "deliver doc kind '" + doc.kind + "'");
  }
  const auto* body = jsonlite::find(*o, "body");
  if (!body) return make_error(ErrorCode::protocol_error, "deliver doc without body");
  auto rev = revision_from_archive(*body);
  if (!rev) return rev.error();
  doc.revision = std::move(rev.value());
  doc.version = jsonlite::get_i64(*o, "version", doc.revision.since);
  // version is authoritative for ordering; the archive may omit since.
  doc.revision.since = doc.version;
  if (doc.doc_id.empty()) doc.doc_id = doc.revision.key();
  if (doc.doc_id != doc.revision.key()) {
    return make_error(ErrorCode::protocol_error, "deliver docId does not match body",
                      {doc.doc_id});
  }
  return doc;
}

}  // namespace

jsonlite::Object Invocation::to_object() const {
  jsonlite::Object o;
  o["issuer"] = issuer;
  o["command"] = command;
  o["subject"] = subject;
  o["args"] = args;
  if (nonce != 0) o["nonce"] = static_cast<std::uint64_t>(nonce);
  return o;
}

std::string invocation_ref(const Invocation& invocation) {
  return "job:" + invocation_hash(jsonlite::to_json(invocation.to_object()));
}

std::string encode_frame(const Invocation& invocation) {
  jsonlite::Object auth;
  auth["access"] = jsonlite::Array{jsonlite::Value{invocation_ref(invocation)}};
  jsonlite::Object envelope;
  envelope["invocation"] = invocation.to_object();
  envelope["authorization"] = std::move(auth);
  return jsonlite::to_json(envelope);
}

Result<Invocation> decode_invocation(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto envelope = jsonlite::parse(line, &err);
  if (err) return make_error(ErrorCode::protocol_error, "frame: " + err->message);
  const auto* inv = jsonlite::get_object(envelope, "invocation");
  if (!inv) return make_error(ErrorCode::protocol_error, "frame without invocation");

  Invocation out;
  out.issuer = jsonlite::get_string(*inv, "issuer");
  out.command = jsonlite::get_string(*inv, "command");
  out.subject = jsonlite::get_string(*inv, "subject");
  out.nonce = jsonlite::get_u64(*inv, "nonce", 0);
  if (const auto* args = jsonlite::get_object(*inv, "args")) out.args = *args;
  if (out.command.empty()) return make_error(ErrorCode::protocol_error, "invocation without command");
  return out;
}

jsonlite::Object hello_args(const std::string& client_id, int64_t since_sequence) {
  jsonlite::Object a;
  a["clientId"] = client_id;
  a["sinceSequence"] = jsonlite::Value{static_cast<std::int64_t>(since_sequence)};
  a["protocol"] = static_cast<std::uint64_t>(version::PROTOCOL_FRAMING_VERSION);
  return a;
}

jsonlite::Object query_args(const std::string& consumer_id, const jsonlite::Object& query) {
  jsonlite::Object a;
  a["consumerId"] = consumer_id;
  a["query"] = query;
  return a;
}

jsonlite::Object transact_args(const std::string& client_tx_id,
                               const std::vector<Revision>& writes) {
  jsonlite::Array ws;
  for (const auto& r : writes) {
    jsonlite::Object w;
    w["ref"] = r.key();
    jsonlite::Array heads;
    if (r.cause) heads.emplace_back(*r.cause);
    w["baseHeads"] = std::move(heads);
    jsonlite::Object changes;
    if (r.is) changes["is"] = *r.is;
    else changes["retract"] = true;
    w["changes"] = std::move(changes);
    w["allowServerMerge"] = false;
    ws.emplace_back(std::move(w));
  }
  jsonlite::Object a;
  a["clientTxId"] = client_tx_id;
  a["reads"] = jsonlite::Array{};
  a["writes"] = std::move(ws);
  return a;
}

jsonlite::Object ack_args(const std::string& stream_id, uint64_t epoch) {
  jsonlite::Object a;
  a["streamId"] = stream_id;
  a["epoch"] = static_cast<std::uint64_t>(epoch);
  return a;
}

Result<Inbound> decode_frame(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto frame = jsonlite::parse(line, &err);
  if (err) return make_error(ErrorCode::protocol_error, "frame: " + err->message);

  const std::string the = jsonlite::get_string(frame, "the");
  if (the == "task/return") {
    TaskReturn tr;
    tr.job = jsonlite::get_string(frame, "of");
    if (tr.job.rfind("job:", 0) != 0) {
      return make_error(ErrorCode::protocol_error, "task/return without job reference");
    }
    const auto* is = jsonlite::get_object(frame, "is");
    if (!is) return make_error(ErrorCode::protocol_error, "task/return without result");
    if (const auto* ok = jsonlite::find(*is, "ok")) {
      tr.ok = *ok;
    } else if (const auto* e = jsonlite::find(*is, "error")) {
      tr.error = decode_error(*e);
    } else {
      return make_error(ErrorCode::protocol_error, "task/return result is neither ok nor error");
    }
    return Inbound{std::move(tr)};
  }

  if (the == "deliver") {
    Deliver d;
    d.stream_id = jsonlite::get_string(frame, "streamId");
    d.epoch = jsonlite::get_u64(frame, "epoch", 0);
    if (const auto* docs = jsonlite::get_array(frame, "docs")) {
      for (const auto& v : *docs) {
        auto doc = decode_doc(v);
        if (!doc) return doc.error();
        d.docs.push_back(std::move(doc.value()));
      }
    }
    return Inbound{std::move(d)};
  }

  return make_error(ErrorCode::protocol_error, "unknown frame '" + the + "'");
}

std::string encode_task_return(const std::string& job, const jsonlite::Value& ok) {
  jsonlite::Object is;
  is["ok"] = ok;
  jsonlite::Object frame;
  frame["the"] = "task/return";
  frame["of"] = job;
  frame["is"] = std::move(is);
  return jsonlite::to_json(frame);
}

std::string encode_task_error(const std::string& job, const Error& error) {
  jsonlite::Object is;
  is["error"] = encode_error(error);
  jsonlite::Object frame;
  frame["the"] = "task/return";
  frame["of"] = job;
  frame["is"] = std::move(is);
  return jsonlite::to_json(frame);
}

std::string encode_deliver(const Deliver& deliver) {
  jsonlite::Array docs;
  for (const auto& d : deliver.docs) {
    jsonlite::Object o;
    o["docId"] = d.doc_id.empty() ? d.revision.key() : d.doc_id;
    o["kind"] = d.kind;
    o["body"] = revision_to_archive(d.revision);
    o["version"] = jsonlite::Value{static_cast<std::int64_t>(d.version)};
    docs.emplace_back(std::move(o));
  }
  jsonlite::Object frame;
  frame["the"] = "deliver";
  frame["streamId"] = deliver.stream_id;
  frame["epoch"] = static_cast<std::uint64_t>(deliver.epoch);
  frame["docs"] = std::move(docs);
  return jsonlite::to_json(frame);
}

Result<std::vector<Revision>> decode_query_result(const jsonlite::Value& ok) {
  const auto* o = jsonlite::as_object(ok);
  if (!o) return make_error(ErrorCode::protocol_error, "query result is not an object");
  std::vector<Revision> out;
  const auto* revisions = jsonlite::get_array(*o, "revisions");
  if (!revisions) return out;
  out.reserve(revisions->size());
  for (const auto& v : *revisions) {
    auto r = revision_from_archive(v);
    if (!r) return r.error();
    out.push_back(std::move(r.value()));
  }
  return out;
}

jsonlite::Object encode_query_result(const std::vector<Revision>& revisions) {
  jsonlite::Array arr;
  arr.reserve(revisions.size());
  for (const auto& r : revisions) arr.emplace_back(revision_to_archive(r));
  jsonlite::Object o;
  o["revisions"] = std::move(arr);
  return o;
}

Result<Commit> decode_commit(const jsonlite::Value& ok) {
  const auto* o = jsonlite::as_object(ok);
  if (!o) return make_error(ErrorCode::protocol_error, "commit is not an object");
  Commit c;
  c.since = jsonlite::get_i64(*o, "since", kUnclaimedSince);
  if (c.since < 0) return make_error(ErrorCode::protocol_error, "commit without since");
  if (const auto* head = jsonlite::find(*o, "commit")) {
    auto r = revision_from_archive(*head);
    if (!r) return r.error();
    c.head = std::move(r.value());
  }
  c.rejected = jsonlite::get_string_array(*o, "rejected");
  return c;
}

jsonlite::Object encode_commit(const Commit& commit) {
  jsonlite::Object o;
  o["since"] = jsonlite::Value{static_cast<std::int64_t>(commit.since)};
  if (commit.head) o["commit"] = revision_to_archive(*commit.head);
  if (!commit.rejected.empty()) o["rejected"] = string_array(commit.rejected);
  return o;
}

Error decode_error(const jsonlite::Value& error) {
  const auto* o = jsonlite::as_object(error);
  if (!o) return make_error(ErrorCode::protocol_error, "error is not an object");
  return make_error(error_code_from_name(jsonlite::get_string(*o, "name")),
                    jsonlite::get_string(*o, "message"),
                    jsonlite::get_string_array(*o, "refs"));
}

jsonlite::Object encode_error(const Error& error) {
  jsonlite::Object o;
  const std::string name = wire_name(error.code);
  o["name"] = name.empty() ? std::string("TransactionError") : name;
  o["message"] = error.message;
  if (!error.addresses.empty()) o["refs"] = string_array(error.addresses);
  return o;
}

}  // namespace strata::protocol
