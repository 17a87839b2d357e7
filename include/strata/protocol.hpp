#pragma once

// strata/protocol.hpp — NDJSON wire frames (version::PROTOCOL_FRAMING_VERSION).
//
// Outbound, one line per frame:
//   {"invocation":{"issuer","command","subject","args","nonce"?},
//    "authorization":{"access":["job:<ref>"]}}
//
// Inbound:
//   {"the":"task/return","of":"job:<ref>","is":{"ok":...}|{"error":{...}}}
//   {"the":"deliver","streamId":<space>,"epoch":N,"docs":[...]}
//
// The correlation id of an invocation is "job:" + BLAKE3("job:" domain,
// canonical invocation). Two identical invocations share an id, which is what
// lets the session coalesce duplicate queries. Transactions and hellos carry
// a nonce so they never coalesce.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "strata/jsonlite.hpp"
#include "strata/revision.hpp"
#include "strata/types.hpp"

namespace strata::protocol {

inline constexpr const char* kHello = "hello";
inline constexpr const char* kSubscribe = "subscribe";
inline constexpr const char* kGet = "get";
inline constexpr const char* kTransact = "tx";
inline constexpr const char* kAck = "ack";

inline constexpr const char* kCommitThe = "application/commit+json";

struct Invocation {
  std::string issuer;
  std::string command;
  std::string subject;
  jsonlite::Object args;
  uint64_t nonce{0};

  jsonlite::Object to_object() const;
};

// "job:<64 hex>".
std::string invocation_ref(const Invocation& invocation);

// Envelope line without the trailing newline.
std::string encode_frame(const Invocation& invocation);
Result<Invocation> decode_invocation(const std::string& line);

// ---------------------------------------------------------------------------
// Command arguments
// ---------------------------------------------------------------------------

jsonlite::Object hello_args(const std::string& client_id, int64_t since_sequence);
jsonlite::Object query_args(const std::string& consumer_id, const jsonlite::Object& query);
jsonlite::Object transact_args(const std::string& client_tx_id,
                               const std::vector<Revision>& writes);
jsonlite::Object ack_args(const std::string& stream_id, uint64_t epoch);

// ---------------------------------------------------------------------------
// Inbound frames
// ---------------------------------------------------------------------------

struct TaskReturn {
  std::string job;
  std::optional<jsonlite::Value> ok;
  std::optional<Error> error;
};

struct DeliverDoc {
  std::string doc_id;  // "of/the"
  std::string kind;    // "snapshot" | "delta"
  Revision revision;
  int64_t version{kUnclaimedSince};
};

struct Deliver {
  std::string stream_id;
  uint64_t epoch{0};
  std::vector<DeliverDoc> docs;
};

using Inbound = std::variant<TaskReturn, Deliver>;

Result<Inbound> decode_frame(const std::string& line);

std::string encode_task_return(const std::string& job, const jsonlite::Value& ok);
std::string encode_task_error(const std::string& job, const Error& error);
std::string encode_deliver(const Deliver& deliver);

// ---------------------------------------------------------------------------
// Typed responses
// ---------------------------------------------------------------------------

// Query ok: {"revisions":[archive...]}.
Result<std::vector<Revision>> decode_query_result(const jsonlite::Value& ok);
jsonlite::Object encode_query_result(const std::vector<Revision>& revisions);

// Transaction ok: {"since":N,"commit":archive,"rejected":["of/the"...]}.
Result<Commit> decode_commit(const jsonlite::Value& ok);
jsonlite::Object encode_commit(const Commit& commit);

// Error: {"name":"ConflictError","message":"...","refs":["of/the"...]}.
Error decode_error(const jsonlite::Value& error);
jsonlite::Object encode_error(const Error& error);

}  // namespace strata::protocol
