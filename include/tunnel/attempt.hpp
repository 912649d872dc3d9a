#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hookrelay {

// Ordered, case-preserving header list. Duplicates are kept.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

enum class ErrorClass { None, Connect, Timeout, Read, LocalNonHttp };

std::string_view to_string(ErrorClass error_class);
std::optional<ErrorClass> error_class_from_string(std::string_view value);

struct InboundAttempt {
  std::string attempt_id;
  std::string connection_id;
  std::string method{"POST"};
  std::string path{"/"};
  // Raw query without the leading '?'.
  std::string query;
  HeaderList headers;
  std::string body;
  std::string requested_at;
  int attempt_number{1};
  // Remote event id, used for retry/open from the UI.
  std::string event_id;
  // Per-attempt local timeout requested by the dispatcher, if any.
  std::optional<int> timeout_ms;
};

struct AttemptResult {
  std::string attempt_id;
  // Echo of the inbound path; the dispatcher correlates on it.
  std::string path;
  std::optional<int> status;
  HeaderList headers;
  std::string body;
  bool truncated{false};
  ErrorClass error_class{ErrorClass::None};
  std::string reason;
  std::chrono::milliseconds elapsed{0};
  // Milliseconds since the Unix epoch.
  std::int64_t finished_at_ms{0};

  bool ok() const { return error_class == ErrorClass::None; }
};

} // namespace hookrelay
