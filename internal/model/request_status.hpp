#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace songqueue::model {

enum class RequestStatus : std::uint8_t {
  kPending   = 1,
  kPlaying   = 2,
  kCompleted = 3,
  kCancelled = 4,
};

constexpr bool IsTerminal(RequestStatus status) {
  return status == RequestStatus::kCompleted || status == RequestStatus::kCancelled;
}

// Legal playback transitions:
//   pending -> playing | cancelled
//   playing -> completed | cancelled
constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  if (IsTerminal(from) || from == to) {
    return false;
  }
  switch (from) {
    case RequestStatus::kPending:
      return to == RequestStatus::kPlaying || to == RequestStatus::kCancelled;
    case RequestStatus::kPlaying:
      return to == RequestStatus::kCompleted || to == RequestStatus::kCancelled;
    default:
      return false;
  }
}

// A request holds a queue position only while pending.
constexpr bool LeavesPendingSet(RequestStatus from, RequestStatus to) {
  return from == RequestStatus::kPending && to != RequestStatus::kPending;
}

constexpr std::string_view ToString(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      return "pending";
    case RequestStatus::kPlaying:
      return "playing";
    case RequestStatus::kCompleted:
      return "completed";
    case RequestStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<RequestStatus> ParseRequestStatus(std::string_view value) {
  if (value == "pending") return RequestStatus::kPending;
  if (value == "playing") return RequestStatus::kPlaying;
  if (value == "completed") return RequestStatus::kCompleted;
  if (value == "cancelled") return RequestStatus::kCancelled;
  return std::nullopt;
}

constexpr std::optional<RequestStatus> FromStorage(int value) {
  if (value < static_cast<int>(RequestStatus::kPending) || value > static_cast<int>(RequestStatus::kCancelled)) {
    return std::nullopt;
  }
  return static_cast<RequestStatus>(value);
}

} // namespace songqueue::model
