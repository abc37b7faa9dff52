#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace draft::model {

/*
  Draft lifecycle.

    DRAFT -> FINALIZING -> FINALIZED

  Transitions only move forward. Deletion is not a status; it removes the
  record from any state.
*/
enum class DraftStatus : std::uint8_t {
  kDraft      = 1,
  kFinalizing = 2,
  kFinalized  = 3,
};

constexpr bool IsTerminal(DraftStatus status) {
  return status == DraftStatus::kFinalized;
}

constexpr bool CanTransition(DraftStatus from, DraftStatus to) {
  if (from == to) {
    return true;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(DraftStatus status) {
  switch (status) {
    case DraftStatus::kDraft:
      return "draft";
    case DraftStatus::kFinalizing:
      return "finalizing";
    case DraftStatus::kFinalized:
      return "finalized";
  }
  return "unknown";
}

constexpr std::optional<DraftStatus> StatusFromInt(int value) {
  switch (value) {
    case static_cast<int>(DraftStatus::kDraft):
      return DraftStatus::kDraft;
    case static_cast<int>(DraftStatus::kFinalizing):
      return DraftStatus::kFinalizing;
    case static_cast<int>(DraftStatus::kFinalized):
      return DraftStatus::kFinalized;
    default:
      return std::nullopt;
  }
}

} // namespace draft::model
