// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Minimal time source interface (local wall-clock provider).
 */
#pragma once

#include "wtcore/export.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {

/**
 * Interface for time sources.
 * Provides the current local wall-clock time with minute precision.
 */
class WTCORE_API TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current local time. */
  virtual Timestamp Now() = 0;
};

/**
 * @brief Time source that always returns an injected value.
 *
 * Used when a fixed "now" is configured and by tests that need
 * deterministic transitions.
 */
class WTCORE_API FixedTimeSource : public TimeSource {
 public:
  explicit FixedTimeSource(const Timestamp& now) : now_(now) {}

  Timestamp Now() override { return now_; }

  /** Replaces the returned time. */
  void Set(const Timestamp& now) { now_ = now; }

  /** Moves the returned time forward (or backward when negative). */
  void Advance(int64_t minutes) { now_ = now_ + minutes; }

 private:
  Timestamp now_;
};

}  // namespace wtcore
