#pragma once

#include <stdexcept>
#include <string>

#include "shared/types.h"

namespace pacer::gpu {

/*!
 * @brief Base of every error the timing engine reports to its caller. The engine
 *        never retries; recovery (retry, block, drop) is the caller's policy.
 */
class TimingError : public std::runtime_error {
public:
  explicit TimingError(const std::string &what) : std::runtime_error(what) {}
};

/*!
 * @brief The descriptor is malformed: wrong vertex count for its kind, an
 *        out-of-range dimension or coordinate, or a missing texture binding.
 *        Raised before any cost is charged or any state is touched.
 */
class InvalidGeometry : public TimingError {
public:
  explicit InvalidGeometry(const std::string &what) : TimingError(what) {}
};

/*!
 * @brief The command FIFO is full and the engine is configured not to stall the
 *        issuer. Transient; the caller may advance time and retry.
 */
class FifoFull : public TimingError {
public:
  FifoFull(const std::string &what, u32 occupancy, cycles_t cycles_until_free)
    : TimingError(what),
      m_occupancy(occupancy),
      m_cycles_until_free(cycles_until_free)
  {
    return;
  }

  u32 occupancy() const
  {
    return m_occupancy;
  }

  /*! @brief Cycles until the head slot drains and a slot frees up. */
  cycles_t cycles_until_free() const
  {
    return m_cycles_until_free;
  }

private:
  u32 m_occupancy;
  cycles_t m_cycles_until_free;
};

/*! @brief The descriptor names a primitive kind the engine does not model here. */
class UnsupportedKind : public TimingError {
public:
  explicit UnsupportedKind(const std::string &what) : TimingError(what) {}
};

/*! @brief Blend mode is unknown, not allowed on this kind, or contradicts the
 *         semi-transparency flag. */
class UnsupportedBlendMode : public TimingError {
public:
  explicit UnsupportedBlendMode(const std::string &what) : TimingError(what) {}
};

}
