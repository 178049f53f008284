#ifndef KENCLIENT_RESULT_CODEC_H
#define KENCLIENT_RESULT_CODEC_H

/* The rule query returns its state and log probability packed into one 64-bit
 * value so both cross the boundary as a plain integer:
 *
 *   bits 63..32  state, two's complement
 *   bits 31..0   IEEE-754 single precision bits of the log10 probability
 *
 * The low word is reinterpreted, not converted: -0.0 and NaN payloads survive.
 */

#include <stdint.h>

namespace kenclient {

struct ProbResult {
  int32_t state;
  float prob;
};

namespace detail {
typedef union { float f; uint32_t i; } FloatEnc;
} // namespace detail

inline uint64_t PackResult(int32_t state, float prob) {
  detail::FloatEnc enc;
  enc.f = prob;
  return (static_cast<uint64_t>(static_cast<uint32_t>(state)) << 32) | enc.i;
}

inline ProbResult UnpackResult(uint64_t packed) {
  detail::FloatEnc enc;
  enc.i = static_cast<uint32_t>(packed);
  ProbResult ret;
  ret.state = static_cast<int32_t>(static_cast<uint32_t>(packed >> 32));
  ret.prob = enc.f;
  return ret;
}

// Bits of a float, for exact comparisons in tests and logs.
inline uint32_t FloatBits(float value) {
  detail::FloatEnc enc;
  enc.f = value;
  return enc.i;
}

} // namespace kenclient

#endif // KENCLIENT_RESULT_CODEC_H
