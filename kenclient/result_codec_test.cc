#include "kenclient/result_codec.hh"

#define BOOST_TEST_MODULE ResultCodecTest
#include <boost/test/unit_test.hpp>

#include <limits>

namespace kenclient {
namespace {

float FromBits(uint32_t bits) {
  detail::FloatEnc enc;
  enc.i = bits;
  return enc.f;
}

BOOST_AUTO_TEST_CASE(Layout) {
  BOOST_CHECK_EQUAL(0x0000000100000000ULL, PackResult(1, 0.0));
  BOOST_CHECK_EQUAL(0x000000073F800000ULL, PackResult(7, 1.0));
  BOOST_CHECK_EQUAL(0xFFFFFFFFBF000000ULL, PackResult(-1, -0.5));
}

// The low word is float bits.  Converting it as an integer would give 1065353216.
BOOST_AUTO_TEST_CASE(ReinterpretNotConvert) {
  ProbResult got = UnpackResult(0x000000023F800000ULL);
  BOOST_CHECK_EQUAL(2, got.state);
  BOOST_CHECK_EQUAL(1.0, got.prob);
}

BOOST_AUTO_TEST_CASE(NegativeState) {
  ProbResult got = UnpackResult(PackResult(std::numeric_limits<int32_t>::min(), -2.25));
  BOOST_CHECK_EQUAL(std::numeric_limits<int32_t>::min(), got.state);
  BOOST_CHECK_EQUAL(-2.25, got.prob);

  got = UnpackResult(PackResult(std::numeric_limits<int32_t>::max(), -99.0));
  BOOST_CHECK_EQUAL(std::numeric_limits<int32_t>::max(), got.state);
  BOOST_CHECK_EQUAL(-99.0, got.prob);
}

BOOST_AUTO_TEST_CASE(NegativeZero) {
  ProbResult got = UnpackResult(PackResult(3, -0.0));
  BOOST_CHECK_EQUAL(3, got.state);
  BOOST_CHECK_EQUAL(0x80000000U, FloatBits(got.prob));
}

BOOST_AUTO_TEST_CASE(NaNPayload) {
  const uint32_t payloads[] = {0x7FC00000U, 0x7FC01234U, 0xFFC00001U, 0x7F800001U};
  for (std::size_t i = 0; i < sizeof(payloads) / sizeof(uint32_t); ++i) {
    ProbResult got = UnpackResult(PackResult(static_cast<int32_t>(i), FromBits(payloads[i])));
    BOOST_CHECK_EQUAL(static_cast<int32_t>(i), got.state);
    BOOST_CHECK_EQUAL(payloads[i], FloatBits(got.prob));
  }
}

BOOST_AUTO_TEST_CASE(Infinity) {
  ProbResult got = UnpackResult(PackResult(0, -std::numeric_limits<float>::infinity()));
  BOOST_CHECK_EQUAL(0xFF800000U, FloatBits(got.prob));
}

} // namespace
} // namespace kenclient
