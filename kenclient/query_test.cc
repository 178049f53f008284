#define BOOST_TEST_MODULE QueryTest
#include <boost/test/unit_test.hpp>

#include "kenclient/query.hh"

#include "kenclient/testing/test_files.hh"
#include "kenclient/testing/toy_engine.hh"

#include <boost/shared_ptr.hpp>

#include <sstream>
#include <string>

namespace kenclient {
namespace {

struct QueryFixture {
  QueryFixture() : engine(new testing::ToyEngine()), client(engine, testing::TestFile("toy.arpa"), Quiet()) {}

  ~QueryFixture() {
    client.Release();
  }

  static Config Quiet() {
    Config config;
    config.messages = NULL;
    return config;
  }

  boost::shared_ptr<testing::ToyEngine> engine;
  Client client;
};

BOOST_FIXTURE_TEST_SUITE(QueryTests, QueryFixture)

BOOST_AUTO_TEST_CASE(NoContext) {
  std::istringstream in("the cat sat\nthe dog\n");
  std::ostringstream out;
  Query(client, in, BasicPrint(out), false);
  BOOST_CHECK_EQUAL("Total: -1.6 OOV: 0\nTotal: -2.8 OOV: 1\n", out.str());
}

BOOST_AUTO_TEST_CASE(SentenceContext) {
  std::istringstream in("the cat\n");
  std::ostringstream out;
  Query(client, in, FullPrint(out), true);
  // <s> and </s> take ids 1 and 2.
  BOOST_CHECK_EQUAL(0U, out.str().find("the=3 -0.4\tcat=4 -0.7\t</s>=2 -1.6\tTotal: -2.7 OOV: 0\n"));
  BOOST_CHECK(out.str().find("Tokens:\t3\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(BlankLine) {
  std::istringstream in("\n");
  std::ostringstream out;
  Query(client, in, BasicPrint(out), false);
  BOOST_CHECK_EQUAL("Total: 0 OOV: 0\n", out.str());
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace
} // namespace kenclient
