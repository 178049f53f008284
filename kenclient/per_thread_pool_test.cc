#define BOOST_TEST_MODULE PerThreadPoolTest
#include <boost/test/unit_test.hpp>

#include "kenclient/per_thread_pool.hh"

#include "kenclient/client.hh"
#include "kenclient/exception.hh"
#include "kenclient/testing/test_files.hh"
#include "kenclient/testing/toy_engine.hh"

#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/thread.hpp>

#include <exception>
#include <string>
#include <vector>

namespace kenclient {
namespace {

const std::size_t kQueriesPerThread = 100;

struct Worker {
  Worker(Client &client_in, PerThreadPool &pools_in) : client(client_in), pools(pools_in), pool(NULL), wrong(0) {}

  void operator()() {
    try {
      pool = &pools.Get();
      std::vector<int64_t> rule;
      rule.push_back(5);
      rule.push_back(6);
      rule.push_back(7);
      for (std::size_t i = 0; i < kQueriesPerThread; ++i) {
        if (&pools.Get() != pool) ++wrong;
        ProbResult result = client.ProbabilityOfRule(pools.Get(), rule);
        if (result.prob > -1.599 || result.prob < -1.601) ++wrong;
      }
    } catch (const std::exception &e) {
      error = e.what();
    }
  }

  Client &client;
  PerThreadPool &pools;
  Pool *pool;
  std::size_t wrong;
  std::string error;
};

// boost::thread copies its function object.
struct RunWorker {
  explicit RunWorker(Worker &worker_in) : worker(&worker_in) {}
  void operator()() { (*worker)(); }
  Worker *worker;
};

Config Quiet() {
  Config config;
  config.messages = NULL;
  return config;
}

BOOST_AUTO_TEST_CASE(PoolPerThread) {
  boost::shared_ptr<testing::ToyEngine> engine(new testing::ToyEngine());
  Client client(engine, testing::TestFile("toy.arpa"), Quiet());
  client.RegisterWord("the", 5);
  client.RegisterWord("cat", 6);
  client.RegisterWord("sat", 7);
  {
    PerThreadPool pools(client);
    Pool &mine = pools.Get();
    BOOST_CHECK_EQUAL(&mine, &pools.Get());
    BOOST_CHECK_EQUAL(4U, mine.Capacity());

    boost::ptr_vector<Worker> workers;
    boost::thread_group threads;
    for (std::size_t i = 0; i < 4; ++i) {
      workers.push_back(new Worker(client, pools));
      threads.create_thread(RunWorker(workers.back()));
    }
    threads.join_all();

    for (std::size_t i = 0; i < workers.size(); ++i) {
      BOOST_CHECK_EQUAL("", workers[i].error);
      BOOST_CHECK_EQUAL(0U, workers[i].wrong);
      BOOST_CHECK(workers[i].pool != &mine);
      for (std::size_t j = 0; j < i; ++j) {
        BOOST_CHECK(workers[i].pool != workers[j].pool);
      }
    }
    // Worker pools went away with their threads.
    BOOST_CHECK_EQUAL(1U, engine->LivePools());
  }
  BOOST_CHECK_EQUAL(0U, engine->LivePools());
  client.Release();
  BOOST_CHECK_EQUAL(0U, engine->BadHandleCalls());
}

BOOST_AUTO_TEST_CASE(Capacity) {
  boost::shared_ptr<testing::ToyEngine> engine(new testing::ToyEngine());
  Client client(engine, testing::TestFile("toy.arpa"), Quiet());
  BOOST_CHECK_THROW(PerThreadPool(client, 2), CapacityException);
  PerThreadPool pools(client, 6);
  BOOST_CHECK_EQUAL(6U, pools.Get().Capacity());
  client.Release();
}

} // namespace
} // namespace kenclient
