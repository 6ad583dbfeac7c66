#ifndef RUNNER_HPP
#define RUNNER_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/exception_ptr.hpp>
#include <boost/thread/future.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread.hpp>

//upper bound on the runner pool size taken from ncpu
constexpr std::size_t MaxRunnerThreads = 1024;

//number of cpus reported by std::thread::hardware_concurrency,
//overridden by the environment variable ncpu when it is set.
//ncpu must be a positive integer; larger values are capped at
//MaxRunnerThreads and anything else falls back to the detected count.
//never returns 0
// run as: ncpu=7 ./knockoutsim --config tour.csv --executor boost
std::size_t getNCpus();

///////////////////////////////////////
/// \brief The runner struct
/// a process-wide Boost.Asio thread pool shared by every BoostRunnerExecutor.
/// The first call to ensure_initialized() or instance() fixes the pool size
/// for the lifetime of the process.

struct runner
{
  //constructor. if nthreads==0 the number of threads is getNCpus().
  //at least one thread is always started
  explicit runner(std::size_t nthreads);
  //non-copyable object
  runner(const runner&) = delete;
  runner& operator=(const runner&) = delete;
  //destructor. releases the work guard and waits for the threads to end
  ~runner();
  //lets the threads finish once the queue is drained
  void stop();

  std::size_t num_threads() const { return nthreads_; }

  // submit a job to the pool. exceptions are reported back through the future
  template<typename F>
  boost::unique_future<void> post(F f)
  {
    auto promise = std::make_shared<boost::promise<void>>();
    auto res = promise->get_future();
    boost::asio::post(ios, [promise, task = std::move(f)]() mutable {
      try
	{
	  task();
	}
      catch(...)
	{
	  promise->set_exception(boost::current_exception());
	  return;
	}
      promise->set_value();
    });

    return res;
  }

  /// Construct the singleton if needed (auto-detect thread count if you pass 0).
  static void ensure_initialized(std::size_t num_threads = 0);
  static runner& instance();

private:
  static std::unique_ptr<runner>& instance_ptr();
  static std::once_flag& init_flag();

  //worker method of thread pool
  void run();

  boost::asio::io_context ios;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  boost::thread_group pool;
  std::size_t nthreads_;
};

#endif // RUNNER_HPP
