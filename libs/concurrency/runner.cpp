#include "runner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <thread>

std::size_t getNCpus()
{
    const unsigned hwcpus = std::thread::hardware_concurrency();
    const std::size_t detected = hwcpus ? hwcpus : 2;

    const char* ncpu_env = std::getenv("ncpu");
    if (ncpu_env == nullptr)
        return detected;

    char* end = nullptr;
    errno = 0;
    const long envcpus = std::strtol(ncpu_env, &end, 10);
    if (end == ncpu_env || *end != '\0' || errno == ERANGE || envcpus < 1)
    {
        std::cerr << "ignoring ncpu=" << ncpu_env << ", using " << detected << " threads" << std::endl;
        return detected;
    }

    return std::min(static_cast<std::size_t>(envcpus), MaxRunnerThreads);
}

std::unique_ptr<runner>& runner::instance_ptr()
{
    static std::unique_ptr<runner> r;
    return r;
}

std::once_flag& runner::init_flag()
{
    static std::once_flag flag;
    return flag;
}

void runner::ensure_initialized(std::size_t num_threads)
{
    std::call_once(init_flag(), [num_threads]() {
        instance_ptr() = std::make_unique<runner>(num_threads);
    });
}

runner& runner::instance()
{
    // zero threads means "auto-detect"
    ensure_initialized(0);
    return *instance_ptr();
}

runner::runner(std::size_t nthreads)
    : ios(),
      work(boost::asio::make_work_guard(ios)),
      pool(),
      nthreads_(std::max<std::size_t>(1, nthreads == 0 ? getNCpus() : nthreads))
{
    std::cerr << "Starting " << nthreads_ << " runner threads" << std::endl;

    for (std::size_t i = 0; i < nthreads_; ++i)
    {
        pool.create_thread([this]() { run(); });
    }
}

runner::~runner()
{
    try
    {
        stop();
        pool.join_all();
    }
    catch (std::exception const& e)
    {
        std::cerr << "runner shutdown: " << e.what() << std::endl;
    }
}

void runner::stop() { work.reset(); }

void runner::run()
{
    try
    {
        ios.run();
    }
    catch (std::exception const& e)
    {
        std::cerr << "runner thread: " << e.what() << std::endl;
    }
}
