#pragma once

#include "output.hpp"
#include "types.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <istream>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct job
{
    // Sentinel telling a worker to stop
    static constexpr std::size_t none = static_cast<std::size_t>(-1);

    std::string _pathname;
    std::size_t _slot = none;

    job() = default;

    job(std::string pathname, const std::size_t slot) :
        _pathname(std::move(pathname)),
        _slot(slot)
    {
    }

    [[nodiscard]] bool is_none() const
    {
        return _slot == none;
    }
};

struct job_queue
{
    std::deque<job> _jobs;
    std::mutex _mutex;
    std::condition_variable _work;

    // Add a sentinel
    void enqueue();
    void enqueue(std::string pathname, const std::size_t slot);
    // Blocks until a job is available
    job dequeue();
};

struct scheduler;

struct worker
{
    scheduler& _master;
    // Only touched by this worker's thread until it has been joined
    std::vector<file_outcome> _outcomes;
    std::thread _thread;

    explicit worker(scheduler& master);

    void execute();
    void run(const job& j);
};

// Runs at most _concurrency file searches at once.
// Workers start on demand as pathnames are submitted and all share one
// FIFO queue, so dispatch follows submission order.
struct scheduler
{
    const matcher& _matcher;
    const file_processor _processor;
    output_sink& _out;
    output_sink& _err;
    std::size_t _concurrency = 0;
    job_queue _jobs;
    std::list<worker> _workers;
    std::size_t _next_slot = 0;
    bool _stopped = false;

    scheduler(const scan_config& config, const matcher& m,
        output_sink& out, output_sink& err);
    ~scheduler();

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;

    void submit(std::string pathname);
    // One pathname per line, surrounding whitespace trimmed, blank lines
    // skipped. Returns the number of pathnames submitted.
    std::size_t submit_all(std::istream& is);
    // Waits for every submitted job, then folds the outcomes.
    // outcomes, when supplied, receives them in submission order.
    scan_result finish(std::vector<file_outcome>* outcomes = nullptr);

    void start_worker();
    void stop_workers();
};

// Schedules every pathname read from is and returns the folded result
scan_result scan(const scan_config& config, const matcher& m,
    std::istream& is, output_sink& out, output_sink& err,
    std::vector<file_outcome>* outcomes = nullptr);
