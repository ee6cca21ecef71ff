#include "pch.h"

#include "hg_error.hpp"
#include "pool.hpp"
#include "search.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <string_view>
#include <system_error>

void job_queue::enqueue()
{
    std::unique_lock lock(_mutex);

    _jobs.emplace_back();
    lock.unlock();
    _work.notify_one();
}

void job_queue::enqueue(std::string pathname, const std::size_t slot)
{
    std::unique_lock lock(_mutex);

    _jobs.emplace_back(std::move(pathname), slot);
    lock.unlock();
    _work.notify_one();
}

job job_queue::dequeue()
{
    std::unique_lock lock(_mutex);

    _work.wait(lock, [this]() { return !_jobs.empty(); });

    job j = std::move(_jobs.front());

    _jobs.pop_front();
    return j;
}

worker::worker(scheduler& master) :
    _master(master),
    _thread(&worker::execute, this)
{
}

void worker::execute()
{
    for (job j = _master._jobs.dequeue(); !j.is_none();
        j = _master._jobs.dequeue())
    {
        run(j);
    }
}

void worker::run(const job& j)
{
    std::string report;
    file_outcome outcome;

    try
    {
        outcome = process_file(j._pathname, _master._matcher,
            _master._processor, report);
    }
    catch (const std::exception& e)
    {
        report.clear();
        outcome._pathname = j._pathname;
        outcome._matched = false;
        outcome._error = e.what();
    }

    outcome._slot = j._slot;

    if (outcome._error)
    {
        if (!g_options._no_messages)
        {
            _master._err.write(file_warning(_master._err._tty, j._pathname,
                *outcome._error));
        }
    }
    else
        // The whole report for this file in one block
        _master._out.write(report);

    _outcomes.push_back(std::move(outcome));
}

scheduler::scheduler(const scan_config& config, const matcher& m,
    output_sink& out, output_sink& err) :
    _matcher(m),
    _processor(select_processor(config._flags)),
    _out(out),
    _err(err),
    _concurrency(config._concurrency)
{
    if (_concurrency == 0)
        throw hg_error("concurrency must be a positive integer");
}

scheduler::~scheduler()
{
    stop_workers();
}

void scheduler::start_worker()
{
    try
    {
        _workers.emplace_back(*this);
    }
    catch (const std::system_error& e)
    {
        if (e.code() != std::errc::resource_unavailable_try_again ||
            _workers.empty())
        {
            throw hg_error(std::format("cannot start worker thread: {}",
                e.what()));
        }

        // Carry on with the workers already running
        _concurrency = _workers.size();
        _err.write(warning(_err._tty,
            std::format("out of threads, limiting concurrency to {}",
                _concurrency)));
    }
}

void scheduler::stop_workers()
{
    if (_stopped)
        return;

    _stopped = true;

    // The sentinels queue up behind any outstanding jobs
    for (std::size_t idx = 0, size = _workers.size(); idx < size; ++idx)
    {
        _jobs.enqueue();
    }

    for (auto& w : _workers)
    {
        w._thread.join();
    }
}

void scheduler::submit(std::string pathname)
{
    if (_stopped)
        throw hg_error("cannot submit to a finished scheduler");

    if (_workers.size() < _concurrency)
        start_worker();

    _jobs.enqueue(std::move(pathname), _next_slot++);
}

[[nodiscard]] static std::string_view trim(const std::string& str)
{
    constexpr const char ws[] = " \t\n\v\f\r";
    const std::size_t first = str.find_first_not_of(ws);

    if (first == std::string::npos)
        return std::string_view();

    const std::size_t last = str.find_last_not_of(ws);

    return std::string_view(str).substr(first, last - first + 1);
}

std::size_t scheduler::submit_all(std::istream& is)
{
    std::string line;
    std::size_t count = 0;

    while (std::getline(is, line))
    {
        const std::string_view pathname = trim(line);

        if (pathname.empty())
            continue;

        submit(std::string(pathname));
        ++count;
    }

    if (is.bad())
        throw hg_error("failed to read the list of files");

    return count;
}

scan_result scheduler::finish(std::vector<file_outcome>* outcomes)
{
    std::vector<file_outcome> all;
    scan_result result;

    stop_workers();

    for (auto& w : _workers)
    {
        std::ranges::move(w._outcomes, std::back_inserter(all));
        w._outcomes.clear();
    }

    std::ranges::sort(all, {}, &file_outcome::_slot);

    for (const auto& outcome : all)
    {
        result.fold(outcome);
    }

    if (outcomes)
        *outcomes = std::move(all);

    return result;
}

scan_result scan(const scan_config& config, const matcher& m,
    std::istream& is, output_sink& out, output_sink& err,
    std::vector<file_outcome>* outcomes)
{
    scheduler master(config, m, out, err);

    master.submit_all(is);
    return master.finish(outcomes);
}
