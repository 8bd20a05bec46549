#include <iostream>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "DepartureFilter.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Parser.hpp"
#include "RefreshScheduler.hpp"
#include "VirtualClock.hpp"

std::shared_ptr<RefreshScheduler> RefreshScheduler::create(boost::asio::any_io_executor executor,
                                                           DepartureSource& source,
                                                           std::string siteId,
                                                           FilterSpec filter,
                                                           std::chrono::seconds interval,
                                                           std::string name)
{
    return std::shared_ptr<RefreshScheduler>(new RefreshScheduler(
        std::move(executor), source, std::move(siteId), std::move(filter), interval, std::move(name)));
}

RefreshScheduler::RefreshScheduler(boost::asio::any_io_executor exec,
                                   DepartureSource& src,
                                   std::string site,
                                   FilterSpec spec,
                                   std::chrono::seconds every,
                                   std::string label)
    : executor(exec)
    , timer(exec)
    , source(src)
    , siteId(std::move(site))
    , filter(std::move(spec))
    , interval(every)
    , name(label.empty() ? "site " + siteId : std::move(label))
{
}

boost::asio::awaitable<void> RefreshScheduler::start()
{
    auto self = shared_from_this();

    std::cout << "[System] " << name << ": initial refresh..." << std::endl;
    RefreshOutcome outcome = co_await refresh();
    if (outcome != RefreshOutcome::Updated)
    {
        throw SetupError("Initial refresh of " + name + " failed: "
                         + lastError().value_or("scheduler stopped"));
    }

    boost::asio::co_spawn(executor, runPollingLoop(), boost::asio::detached);
    std::cout << "[System] " << name << ": polling every " << interval.count() << "s" << std::endl;
}

boost::asio::awaitable<RefreshOutcome> RefreshScheduler::refresh()
{
    auto self = shared_from_this();

    if (stopped)
        co_return RefreshOutcome::Discarded;

    if (inFlight)
    {
        if (Log::isVerbose())
            std::cout << "   [Refresh] " << name << ": fetch in flight, tick skipped" << std::endl;
        co_return RefreshOutcome::Coalesced;
    }

    inFlight = true;
    std::shared_ptr<DepartureSnapshot const> fresh;
    std::string failure;
    std::size_t rawCount = 0;

    try
    {
        std::string data = co_await source.fetchDepartures(siteId);
        std::vector<Departure> raw = Parser::extractDepartures(data);
        rawCount = raw.size();

        auto next = std::make_shared<DepartureSnapshot>();
        next->departures = DepartureFilter::apply(raw, filter);
        next->fetchedAt  = VirtualClock::now();
        fresh = std::move(next);
    }
    catch (FetchError const& e)
    {
        failure = std::string("Fetch failed: ") + e.what();
    }
    catch (ParseError const& e)
    {
        failure = std::string("Parse failed: ") + e.what();
    }
    catch (std::exception const& e)
    {
        failure = std::string("Refresh failed: ") + e.what();
    }

    inFlight = false;

    if (stopped)
    {
        std::cout << "   [Refresh] " << name << ": stopped, result discarded" << std::endl;
        co_return RefreshOutcome::Discarded;
    }

    if (fresh)
    {
        std::cout << "   [Refresh] " << name << ": " << fresh->departures.size()
                  << " departures (" << rawCount << " raw)" << std::endl;
        publish(fresh);
        notify(RefreshEvent{true, fresh, std::nullopt});
        co_return RefreshOutcome::Updated;
    }

    std::cerr << "Error refreshing " << name << ": " << failure << std::endl;
    recordFailure(failure);
    notify(RefreshEvent{false, snapshot(), failure});
    co_return RefreshOutcome::Failed;
}

boost::asio::awaitable<void> RefreshScheduler::runPollingLoop()
{
    auto self = shared_from_this();

    while (!stopped)
    {
        timer.expires_after(interval);

        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (stopped || ec == boost::asio::error::operation_aborted)
            break;

        // Spawned rather than awaited so later ticks still see the
        // in-flight flag while this fetch is suspended.
        boost::asio::co_spawn(executor, refresh(), boost::asio::detached);
    }

    std::cout << "[System] " << name << ": polling stopped" << std::endl;
}

void RefreshScheduler::stop()
{
    stopped = true;
    timer.cancel();
}

void RefreshScheduler::subscribe(Listener listener)
{
    listeners.push_back(std::move(listener));
}

void RefreshScheduler::publish(std::shared_ptr<DepartureSnapshot const> next)
{
    current.store(std::move(next));

    std::lock_guard<std::mutex> lock(errorMutex);
    error.reset();
}

void RefreshScheduler::recordFailure(std::string message)
{
    std::lock_guard<std::mutex> lock(errorMutex);
    error = std::move(message);
}

void RefreshScheduler::notify(RefreshEvent const& event)
{
    for (auto const& listener : listeners)
        listener(event);
}

std::shared_ptr<DepartureSnapshot const> RefreshScheduler::snapshot() const
{
    return current.load();
}

std::optional<std::string> RefreshScheduler::lastError() const
{
    std::lock_guard<std::mutex> lock(errorMutex);
    return error;
}

std::vector<Presentation> RefreshScheduler::present(ViewPolicy const& policy, TimeContext const& time) const
{
    auto snap = snapshot();
    if (!snap)
        return DepartureView::unavailable(policy);
    return DepartureView::derive(snap->departures, policy, time);
}
