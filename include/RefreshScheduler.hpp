#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "DepartureSource.hpp"
#include "DepartureView.hpp"
#include "FilterSpec.hpp"
#include "Types.hpp"

enum class RefreshOutcome
{
    Updated,     // new snapshot published
    Failed,      // previous snapshot kept, error recorded
    Coalesced,   // a fetch was already in flight
    Discarded    // stopped before or while fetching
};

struct RefreshEvent
{
    bool success = false;
    std::shared_ptr<DepartureSnapshot const> snapshot;   // current snapshot, possibly stale
    std::optional<std::string> error;
};

// Polls one site on a fixed interval and publishes the filtered departures.
//
// All coroutines run on the executor given at construction, which must not
// be driven by more than one thread; the in-flight flag relies on that.
// snapshot(), lastError() and present() may be called from any thread.
class RefreshScheduler : public std::enable_shared_from_this<RefreshScheduler>
{
public:
    using Listener = std::function<void(RefreshEvent const&)>;

    static std::shared_ptr<RefreshScheduler> create(boost::asio::any_io_executor executor,
                                                    DepartureSource& source,
                                                    std::string siteId,
                                                    FilterSpec filter,
                                                    std::chrono::seconds interval,
                                                    std::string name = {});

    // First refresh, then the polling loop. Throws SetupError if that first
    // refresh fails; the loop is not started in that case.
    boost::asio::awaitable<void> start();

    // One refresh cycle. Does not fetch when a fetch is already in flight
    // or the scheduler is stopped.
    boost::asio::awaitable<RefreshOutcome> refresh();

    // Cancels the pending tick. A fetch still in flight finishes but is
    // never published.
    void stop();

    // Register before start(); listeners are called on the executor.
    void subscribe(Listener listener);

    [[nodiscard]] std::shared_ptr<DepartureSnapshot const> snapshot() const;
    [[nodiscard]] std::optional<std::string> lastError() const;
    [[nodiscard]] bool isFetching() const noexcept { return inFlight; }
    [[nodiscard]] bool isStopped() const noexcept { return stopped; }
    [[nodiscard]] std::string const& getName() const noexcept { return name; }

    [[nodiscard]] std::vector<Presentation> present(ViewPolicy const& policy, TimeContext const& time) const;

private:
    RefreshScheduler(boost::asio::any_io_executor executor,
                     DepartureSource& source,
                     std::string siteId,
                     FilterSpec filter,
                     std::chrono::seconds interval,
                     std::string name);

    boost::asio::awaitable<void> runPollingLoop();
    void publish(std::shared_ptr<DepartureSnapshot const> next);
    void recordFailure(std::string message);
    void notify(RefreshEvent const& event);

    boost::asio::any_io_executor executor;
    boost::asio::steady_timer timer;
    DepartureSource& source;
    std::string siteId;
    FilterSpec const filter;
    std::chrono::seconds interval;
    std::string name;

    bool inFlight = false;
    bool stopped = false;

    std::atomic<std::shared_ptr<DepartureSnapshot const>> current;
    mutable std::mutex errorMutex;
    std::optional<std::string> error;
    std::vector<Listener> listeners;
};
