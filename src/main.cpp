#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include "ConfigurationManager.hpp"
#include "Dashboard.hpp"
#include "DiscoveryService.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "RefreshScheduler.hpp"
#include "ReplayEngine.hpp"
#include "SlClient.hpp"
#include "VirtualClock.hpp"

namespace
{
char const* describe(DiscoveryError::Reason reason)
{
    switch (reason)
    {
        case DiscoveryError::Reason::CannotConnect:  return "Cannot connect to the SL API";
        case DiscoveryError::Reason::SearchTooShort: return "Search term too short";
        case DiscoveryError::Reason::NoMatches:      return "No matching stops";
    }
    return "Discovery failed";
}
}

boost::asio::awaitable<void> runDiscovery(DepartureSource& source, ConfigurationManager const& config, int& exitCode)
{
    DiscoveryService discovery(source);
    std::string const& argument = config.getDiscoveryArgument();

    try
    {
        switch (config.getRunMode())
        {
            case RunMode::SearchSites:
            {
                auto choices = co_await discovery.searchSites(argument);
                for (auto const& c : choices)
                    std::cout << "  " << c.site.id << "\t" << c.label << "\n";
                break;
            }
            case RunMode::ListLines:
            {
                auto lines = co_await discovery.discoverLines(argument, config.getDiscoveryMode());
                std::sort(lines.begin(), lines.end(),
                          [](LineOption const& a, LineOption const& b) { return a.designation < b.designation; });

                std::cout << "  (all)\tAll lines\n";
                for (auto const& l : lines)
                {
                    std::cout << "  " << l.designation;
                    if (!l.groupOfLines.empty() && l.groupOfLines != l.designation)
                        std::cout << "\t" << l.groupOfLines;
                    std::cout << "\n";
                }
                break;
            }
            case RunMode::ListDirections:
            {
                auto directions = co_await discovery.discoverDirections(argument, config.getDiscoveryMode(), config.getDiscoveryLine());
                std::sort(directions.begin(), directions.end(),
                          [](DirectionOption const& a, DirectionOption const& b) { return a.code < b.code; });

                std::cout << "  (all)\tAll directions\n";
                if (directions.empty())
                    std::cout << "  1\tDirection 1\n  2\tDirection 2\n";
                for (auto const& d : directions)
                    std::cout << "  " << d.code << "\t-> " << d.destination << "\n";
                break;
            }
            case RunMode::Board:
                break;
        }
        std::cout << std::flush;
    }
    catch (DiscoveryError const& e)
    {
        std::cerr << describe(e.getReason()) << ": " << e.what() << std::endl;
        exitCode = 2;
    }
}

void renderTarget(RefreshScheduler const& scheduler, TargetConfig const& target, date::time_zone const* zone, bool json)
{
    auto presentations = scheduler.present(target.viewPolicy(), TimeContext::current(zone));

    if (json)
        std::cout << Dashboard::generateJson(target.uniqueId(), presentations, scheduler.lastError()) << std::endl;
    else
        std::cout << Dashboard::generate(target.uniqueId(), presentations, scheduler.snapshot(), scheduler.lastError(), zone) << std::endl;
}

int runBoard(boost::asio::io_context& io, DepartureSource& source, ReplaySource* replay, ConfigurationManager const& config)
{
    date::time_zone const* zone = config.resolveDisplayZone();
    auto const& targets = config.getTargets();

    std::vector<std::shared_ptr<RefreshScheduler>> schedulers;
    std::size_t running = targets.size();
    int failedSetups = 0;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);

    auto finished = [&]()
    {
        if (--running == 0)
            signals.cancel();
    };

    for (auto const& target : targets)
    {
        auto scheduler = RefreshScheduler::create(io.get_executor(), source, target.siteId,
                                                  target.filter, target.scanInterval, target.uniqueId());
        RefreshScheduler* raw = scheduler.get();

        std::cout << "[System] " << target.uniqueId() << ": site " << target.siteId
                  << ", " << DepartureView::policyName(target.viewPolicy()) << " view" << std::endl;

        scheduler->subscribe([raw, &target, zone, replay, &config, &finished](RefreshEvent const& event)
        {
            renderTarget(*raw, target, zone, config.isJsonOutput());

            if (replay && !event.success && replay->remaining(target.siteId) == 0 && !raw->isStopped())
            {
                std::cout << ">>> REPLAY COMPLETE for " << raw->getName() << " <<<" << std::endl;
                raw->stop();
                finished();
            }
        });

        boost::asio::co_spawn(io, scheduler->start(),
            [raw, &failedSetups, &finished](std::exception_ptr e)
            {
                if (!e)
                    return;
                try
                {
                    std::rethrow_exception(e);
                }
                catch (std::exception const& ex)
                {
                    std::cerr << "Setup Error: " << ex.what() << std::endl;
                }
                ++failedSetups;
                if (!raw->isStopped())
                {
                    raw->stop();
                    finished();
                }
            });

        schedulers.push_back(std::move(scheduler));
    }

    signals.async_wait([&](boost::system::error_code const& ec, int signo)
    {
        if (ec)
            return;
        std::cout << "\n[System] Signal " << signo << " received, shutting down..." << std::endl;
        for (auto& s : schedulers)
            s->stop();
    });

    io.run();

    if (failedSetups == static_cast<int>(targets.size()))
        return 1;
    return 0;
}

int main(int argc, char* argv[])
{
    try
    {
        ConfigurationManager config(std::vector<std::string>(argv + 1, argv + argc));
        Log::setVerbose(config.isVerbose());

        boost::asio::io_context io;
        SlClient client(io);

        if (config.getRunMode() != RunMode::Board)
        {
            int exitCode = 0;
            boost::asio::co_spawn(io, runDiscovery(client, config, exitCode),
                [&exitCode](std::exception_ptr e)
                {
                    if (!e)
                        return;
                    try
                    {
                        std::rethrow_exception(e);
                    }
                    catch (std::exception const& ex)
                    {
                        std::cerr << "Discovery Error: " << ex.what() << std::endl;
                    }
                    exitCode = 1;
                });
            io.run();
            return exitCode;
        }

        std::cout << "System Initialized. " << config.getTargets().size() << " target(s).\n";

        if (!config.getReplayFile().empty())
        {
            std::cout << ">>> STARTING REPLAY MODE <<<" << std::endl;
            ReplaySource replay(config.getReplayFile());
            int rc = runBoard(io, replay, &replay, config);
            VirtualClock::disable();
            return rc;
        }

        if (!config.getRecordFile().empty())
        {
            Recorder recorder(client, config.getRecordFile());
            return runBoard(io, recorder, nullptr, config);
        }

        return runBoard(io, client, nullptr, config);
    }
    catch (ConfigError const& e)
    {
        std::cerr << "Configuration Error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
