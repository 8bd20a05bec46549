#pragma once
#include <stdexcept>
#include <string>

// Network, timeout or non-2xx response from a DepartureSource.
class FetchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Body was not JSON, or not the shape the endpoint documents.
class ParseError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// First refresh of a target failed; there is nothing to serve.
class SetupError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class DiscoveryError : public std::runtime_error
{
public:
    enum class Reason
    {
        CannotConnect,
        SearchTooShort,
        NoMatches
    };

    DiscoveryError(Reason r, std::string const& message)
        : std::runtime_error(message)
        , reason(r)
    {
    }

    [[nodiscard]] Reason getReason() const noexcept { return reason; }

private:
    Reason reason;
};
