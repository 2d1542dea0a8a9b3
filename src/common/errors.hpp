#pragma once

#include <stdexcept>
#include <string>

namespace ccmonitor {

// Retryable failure of the usage collector. The next collection tick is the retry.
class CollectionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An activity log source could not be read. The source contributes no events.
class ParseError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A child process could not be started, timed out, or the pool was shut down.
class SubprocessError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace ccmonitor
