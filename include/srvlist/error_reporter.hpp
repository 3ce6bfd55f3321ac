#pragma once

#include <exception>

namespace srvlist {

// Receives failures that should never happen in a correctly packaged
// installation, such as an unreadable builtin server list.
class ErrorReporter {
  public:
    virtual ~ErrorReporter() = default;

    virtual void report(std::exception const& err) = 0;
};

class LogErrorReporter final : public ErrorReporter {
  public:
    void report(std::exception const& err) override;
};

} // namespace srvlist
