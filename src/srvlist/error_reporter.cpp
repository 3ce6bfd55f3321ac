#include "srvlist/error_reporter.hpp"

#include "srvlist/log.hpp"

#include <fmt/format.h>

namespace srvlist {

void LogErrorReporter::report(std::exception const& err) {
    Log::error(fmt::format("unexpected failure: {}", err.what()));
}

} // namespace srvlist
