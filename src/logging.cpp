#include <reconcile/logging.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace reconcile {
namespace logging {

void init_console(plog::Severity severity) {
    static plog::ConsoleAppender<plog::TxtFormatter> console_appender;

    if (auto* logger = plog::get()) {
        logger->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &console_appender);
}

}  // namespace logging
}  // namespace reconcile
