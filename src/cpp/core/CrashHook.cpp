#include <hellostate/core/CrashHook.h>
#include <hellostate/core/Logging.h>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <typeinfo>

namespace hellostate::core
{
    namespace
    {
        std::atomic<bool> installed{false};
        // Raised by an atexit callback registered after the logger exists, so
        // it runs before the logger and spdlog's statics are destroyed.
        std::atomic<bool> shutting_down{false};
        std::terminate_handler previous_handler = nullptr;

        void mark_shutting_down()
        {
            shutting_down.store(true);
        }

        void report(const std::shared_ptr<spdlog::logger>& log)
        {
            if (const std::exception_ptr active = std::current_exception())
            {
                try
                {
                    std::rethrow_exception(active);
                }
                catch (const std::exception& e)
                {
                    log->critical("terminating on uncaught {}: {}", typeid(e).name(), e.what());
                }
                catch (...)
                {
                    log->critical("terminating on uncaught exception of unknown type");
                }
            }
            else
            {
                log->critical("terminate called without an active exception");
            }
            log->flush();
        }

        [[noreturn]] void report_and_terminate()
        {
            if (!shutting_down.load()) report(logger());

            if (previous_handler) previous_handler();
            std::abort();
        }
    }

    bool install_crash_hook()
    {
        bool expected = false;
        if (!installed.compare_exchange_strong(expected, true)) return false;

        const auto log = logger();
        if (std::atexit(&mark_shutting_down) != 0)
            log->warn("could not register crash hook shutdown callback");

        previous_handler = std::set_terminate(&report_and_terminate);
        log->debug("crash hook installed");
        return true;
    }

    bool crash_hook_installed()
    {
        return installed.load();
    }
}
