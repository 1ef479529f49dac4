#pragma once

namespace hellostate::core
{
    // Installs a std::terminate handler that reports the uncaught exception
    // through the module logger before chaining to the previous handler.
    // Only the first call in a process installs anything; it returns true,
    // every later call returns false.
    bool install_crash_hook();

    [[nodiscard]] bool crash_hook_installed();
}
