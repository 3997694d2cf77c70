#pragma once

#include "soundkeys/app/AppConfig.hpp"

namespace soundkeys::app {

class App {
public:
    explicit App(AppConfig config);

    /// Startup, interactive loop and shutdown. Returns the process exit code.
    /// Throws std::invalid_argument when the key set cannot be bound.
    int run();

private:
    AppConfig config_;
};

}  // namespace soundkeys::app
