#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <functional>
#include <memory>

namespace devlink {
    namespace ota {

        // ─── Firmware updater (provided by the application) ─────────────────────────
        // update() returns the code reported back to the controller;
        // OTA_RESULT_APPLIED means a reboot is needed to run the new image.
        class Updater {
          public:
            virtual ~Updater() = default;

            // Brings up its own IP link when the session is not connected
            virtual Result<void> connect() = 0;
            virtual i32 update() = 0;
            virtual void reboot() = 0;
        };

        // A fresh updater is created for every update request
        using UpdaterFactory = std::function<std::unique_ptr<Updater>()>;

    } // namespace ota
} // namespace devlink
