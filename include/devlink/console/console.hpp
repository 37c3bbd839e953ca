#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <mutex>

namespace devlink {
    namespace console {

        // ─── Console executor ────────────────────────────────────────────────────────
        // Runs one console line and returns its textual result.
        class ConsoleExecutor {
          public:
            virtual ~ConsoleExecutor() = default;

            virtual Result<dp::String> execute(const dp::String &line) = 0;
        };

        using CommandArgs = dp::Vector<dp::String>;
        using CommandHandler = std::function<Result<dp::String>(const CommandArgs &)>;

        // ─── Fixed command table ─────────────────────────────────────────────────────
        // Only registered commands can run; the first word of a line selects the
        // command and the remaining words are passed as arguments.
        //
        // Usage:
        //   CommandConsole console;
        //   console.register_command("uptime", "seconds since boot", [](const CommandArgs &) {
        //       return Result<dp::String>::ok("42");
        //   });
        //   auto out = console.execute("uptime");
        class CommandConsole : public ConsoleExecutor {
            struct Command {
                dp::String help;
                CommandHandler handler;
            };

            mutable std::mutex mutex_;
            dp::Map<dp::String, Command> commands_;
            dp::Vector<dp::String> order_;

          public:
            CommandConsole() = default;

            void register_command(const dp::String &name, dp::String help, CommandHandler handler) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (commands_.find(name) == commands_.end())
                    order_.push_back(name);
                commands_[name] = Command{std::move(help), std::move(handler)};
            }

            bool has_command(const dp::String &name) const {
                std::lock_guard<std::mutex> lock(mutex_);
                return commands_.find(name) != commands_.end();
            }

            Result<dp::String> execute(const dp::String &line) override {
                auto words = split_words(line);
                if (words.empty())
                    return Result<dp::String>::ok(dp::String{});

                const dp::String name = words[0];
                CommandArgs args(words.begin() + 1, words.end());
                echo::category("devlink.console").debug(">>> ", line);

                if (name == "help")
                    return Result<dp::String>::ok(help_text());

                CommandHandler handler;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = commands_.find(name);
                    if (it == commands_.end()) {
                        return Result<dp::String>::err(Error::console_error("unknown command: " + name));
                    }
                    handler = it->second.handler;
                }
                return handler(args);
            }

            dp::String help_text() const {
                std::lock_guard<std::mutex> lock(mutex_);
                dp::String out = "help - list commands";
                for (const auto &name : order_) {
                    auto it = commands_.find(name);
                    out += "\n" + name + " - " + it->second.help;
                }
                return out;
            }

          private:
            static dp::Vector<dp::String> split_words(const dp::String &line) {
                dp::Vector<dp::String> words;
                dp::String current;
                for (usize i = 0; i < line.size(); ++i) {
                    char c = line[i];
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                        if (!current.empty()) {
                            words.push_back(current);
                            current.clear();
                        }
                    } else {
                        current += c;
                    }
                }
                if (!current.empty())
                    words.push_back(current);
                return words;
            }
        };

    } // namespace console
    using namespace console;
} // namespace devlink
