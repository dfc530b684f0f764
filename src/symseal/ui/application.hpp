#ifndef SYMSEAL_UI_APPLICATION_HPP
#define SYMSEAL_UI_APPLICATION_HPP

#include "symseal/types.hpp" // Base types, Constants, Exceptions
#include "symseal/config/settings.hpp"
#include <iostream>
#include <string>

namespace Symseal::Core { class Pipeline; }

namespace Symseal::UI {

    /**
     * @brief Interactive command-line front end over the encryption pipeline.
     * Reads choices and text from an input stream, writes results to an output stream and
     * diagnostics to an error stream.
     */
    class Application {
    public:
        enum class Operation {
            GenerateKey = 1,
            EncryptWithKey = 2,
            DecryptWithKey = 3,
            EncryptWithPassword = 4,
            DecryptWithPassword = 5
        };

        explicit Application(Config::Settings settings,
                             std::istream& in = std::cin,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr);
        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /** @brief Runs one operation. Returns a Constants::EXIT_* code. */
        int run();

    private:
        // --- User Interaction Helpers ---
        void print_banner() const;
        Operation prompt_operation() const;
        std::string prompt_line(const std::string& prompt_message) const;
        PrivateKey prompt_key() const;
        std::string get_password_from_user(const std::string& prompt, bool confirm) const;

        // --- Core Workflow Step ---
        void execute(Operation operation, const Core::Pipeline& pipeline);

        Config::Settings settings_;
        std::istream& in_;
        std::ostream& out_;
        std::ostream& err_;
    };

} // namespace Symseal::UI

#endif // SYMSEAL_UI_APPLICATION_HPP
