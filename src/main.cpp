#include "symseal/ui/application.hpp" // The application class
#include "symseal/config/settings.hpp"
#include "symseal/types.hpp"          // For Constants

#include <openssl/crypto.h>

#include <iostream>     // std::cerr
#include <exception>    // std::exception

// --- Main Function ---
int main(int argc, char* /*argv*/[]) {
    // --- Command Line Argument Check ---
    if (argc > 1) {
        // Symseal does not accept command line args, show usage.
        std::cerr << "Symseal - Symmetric Value Encryption Tool\n";
        std::cerr << "Usage: Run the executable without arguments and follow the prompts.\n";
        std::cerr << "Settings are read from SYMSEAL_DATA_CIPHER, SYMSEAL_PASSWORD_CIPHER,\n"
                     "SYMSEAL_PRIVATE_KEY_CIPHER, SYMSEAL_COMPRESSION_ENABLED and SYMSEAL_COMPRESSION_LEVEL.\n";
        return Symseal::Constants::EXIT_USAGE_ERROR;
    }

    // --- Initialize OpenSSL ---
    // Load error strings and algorithms before any OpenSSL functions are called.
    if (OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS | OPENSSL_INIT_ADD_ALL_CIPHERS |
                            OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr) != 1) {
        std::cerr << "Critical Error: OpenSSL initialization failed." << std::endl;
        return Symseal::Constants::EXIT_INTERNAL_ERROR;
    }

    // --- Application Execution ---
    int final_exit_code = Symseal::Constants::EXIT_INTERNAL_ERROR; // Default to error
    try {
        Symseal::UI::Application app(Symseal::Config::Settings::from_environment());
        final_exit_code = app.run(); // Handles its own errors and returns an exit code.
    } catch (const Symseal::SymsealError& e) {
        // Environment settings that could not be parsed.
        std::cerr << "\nSymseal Error: " << e.what() << std::endl;
        final_exit_code = e.get_exit_code();
    } catch (const std::exception& e) {
        std::cerr << "\nCritical Error: " << e.what() << std::endl;
        final_exit_code = Symseal::Constants::EXIT_INTERNAL_ERROR;
    }

    return final_exit_code;
}
