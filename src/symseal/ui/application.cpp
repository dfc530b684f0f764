#include "application.hpp"
#include "symseal/core/pipeline.hpp"        // The processing engine
#include "symseal/crypto/key_manager.hpp"   // Key text encoding
#include "symseal/crypto/primitives.hpp"    // secure_zero_memory
#include "symseal/data/value.hpp"
#include "symseal/types.hpp"                // Constants, Exceptions, types

#include <limits>
#include <utility>

namespace Symseal::UI {

    Application::Application(Config::Settings settings, std::istream& in, std::ostream& out, std::ostream& err)
            : settings_(std::move(settings)), in_(in), out_(out), err_(err) {}

    // --- User Interaction Helper Implementations ---

    void Application::print_banner() const {
        out_ << R"(
========================================
              Symseal v)" << static_cast<int>(Constants::TOKEN_VERSION) << R"(
   Symmetric Value Encryption Tool
========================================
)" << std::endl;
        out_ << "Data cipher: " << settings_.data_cipher
             << " | Password cipher: " << settings_.password_cipher
             << " | Compression: " << (settings_.compression_enabled ? "on" : "off") << "\n" << std::endl;
    }

    Application::Operation Application::prompt_operation() const {
        int choice = 0;
        out_ << "Select operation:\n";
        out_ << "  1. Generate key\n";
        out_ << "  2. Encrypt text with key\n";
        out_ << "  3. Decrypt token with key\n";
        out_ << "  4. Encrypt text with password\n";
        out_ << "  5. Decrypt token with password\n";
        out_ << "Choice [1-5]: ";
        while (!(in_ >> choice) || choice < 1 || choice > 5) {
            if (in_.eof()) throw UsageError("Input ended before an operation was chosen.");
            err_ << "Invalid input. Please enter a number from 1 to 5: ";
            in_.clear();
            in_.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
        in_.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return static_cast<Operation>(choice);
    }

    std::string Application::prompt_line(const std::string& prompt_message) const {
        std::string line;
        out_ << prompt_message << ": ";
        if (!std::getline(in_, line) || line.empty()) {
            throw UsageError("Input cannot be empty.");
        }
        return line;
    }

    PrivateKey Application::prompt_key() const {
        std::string text = prompt_line("Enter key (base64url)");
        PrivateKey key = Crypto::KeyManager::decode_key(text);
        Crypto::secure_zero_memory(text);
        return key;
    }

    std::string Application::get_password_from_user(const std::string& prompt, bool confirm) const {
        // TODO: Disable terminal echo while the password is typed
        std::string password = prompt_line(prompt);

        if (confirm) {
            std::string confirmation;
            try {
                confirmation = prompt_line("Confirm password");
            } catch (const UsageError&) {
                Crypto::secure_zero_memory(password);
                throw;
            }
            bool match = (password == confirmation);
            Crypto::secure_zero_memory(confirmation);
            if (!match) {
                Crypto::secure_zero_memory(password);
                throw UsageError("Passwords do not match.");
            }
        }
        return password;
    }

    // --- Core Workflow Step Implementation ---

    void Application::execute(Operation operation, const Core::Pipeline& pipeline) {
        PrivateKey key;
        std::string password;

        try {
            switch (operation) {
                case Operation::GenerateKey: {
                    key = pipeline.key_manager().generate_key();
                    out_ << Crypto::KeyManager::encode_key(key) << std::endl;
                    break;
                }
                case Operation::EncryptWithKey: {
                    key = prompt_key();
                    std::string text = prompt_line("Enter text to encrypt");
                    out_ << pipeline.encrypt_with_key(Data::Value(text), key) << std::endl;
                    Crypto::secure_zero_memory(text);
                    break;
                }
                case Operation::DecryptWithKey: {
                    key = prompt_key();
                    std::string token = prompt_line("Enter token");
                    Data::Value value = pipeline.decrypt_with_key(token, key);
                    out_ << (value.is_string() ? value.as_string() : value.inspect()) << std::endl;
                    break;
                }
                case Operation::EncryptWithPassword: {
                    password = get_password_from_user("Enter password", true /* confirm */);
                    std::string text = prompt_line("Enter text to encrypt");
                    out_ << "Deriving key from password (this may take a moment)..." << std::endl;
                    out_ << pipeline.encrypt_with_password(Data::Value(text), password) << std::endl;
                    Crypto::secure_zero_memory(text);
                    break;
                }
                case Operation::DecryptWithPassword: {
                    password = get_password_from_user("Enter password", false /* no confirm */);
                    std::string token = prompt_line("Enter token");
                    out_ << "Deriving key from password (this may take a moment)..." << std::endl;
                    Data::Value value = pipeline.decrypt_with_password(token, password);
                    out_ << (value.is_string() ? value.as_string() : value.inspect()) << std::endl;
                    break;
                }
            }
        } catch (...) {
            Crypto::secure_zero_memory(key);
            Crypto::secure_zero_memory(password);
            throw; // Re-throw
        }

        Crypto::secure_zero_memory(key);
        Crypto::secure_zero_memory(password);
    }

    int Application::run() {
        int exit_code = Constants::EXIT_OK;

        try {
            Core::Pipeline pipeline(settings_); // Validates the settings
            print_banner();
            Operation operation = prompt_operation();
            execute(operation, pipeline);

        } catch (const SymsealError& e) {
            err_ << "\nSymseal Error: " << e.what() << std::endl;
            exit_code = e.get_exit_code();
        } catch (const std::exception& e) {
            err_ << "\nUnexpected Standard Exception: " << e.what() << std::endl;
            exit_code = Constants::EXIT_INTERNAL_ERROR;
        }

        return exit_code;
    }

} // namespace Symseal::UI
