#include "settings.hpp"
#include "symseal/crypto/cipher.hpp"     // Cipher name resolution
#include "symseal/data/compressor.hpp"   // Compression level validation
#include "symseal/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib> // std::getenv
#include <mutex>
#include <stdexcept>

namespace Symseal::Config {

    namespace {

        struct GlobalState {
            std::mutex mutex;
            Settings settings;
            bool frozen = false;
        };

        GlobalState& global_state() {
            static GlobalState state;
            return state;
        }

        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        bool parse_bool(const std::string& name, std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
            if (text == "0" || text == "false" || text == "no" || text == "off") return false;
            throw ConfigurationError(name + " must be a boolean (true/false), got '" + text + "'.");
        }

        int parse_int(const std::string& name, const std::string& text) {
            try {
                size_t consumed = 0;
                int value = std::stoi(text, &consumed);
                if (consumed != text.size()) {
                    throw ConfigurationError(name + " must be an integer, got '" + text + "'.");
                }
                return value;
            } catch (const std::invalid_argument&) {
                throw ConfigurationError(name + " must be an integer, got '" + text + "'.");
            } catch (const std::out_of_range&) {
                throw ConfigurationError(name + " is out of range: '" + text + "'.");
            }
        }

    } // namespace

    void Settings::validate() const {
        // Each construction resolves the name through OpenSSL and throws on failure.
        Crypto::Cipher data(data_cipher);
        Crypto::Cipher password(password_cipher);
        Crypto::Cipher private_key(private_key_cipher);
        Data::validate_compression_level(compression_level);
    }

    Settings Settings::from_environment(const Settings& base) {
        Settings result = base;
        if (const char* v = env("SYMSEAL_DATA_CIPHER")) {
            result.data_cipher = v;
        }
        if (const char* v = env("SYMSEAL_PASSWORD_CIPHER")) {
            result.password_cipher = v;
        }
        if (const char* v = env("SYMSEAL_PRIVATE_KEY_CIPHER")) {
            result.private_key_cipher = v;
        }
        if (const char* v = env("SYMSEAL_COMPRESSION_ENABLED")) {
            result.compression_enabled = parse_bool("SYMSEAL_COMPRESSION_ENABLED", v);
        }
        if (const char* v = env("SYMSEAL_COMPRESSION_LEVEL")) {
            result.compression_level = parse_int("SYMSEAL_COMPRESSION_LEVEL", v);
        }
        return result;
    }

    Settings Settings::from_environment() {
        return from_environment(Settings());
    }

    void Configuration::configure(const std::function<void(Settings&)>& update) {
        GlobalState& state = global_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.frozen) {
            throw ConfigurationError("Configuration is frozen: configure() must run before the first encryption.");
        }
        Settings candidate = state.settings;
        update(candidate);
        candidate.validate();
        state.settings = candidate;
        debug_log("Configuration updated: data_cipher=" + candidate.data_cipher +
                  ", password_cipher=" + candidate.password_cipher +
                  ", compression=" + (candidate.compression_enabled ? "on" : "off"));
    }

    const Settings& Configuration::settings() {
        GlobalState& state = global_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.frozen) {
            state.frozen = true;
            debug_log("Configuration frozen.");
        }
        return state.settings;
    }

    bool Configuration::frozen() {
        GlobalState& state = global_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        return state.frozen;
    }

} // namespace Symseal::Config
