#ifndef SYMSEAL_CONFIG_SETTINGS_HPP
#define SYMSEAL_CONFIG_SETTINGS_HPP

#include "symseal/types.hpp" // For Constants, Exceptions
#include <functional>
#include <string>

namespace Symseal::Config {

    /**
     * @brief Tunables read by every pipeline component.
     * Components copy the struct at construction and never observe later changes.
     */
    struct Settings {
        std::string data_cipher = Constants::DEFAULT_DATA_CIPHER;
        std::string password_cipher = Constants::DEFAULT_PASSWORD_CIPHER;
        std::string private_key_cipher = Constants::DEFAULT_DATA_CIPHER;
        bool compression_enabled = Constants::DEFAULT_COMPRESSION_ENABLED;
        int compression_level = Constants::MAX_COMPRESSION_LEVEL;

        /**
         * @brief Checks that every cipher name resolves and the compression level is in range.
         * @throws ConfigurationError describing the first problem found.
         */
        void validate() const;

        /**
         * @brief Returns base overlaid with any SYMSEAL_DATA_CIPHER, SYMSEAL_PASSWORD_CIPHER,
         * SYMSEAL_PRIVATE_KEY_CIPHER, SYMSEAL_COMPRESSION_ENABLED and SYMSEAL_COMPRESSION_LEVEL
         * variables present in the environment. The result is not validated.
         * @throws ConfigurationError if a boolean or integer variable cannot be parsed.
         */
        static Settings from_environment(const Settings& base);

        /** @brief from_environment() over the default settings. */
        static Settings from_environment();
    };

    /**
     * @brief Holder of the one process-wide Settings instance used by Encryptable types.
     *
     * configure() may be called any number of times until the first call to settings();
     * after that the instance is frozen and configure() throws. Mutating the settings while
     * operations are in flight is not possible through this interface.
     */
    class Configuration {
    public:
        /**
         * @brief Applies an update to the process-wide settings and validates the result.
         * On failure the previous settings are kept.
         * @throws ConfigurationError if already frozen or the result is invalid.
         */
        static void configure(const std::function<void(Settings&)>& update);

        /** @brief Returns the process-wide settings, freezing them on first call. */
        static const Settings& settings();

        /** @brief True once settings() has been called. */
        static bool frozen();

        Configuration() = delete;
    };

} // namespace Symseal::Config

#endif // SYMSEAL_CONFIG_SETTINGS_HPP
