#ifndef SYMSEAL_CORE_ENCRYPTABLE_HPP
#define SYMSEAL_CORE_ENCRYPTABLE_HPP

#include "symseal/types.hpp"         // For PrivateKey
#include "symseal/core/pipeline.hpp"
#include "symseal/data/value.hpp"
#include <string>
#include <typeindex>
#include <typeinfo>

namespace Symseal::Core {

    /**
     * @brief Gives a host type a class-level private key and the four encryption operations.
     *
     * Usage:
     *
     *     class Account : public Symseal::Core::Encryptable<Account> {
     *     public:
     *         void set_secret(const std::string& s) { secret_ = encr(s, private_key()); }
     *         std::string secret() const { return decr(secret_, private_key()).as_string(); }
     *     private:
     *         std::string secret_;
     *     };
     *
     * Each Host gets its own key slot in default_pipeline()'s key manager. All operations use
     * the process-wide configuration, which is frozen by the first of them.
     */
    template <typename Host>
    class Encryptable {
    public:
        /** @brief A new random key for the data cipher. Not cached. */
        static PrivateKey generate_key() {
            return default_pipeline().key_manager().generate_key();
        }

        /** @brief The key cached for Host, created on first access. */
        static PrivateKey private_key() {
            return default_pipeline().key_manager().get_or_create_cached_key(std::type_index(typeid(Host)));
        }

        /** @brief Assigns the key cached for Host and returns it. */
        static PrivateKey private_key(const PrivateKey& value) {
            default_pipeline().key_manager().set_cached_key(std::type_index(typeid(Host)), value);
            return value;
        }

        std::string encr(const Data::Value& value, const PrivateKey& key) const {
            return default_pipeline().encrypt_with_key(value, key);
        }

        Data::Value decr(const std::string& token, const PrivateKey& key) const {
            return default_pipeline().decrypt_with_key(token, key);
        }

        std::string encr_password(const Data::Value& value, const std::string& password) const {
            return default_pipeline().encrypt_with_password(value, password);
        }

        Data::Value decr_password(const std::string& token, const std::string& password) const {
            return default_pipeline().decrypt_with_password(token, password);
        }

    protected:
        Encryptable() = default;
        ~Encryptable() = default;
    };

} // namespace Symseal::Core

#endif // SYMSEAL_CORE_ENCRYPTABLE_HPP
