#ifndef SYMSEAL_LOG_HPP
#define SYMSEAL_LOG_HPP

#include <string>
#ifndef NDEBUG
#include <iostream>
#endif

namespace Symseal {

    /**
     * @brief Writes a diagnostic line to std::clog in debug builds only.
     * Never pass key material, passwords or plaintext.
     */
    inline void debug_log(const std::string& message) {
#ifndef NDEBUG // Print only in debug builds
        std::clog << "Debug: " << message << std::endl;
#else
        (void)message;
#endif
    }

} // namespace Symseal

#endif // SYMSEAL_LOG_HPP
