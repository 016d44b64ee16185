#pragma once

#include <rvfs/status.h>

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace rvfs {
    /// @brief Hexadecimal formatting for integers.
    struct Hex {
        uint64_t value;
        int width = 0;
        char fill = ' ';

        constexpr Hex(uint64_t value) noexcept
            : value(value)
        { }

        constexpr Hex pad(int newWidth, char newFill = '0') const noexcept {
            Hex result = *this;
            result.width = newWidth;
            result.fill = newFill;
            return result;
        }
    };

    std::ostream& operator<<(std::ostream& out, Hex value);

    /// @brief Get the display name of a status code.
    ///
    /// @param status The status to name.
    ///
    /// @return The name of the status, or "Unknown".
    std::string_view StatusName(RvfsStatus status) noexcept;

    template<typename... Args>
    std::string concat(Args&&... args) {
        std::ostringstream out;
        (out << ... << std::forward<Args>(args));
        return out.str();
    }
}

/// @brief Formats a status as its name followed by its code.
std::ostream& operator<<(std::ostream& out, RvfsStatusId value);
