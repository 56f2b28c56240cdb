/**
 * @file at_command.hpp
 * @brief AT request and collected response
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../io/clock.hpp"

namespace ublox {

    /**
     * @brief One AT request and the grammar of its expected reply
     */
    struct AtCommand {
        std::string text;             ///< Without line terminator, e.g. "AT+UDCP=\"tcp://...\""
        std::string response_prefix;  ///< Information lines owned by this command ("+UDCP")
        Millis timeout{1000};
        bool switches_to_edm = false; ///< Module leaves text mode after the final OK

        /// Text as written on the wire
        std::string wire() const {
            return text + "\r\n";
        }

        /**
         * @brief Expected-response test for an information line
         *
         * With a prefix only lines starting with it belong to the command.
         * Without one, any line that does not start with '+' does (AT+GMR
         * answers with a bare quoted string).
         */
        bool expects(const std::string& line) const {
            if (!response_prefix.empty()) {
                return line.compare(0, response_prefix.size(), response_prefix) == 0;
            }
            return !line.empty() && line[0] != '+';
        }
    };

    /**
     * @brief Information lines collected for a command that ended in OK
     */
    struct AtResponse {
        std::vector<std::string> lines;

        bool empty() const { return lines.empty(); }

        /// First line starting with prefix
        std::optional<std::string> line_with(const std::string& prefix) const;

        /**
         * @brief Parameters of the first "+PREFIX:a,b,..." line
         * @return Empty vector if no line carries the prefix
         */
        std::vector<std::string> params(const std::string& prefix) const;
    };

    // === Text helpers ===

    std::string trim(const std::string& text);

    /**
     * @brief Split "a,\"b,c\",d" into {"a", "b,c", "d"}, quotes removed
     */
    std::vector<std::string> split_params(const std::string& body);

    /**
     * @brief Parameters following "PREFIX:" in a line ("+UUDPD:3" -> {"3"})
     */
    std::vector<std::string> params_after(const std::string& line, const std::string& prefix);

    /**
     * @brief Parse a decimal parameter
     */
    std::optional<int> to_int(const std::string& param);

    /// Double quotes and backslashes escaped for a quoted AT string argument
    std::string quote(const std::string& value);

} // namespace ublox
