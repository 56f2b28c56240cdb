/**
 * @file at_command.cpp
 * @brief AT response helpers and parameter tokenizer
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <cctype>

#include "../include/at/at_command.hpp"

namespace ublox {

    // === AtResponse ===

    std::optional<std::string> AtResponse::line_with(const std::string& prefix) const {
        for (const auto& line : lines) {
            if (line.compare(0, prefix.size(), prefix) == 0) {
                return line;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> AtResponse::params(const std::string& prefix) const {
        auto line = line_with(prefix);
        if (!line) {
            return {};
        }
        return params_after(*line, prefix);
    }

    // === Text helpers ===

    std::string trim(const std::string& text) {
        std::size_t begin = 0;
        std::size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
            --end;
        }
        return text.substr(begin, end - begin);
    }

    std::vector<std::string> split_params(const std::string& body) {
        std::vector<std::string> params;
        if (trim(body).empty()) {
            return params;
        }

        std::string current;
        bool in_quotes = false;
        bool escaped = false;
        for (char c : body) {
            if (escaped) {
                current.push_back(c);
                escaped = false;
            } else if (in_quotes && c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_quotes = !in_quotes;
            } else if (c == ',' && !in_quotes) {
                params.push_back(trim(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        params.push_back(trim(current));
        return params;
    }

    std::vector<std::string> params_after(const std::string& line, const std::string& prefix) {
        if (line.compare(0, prefix.size(), prefix) != 0) {
            return {};
        }
        std::string body = line.substr(prefix.size());
        if (!body.empty() && body[0] == ':') {
            body.erase(0, 1);
        }
        return split_params(body);
    }

    std::optional<int> to_int(const std::string& param) {
        std::string text = trim(param);
        if (text.empty()) {
            return std::nullopt;
        }
        std::size_t start = (text[0] == '-') ? 1 : 0;
        if (start == text.size() || text.size() - start > 9) {
            return std::nullopt;
        }
        for (std::size_t i = start; i < text.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                return std::nullopt;
            }
        }
        return std::stoi(text);
    }

    std::string quote(const std::string& value) {
        std::string out = "\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

} // namespace ublox
