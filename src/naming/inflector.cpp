// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "inflector.hpp"

#include <cctype>

namespace relata::naming::inflector {

namespace {

bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool isLower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

char toUpper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char toLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string toLowerCopy(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = toLower(c);
    }
    return result;
}

bool isVowel(char c) {
    switch (toLower(c)) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u':
            return true;
        default:
            return false;
    }
}

}  // namespace

std::vector<std::string> splitWords(std::string_view text) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (!isWordChar(c)) {
            flush();
            continue;
        }

        if (!current.empty() && isUpper(c)) {
            const char prev = current.back();
            const bool nextIsLower = i + 1 < text.size() && isLower(text[i + 1]);
            // "petOwner" splits before 'O'; "HTTPRequest" splits before 'R'
            if (isLower(prev) || isDigit(prev) ||
                (isUpper(prev) && nextIsLower)) {
                flush();
            }
        }
        current.push_back(c);
    }
    flush();
    return words;
}

std::string camelCase(std::string_view text) {
    std::string result;
    bool first = true;
    for (const auto& word : splitWords(text)) {
        auto lowered = toLowerCopy(word);
        if (first) {
            result += lowered;
            first = false;
        } else {
            result += upperFirst(lowered);
        }
    }
    return result;
}

std::string upperFirst(std::string_view text) {
    std::string result(text);
    if (!result.empty()) {
        result.front() = toUpper(result.front());
    }
    return result;
}

std::string lowerFirst(std::string_view text) {
    std::string result(text);
    if (!result.empty()) {
        result.front() = toLower(result.front());
    }
    return result;
}

std::string plural(std::string_view word) {
    std::string result(word);
    if (result.empty()) {
        return result;
    }

    const auto lowered = toLowerCopy(word);
    const auto endsWith = [&lowered](std::string_view suffix) {
        return lowered.size() >= suffix.size() &&
               lowered.compare(lowered.size() - suffix.size(), suffix.size(),
                               suffix) == 0;
    };

    if (lowered.size() > 1 && endsWith("y") &&
        !isVowel(lowered[lowered.size() - 2])) {
        result.pop_back();
        result += "ies";
    } else if (endsWith("s") || endsWith("x") || endsWith("z") ||
               endsWith("ch") || endsWith("sh")) {
        result += "es";
    } else {
        result += "s";
    }
    return result;
}

}  // namespace relata::naming::inflector
