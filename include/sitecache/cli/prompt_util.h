/**
 * Prompt utility helpers for interactive CLI workflows.
 *
 * Minimal std::cout/std::cin helpers that centralize prompt behavior and
 * default handling across commands.
 */
#pragma once
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sitecache::cli {

// --------------------------- Yes / No ---------------------------- //
struct YesNoOptions {
    bool defaultYes{true};      // What to return if user presses enter or invalid
    bool allowEmpty{true};      // If false, reprompt on empty input
    std::string yesChars{"yY"}; // Acceptable yes characters
    std::string noChars{"nN"};  // Acceptable no characters
    bool retryOnInvalid{false}; // If true, keep asking until valid
};

inline bool prompt_yes_no(const std::string& prompt, const YesNoOptions& opts = {}) {
    for (;;) {
        std::cout << prompt;
        std::string line;
        if (!std::getline(std::cin, line)) {
            return opts.defaultYes; // EOF -> default
        }
        if (line.empty()) {
            if (opts.allowEmpty || !opts.retryOnInvalid)
                return opts.defaultYes;
            continue;
        }
        char c = line[0];
        if (opts.yesChars.find(c) != std::string::npos)
            return true;
        if (opts.noChars.find(c) != std::string::npos)
            return false;
        if (!opts.retryOnInvalid)
            return opts.defaultYes;
    }
}

// --------------------------- Generic Input ---------------------------- //
struct InputOptions {
    std::string defaultValue{}; // Returned on empty when allowEmpty true
    bool allowEmpty{true};      // Accept empty and return defaultValue
    bool trimWhitespace{true};  // Trim leading/trailing whitespace
    bool retryOnInvalid{true};  // Reprompt if validator fails
    // Return an empty string if acceptable, otherwise the message shown before reprompting
    std::function<std::string(const std::string&)> validator{};
};

// `eof` is set when input ends; defaultValue is returned then
inline std::string prompt_input(const std::string& prompt, const InputOptions& opts = {},
                                bool* eof = nullptr) {
    if (eof)
        *eof = false;
    for (;;) {
        std::cout << prompt;
        std::string line;
        if (!std::getline(std::cin, line)) {
            if (eof)
                *eof = true;
            return opts.defaultValue;
        }
        if (opts.trimWhitespace) {
            size_t start = line.find_first_not_of(" \t\r\n");
            size_t end = line.find_last_not_of(" \t\r\n");
            if (start == std::string::npos)
                line.clear();
            else
                line = line.substr(start, end - start + 1);
        }
        if (line.empty()) {
            if (opts.allowEmpty)
                line = opts.defaultValue;
            else if (!opts.retryOnInvalid)
                return opts.defaultValue;
            else
                continue;
        }
        if (opts.validator) {
            auto problem = opts.validator(line);
            if (!problem.empty()) {
                std::cout << problem << "\n";
                if (!opts.retryOnInvalid)
                    return opts.defaultValue;
                continue;
            }
        }
        return line;
    }
}

// --------------------------- Choice / Menu ---------------------------- //
struct ChoiceItem {
    std::string value;       // Returned value
    std::string label;       // Shown label (if empty use value)
    std::string description; // Additional line printed under the choice
};

struct ChoiceOptions {
    size_t defaultIndex{0};    // 0-based index default
    bool allowEmpty{false};    // Enter to accept default
    bool retryOnInvalid{true}; // Reprompt on invalid index
    std::string prompt{};      // Overrides "Select a number (1-N)"
};

// Index of the chosen item; `eof` is set when input ends before a valid choice
inline size_t prompt_choice(const std::string& header, const std::vector<ChoiceItem>& items,
                            const ChoiceOptions& opts = {}, bool* eof = nullptr) {
    if (items.empty())
        throw std::invalid_argument("prompt_choice: items cannot be empty");
    if (eof)
        *eof = false;
    for (;;) {
        if (!header.empty())
            std::cout << header << "\n";
        for (size_t i = 0; i < items.size(); ++i) {
            const auto& it = items[i];
            std::cout << "  " << (i + 1) << ") " << (it.label.empty() ? it.value : it.label)
                      << "\n";
            if (!it.description.empty()) {
                std::cout << "     " << it.description << "\n";
            }
        }
        if (!opts.prompt.empty())
            std::cout << opts.prompt;
        else
            std::cout << "Select a number (1-" << items.size() << ")";
        if (opts.allowEmpty)
            std::cout << " [" << (opts.defaultIndex + 1) << "]";
        std::cout << ": ";
        std::string line;
        if (!std::getline(std::cin, line)) {
            if (eof)
                *eof = true;
            return opts.defaultIndex;
        }
        if (line.empty() && opts.allowEmpty)
            return opts.defaultIndex;
        size_t choice = 0;
        bool numeric = !line.empty() && line.size() < 10;
        for (char c : line) {
            if (c < '0' || c > '9') {
                numeric = false;
                break;
            }
            choice = choice * 10 + static_cast<size_t>(c - '0');
        }
        if (numeric && choice >= 1 && choice <= items.size())
            return choice - 1;
        std::cout << "Invalid selection. Please try again.\n";
        if (!opts.retryOnInvalid)
            return opts.defaultIndex;
    }
}

} // namespace sitecache::cli
