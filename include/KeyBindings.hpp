#pragma once
#include <expected>
#include <string>

/**
 * @enum Command
 * @brief Actions the monitor window reacts to.
 */
enum class Command { None, Start, Stop, Quit };

/**
 * @struct KeyBindings
 * @brief Key codes (as reported by cv::waitKeyEx) mapped to commands.
 */
struct KeyBindings {
    int start{'s'};
    int stop{'x'};
    int quit{27};

    /**
     * @brief Builds bindings from configured key names.
     * @return std::expected containing the bindings or the first invalid name.
     */
    static std::expected<KeyBindings, std::string> from_names(
        const std::string& start, const std::string& stop, const std::string& quit);

    /**
     * @brief Maps a pressed key to a command. Negative codes (no key) and special keys above 0xFF map to None.
     */
    Command command_for(int key) const;
};

/**
 * @brief Translates a key name (e.g., "S", "space", "Esc") into its key code.
 *
 * Letters are case-insensitive and map to the lower-case code.
 */
std::expected<int, std::string> parse_key(const std::string& name);
