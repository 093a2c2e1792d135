#include "KeyBindings.hpp"
#include <algorithm>
#include <cctype>
#include <map>

std::expected<int, std::string> parse_key(const std::string& name) {
    static const std::map<std::string, int> key_map = {
        {"SPACE", ' '}, {"ESC", 27}, {"ESCAPE", 27}, {"ENTER", 13}, {"RETURN", 13}, {"TAB", 9}
    };

    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (key_map.contains(upper)) {
        return key_map.at(upper);
    }
    if (name.size() == 1 && std::isgraph(static_cast<unsigned char>(name[0]))) {
        return std::tolower(static_cast<unsigned char>(name[0]));
    }
    return std::unexpected("Unknown key name: '" + name + "'");
}

std::expected<KeyBindings, std::string> KeyBindings::from_names(
    const std::string& start, const std::string& stop, const std::string& quit) {
    auto s = parse_key(start);
    if (!s) return std::unexpected(s.error());
    auto x = parse_key(stop);
    if (!x) return std::unexpected(x.error());
    auto q = parse_key(quit);
    if (!q) return std::unexpected(q.error());

    if (*s == *x || *s == *q || *x == *q) {
        return std::unexpected("Start, stop and quit keys must differ");
    }
    return KeyBindings{*s, *x, *q};
}

Command KeyBindings::command_for(int key) const {
    // Codes above 0xFF are special keys (arrows, function keys) from waitKeyEx
    if (key < 0 || key > 0xFF) return Command::None;
    if (std::isalpha(key)) key = std::tolower(key);

    if (key == start) return Command::Start;
    if (key == stop) return Command::Stop;
    if (key == quit) return Command::Quit;
    return Command::None;
}
