#include "key_combo.h"
#include "../common/string_utils.h"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace marionette {
namespace ocal {

namespace {
    using utils::StringUtils;

    const std::map<std::string, Modifier> MODIFIER_NAMES = {
        {"ctrl", Modifier::CTRL}, {"control", Modifier::CTRL},
        {"shift", Modifier::SHIFT},
        {"alt", Modifier::ALT}, {"option", Modifier::ALT},
        {"meta", Modifier::META}, {"win", Modifier::META}, {"windows", Modifier::META},
        {"super", Modifier::META}, {"cmd", Modifier::META}
    };

    const std::map<std::string, std::string> KEY_ALIASES = {
        {"return", "enter"}, {"esc", "escape"}, {"del", "delete"}, {"ins", "insert"},
        {"pgup", "pageup"}, {"page_up", "pageup"}, {"pgdn", "pagedown"}, {"page_down", "pagedown"},
        {"arrowup", "up"}, {"arrowdown", "down"}, {"arrowleft", "left"}, {"arrowright", "right"},
        {"back", "backspace"}, {"spacebar", "space"}, {"plus", "+"}, {"minus", "-"}
    };

    const std::set<std::string> NAMED_KEYS = {
        "enter", "tab", "escape", "space", "backspace", "delete", "insert",
        "home", "end", "pageup", "pagedown", "up", "down", "left", "right",
        "f1", "f2", "f3", "f4", "f5", "f6", "f7", "f8", "f9", "f10", "f11", "f12"
    };
}

bool KeyCombo::hasModifier(Modifier m) const {
    return std::find(modifiers.begin(), modifiers.end(), m) != modifiers.end();
}

std::string KeyCombo::toString() const {
    std::string result;
    for (Modifier m : modifiers) {
        result += modifierToString(m) + "+";
    }
    return result + key;
}

std::string modifierToString(Modifier m) {
    switch (m) {
        case Modifier::CTRL: return "ctrl";
        case Modifier::SHIFT: return "shift";
        case Modifier::ALT: return "alt";
        case Modifier::META: return "meta";
    }
    return "unknown";
}

KeyCombo parseKeyCombo(const std::string& text) {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) {
        throw std::invalid_argument("Empty key combination");
    }

    // A lone "+" means the plus key itself; "ctrl++" is ctrl with plus
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (c == '+' && !current.empty()) {
            parts.push_back(StringUtils::trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(StringUtils::trim(current));
    }

    KeyCombo combo;
    for (const auto& raw : parts) {
        if (raw.empty()) {
            throw std::invalid_argument("Malformed key combination: " + text);
        }

        std::string lower = StringUtils::toLowerCase(raw);
        auto modifier = MODIFIER_NAMES.find(lower);
        if (modifier != MODIFIER_NAMES.end()) {
            if (!combo.hasModifier(modifier->second)) {
                combo.modifiers.push_back(modifier->second);
            }
            continue;
        }

        if (!combo.key.empty()) {
            throw std::invalid_argument("Key combination has more than one key: " + text);
        }

        auto alias = KEY_ALIASES.find(lower);
        if (alias != KEY_ALIASES.end()) {
            lower = alias->second;
        }

        if (raw.size() == 1) {
            // Keep the character as written so "A" and "a" stay distinguishable
            combo.key = raw;
        } else if (lower.size() == 1 || NAMED_KEYS.count(lower) > 0) {
            combo.key = lower;
        } else {
            throw std::invalid_argument("Unknown key name '" + raw + "' in: " + text);
        }
    }

    if (combo.key.empty()) {
        throw std::invalid_argument("Key combination has no key: " + text);
    }
    return combo;
}

} // namespace ocal
} // namespace marionette
