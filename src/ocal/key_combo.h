#ifndef MARIONETTE_KEY_COMBO_H
#define MARIONETTE_KEY_COMBO_H

#include <string>
#include <vector>

namespace marionette {
namespace ocal {

enum class Modifier {
    CTRL,
    SHIFT,
    ALT,
    META
};

/**
 * @brief A chord such as "ctrl+shift+s": modifiers held while one key is tapped.
 *
 * key is either a single printable character ("s", "5", "/") or one of the
 * canonical names: enter, tab, escape, space, backspace, delete, insert,
 * home, end, pageup, pagedown, up, down, left, right, f1 .. f12.
 */
struct KeyCombo {
    std::vector<Modifier> modifiers;
    std::string key;

    bool hasModifier(Modifier m) const;
    bool isNamedKey() const { return key.size() > 1; }
    std::string toString() const;
};

/**
 * @brief Parse "ctrl+s", "Alt+F4", "shift+tab", "enter", "ctrl+plus".
 *
 * Names are case-insensitive; "control", "cmd", "win", "super", "return",
 * "esc", "del", "pgup", "pgdn" and "plus" are accepted as aliases.
 * @throws std::invalid_argument for an empty chord, an unknown key name or
 *         more than one non-modifier key
 */
KeyCombo parseKeyCombo(const std::string& text);

std::string modifierToString(Modifier m);

} // namespace ocal
} // namespace marionette

#endif // MARIONETTE_KEY_COMBO_H
