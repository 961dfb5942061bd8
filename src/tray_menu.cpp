#include "tray_menu.hpp"

const char *const kMenuOpen = "open";
const char *const kMenuModules = "modules";
const char *const kMenuConfigFolder = "config_folder";
const char *const kMenuLogFolder = "log_folder";
const char *const kMenuQuit = "quit";

namespace {
// ─────────────────────────────────────
int Number(MenuItem &item, int next) {
    for (auto &child : item.children) {
        child.id = next++;
        next = Number(child, next);
    }
    return next;
}

// ─────────────────────────────────────
const MenuItem *FindIn(const MenuItem &item, const std::string &key, int id, bool byKey) {
    if (byKey ? item.key == key : item.id == id) {
        return &item;
    }
    for (const auto &child : item.children) {
        if (const MenuItem *found = FindIn(child, key, id, byKey)) {
            return found;
        }
    }
    return nullptr;
}

// ─────────────────────────────────────
MenuItem Item(const std::string &key, const std::string &label) {
    MenuItem item;
    item.key = key;
    item.label = label;
    return item;
}

// ─────────────────────────────────────
MenuItem Separator() {
    MenuItem item;
    item.type = MENU_SEPARATOR;
    return item;
}
} // namespace

// ─────────────────────────────────────
MenuModel::MenuModel() {
    m_Root.id = 0;
    m_Root.type = MENU_SUBMENU;
}

// ─────────────────────────────────────
MenuItem &MenuModel::Append(MenuItem item) {
    return AppendTo(m_Root, std::move(item));
}

// ─────────────────────────────────────
MenuItem &MenuModel::AppendTo(MenuItem &parent, MenuItem item) {
    parent.children.push_back(std::move(item));
    return parent.children.back();
}

// ─────────────────────────────────────
void MenuModel::Renumber() {
    m_Root.id = 0;
    Number(m_Root, 1);
}

// ─────────────────────────────────────
const MenuItem *MenuModel::FindById(int id) const {
    return FindIn(m_Root, {}, id, false);
}

// ─────────────────────────────────────
const MenuItem *MenuModel::FindByKey(const std::string &key) const {
    if (key.empty()) {
        return nullptr;
    }
    return FindIn(m_Root, key, 0, true);
}

// ─────────────────────────────────────
MenuModel BuildTrayMenu(const ModuleSnapshot &snapshot) {
    MenuModel menu;
    menu.Append(Item(kMenuOpen, "Open Dashboard"));

    MenuItem modules = Item(kMenuModules, "Modules");
    modules.type = MENU_SUBMENU;

    // Known modules first (std::map keeps them sorted), then anything discovered but never started
    for (const auto &[name, running] : snapshot.running) {
        MenuItem item = Item(name, name);
        item.type = MENU_CHECKMARK;
        item.checked = running;
        modules.children.push_back(std::move(item));
    }
    for (const auto &name : snapshot.discovered) {
        if (snapshot.running.count(name) == 0) {
            modules.children.push_back(Item(name, name));
        }
    }
    if (modules.children.empty()) {
        MenuItem empty = Item({}, "No modules found");
        empty.enabled = false;
        modules.children.push_back(std::move(empty));
    }
    menu.Append(std::move(modules));

    menu.Append(Separator());
    menu.Append(Item(kMenuConfigFolder, "Config folder"));
    menu.Append(Item(kMenuLogFolder, "Log folder"));
    menu.Append(Separator());
    menu.Append(Item(kMenuQuit, "Quit ActivityWatch"));

    menu.Renumber();
    return menu;
}
