#pragma once

#include <string>
#include <vector>

#include "common.hpp"

enum MenuItemType { MENU_STANDARD, MENU_SEPARATOR, MENU_CHECKMARK, MENU_SUBMENU };

struct MenuItem {
    int id = 0;
    std::string key;
    std::string label;
    MenuItemType type = MENU_STANDARD;
    bool enabled = true;
    bool checked = false;
    std::vector<MenuItem> children;
};

// Tree rendered by the tray. Ids are assigned depth-first starting at 1; the root is 0.
class MenuModel {
  public:
    MenuModel();

    const MenuItem &Root() const {
        return m_Root;
    }

    MenuItem &Append(MenuItem item);
    MenuItem &AppendTo(MenuItem &parent, MenuItem item);
    void Renumber();

    const MenuItem *FindById(int id) const;
    const MenuItem *FindByKey(const std::string &key) const;

  private:
    MenuItem m_Root;
};

// Keys of the fixed entries. Module entries use the module name.
extern const char *const kMenuOpen;
extern const char *const kMenuModules;
extern const char *const kMenuConfigFolder;
extern const char *const kMenuLogFolder;
extern const char *const kMenuQuit;

MenuModel BuildTrayMenu(const ModuleSnapshot &snapshot);
