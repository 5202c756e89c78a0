#include <utility>
#include "disk_triage/types.hpp"

namespace disk_triage {

    bool ItemTable::add(Item item) {
        if (index.count(item.path) != 0) {
            return false;
        }
        index.emplace(item.path, items.size());
        items.push_back(std::move(item));
        return true;
    }

    Item* ItemTable::find(const std::string& path) {
        auto it = index.find(path);
        return it == index.end() ? nullptr : &items[it->second];
    }

    const Item* ItemTable::find(const std::string& path) const {
        auto it = index.find(path);
        return it == index.end() ? nullptr : &items[it->second];
    }
}
