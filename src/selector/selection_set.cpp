#include "selection_set.hpp"
#include <algorithm>

bool SelectionSet::add(const std::string& id) {
    if (contains(id)) return false;
    ids_.push_back(id);
    return true;
}

bool SelectionSet::remove(const std::string& id) {
    auto it = std::find(ids_.begin(), ids_.end(), id);
    if (it == ids_.end()) return false;
    ids_.erase(it);
    return true;
}

bool SelectionSet::toggle(const std::string& id) {
    if (remove(id)) return false;
    ids_.push_back(id);
    return true;
}

bool SelectionSet::contains(const std::string& id) const {
    return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
}

size_t SelectionSet::position(const std::string& id) const {
    auto it = std::find(ids_.begin(), ids_.end(), id);
    if (it == ids_.end()) return 0;
    return static_cast<size_t>(it - ids_.begin()) + 1;
}
