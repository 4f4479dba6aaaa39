#pragma once

#include <string>
#include <vector>

// Ordered set of template ids (TemplateEntry::rel_path).
// Insertion order is selection order; an id can appear at most once.
class SelectionSet {
public:
    SelectionSet() = default;

    // Returns false if the id is already selected
    bool add(const std::string& id);

    // Returns false if the id was not selected. Order of the rest is kept.
    bool remove(const std::string& id);

    // Add if absent, remove if present. Returns true if now selected.
    bool toggle(const std::string& id);

    bool contains(const std::string& id) const;

    // 1-based position in selection order, 0 if not selected
    size_t position(const std::string& id) const;

    void clear() { ids_.clear(); }
    bool empty() const { return ids_.empty(); }
    size_t size() const { return ids_.size(); }

    const std::vector<std::string>& ids() const { return ids_; }

private:
    std::vector<std::string> ids_;
};
