#pragma once

#include "planfix/saved_plan.hpp"

#include <string>
#include <vector>

namespace planfix {

// Saved plans kept as a JSON array in a single file.
class PlanStore {
public:
    explicit PlanStore(std::string path);

    // Most recently opened first. A missing file is an empty store.
    std::vector<SavedPlan> load() const;

    // Replaces any plan with the same id or the same file path.
    void save(const SavedPlan& plan);

    // Returns false if no plan has this id.
    bool remove(const std::string& id);

    const std::string& path() const { return path_; }

private:
    std::vector<SavedPlan> read_all() const;
    void write_all(const std::vector<SavedPlan>& plans) const;

    std::string path_;
};

} // namespace planfix
