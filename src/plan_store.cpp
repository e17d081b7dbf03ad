#include "planfix/plan_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <utility>

namespace planfix {

PlanStore::PlanStore(std::string path) : path_(std::move(path)) {}

std::vector<SavedPlan> PlanStore::read_all() const {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        spdlog::info("[PlanStore] No saved plans at {}", path_);
        return {};
    }

    std::ifstream file(path_);
    if (!file) throw std::runtime_error("Cannot open " + path_);

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (json.find_first_not_of(" \t\r\n") == std::string::npos) return {};

    try {
        return saved_plans_from_json(json);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Malformed plan store " + path_ + ": " + e.what());
    }
}

void PlanStore::write_all(const std::vector<SavedPlan>& plans) const {
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) throw std::runtime_error("Cannot open " + tmp_path);
        file << to_json(plans);
        file.flush();
        if (!file) throw std::runtime_error("Cannot write " + tmp_path);
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw std::runtime_error("Cannot replace " + path_);
    }
}

std::vector<SavedPlan> PlanStore::load() const {
    auto plans = read_all();
    std::stable_sort(plans.begin(), plans.end(), [](const SavedPlan& a, const SavedPlan& b) {
        return a.last_opened > b.last_opened;
    });
    spdlog::info("[PlanStore] Loaded {} plans from {}", plans.size(), path_);
    return plans;
}

void PlanStore::save(const SavedPlan& plan) {
    auto plans = read_all();
    plans.erase(std::remove_if(plans.begin(), plans.end(), [&](const SavedPlan& p) {
        return p.id == plan.id || p.file_path == plan.file_path;
    }), plans.end());
    plans.push_back(plan);

    write_all(plans);
    spdlog::info("[PlanStore] Saved plan '{}' ({} total)", plan.name, plans.size());
}

bool PlanStore::remove(const std::string& id) {
    auto plans = read_all();
    auto it = std::remove_if(plans.begin(), plans.end(), [&](const SavedPlan& p) { return p.id == id; });
    if (it == plans.end()) {
        spdlog::warn("[PlanStore] No plan with id '{}'", id);
        return false;
    }
    plans.erase(it, plans.end());

    write_all(plans);
    spdlog::info("[PlanStore] Removed plan '{}'", id);
    return true;
}

} // namespace planfix
