#include "ranked_family.hpp"

namespace matroidcore {

bool RankedFamily::insert(Rank key, const Subset& subset) {
    if (!keys_.emplace(subset, key).second) {
        return false;
    }
    parts_[key].push_back(subset);
    return true;
}

const std::vector<Subset>& RankedFamily::at(Rank key) const {
    static const std::vector<Subset> none;
    auto it = parts_.find(key);
    return it == parts_.end() ? none : it->second;
}

std::optional<Rank> RankedFamily::min_key() const {
    if (parts_.empty()) {
        return std::nullopt;
    }
    return parts_.begin()->first;
}

std::optional<Rank> RankedFamily::max_key() const {
    if (parts_.empty()) {
        return std::nullopt;
    }
    return parts_.rbegin()->first;
}

std::optional<Rank> RankedFamily::key_of(const Subset& subset) const {
    auto it = keys_.find(subset);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Subset* RankedFamily::first_superset(const Subset& x, Rank* key_out) const {
    for (const auto& [key, group] : parts_) {
        for (const auto& s : group) {
            if (x.is_subset_of(s)) {
                if (key_out) {
                    *key_out = key;
                }
                return &s;
            }
        }
    }
    return nullptr;
}

const Subset* RankedFamily::first_subset(const Subset& x, Rank max_key) const {
    for (const auto& [key, group] : parts_) {
        if (key > max_key) {
            break;
        }
        for (const auto& s : group) {
            if (s.is_subset_of(x)) {
                return &s;
            }
        }
    }
    return nullptr;
}

std::vector<Subset> RankedFamily::members() const {
    std::vector<Subset> result;
    result.reserve(size());
    for (const auto& [key, group] : parts_) {
        result.insert(result.end(), group.begin(), group.end());
    }
    return result;
}

bool RankedFamily::operator==(const RankedFamily& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const auto& [subset, key] : keys_) {
        auto it = other.keys_.find(subset);
        if (it == other.keys_.end() || it->second != key) {
            return false;
        }
    }
    return true;
}

} // namespace matroidcore
