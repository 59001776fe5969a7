/**
 * @file Result.cpp
 * @brief FeatureVector implementation
 */

#include <PathoMorph/Grading/Result.h>

#include <algorithm>

namespace Patho::Morph::Grading {

void FeatureVector::Set(const std::string& name, double value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    entries_.emplace_back(name, value);
}

bool FeatureVector::Has(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const Entry& e) { return e.first == name; });
}

double FeatureVector::Get(const std::string& name, double fallback) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return entry.second;
    }
    return fallback;
}

} // namespace Patho::Morph::Grading
