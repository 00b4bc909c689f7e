/**
 * @file LabelMap.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "LabelMap.hpp"
#include "Errors.hpp"

#include <stdexcept>  // std::out_of_range

LabelMap LabelMap::fromLabels(const std::vector<std::string>& labels) {
    LabelMap map;
    for (const auto& label : labels) {
        map.add(label);
    }
    return map;
}

int LabelMap::add(const std::string& label) {
    auto it = keys.find(label);
    if (it != keys.end()) {
        return it->second;
    }

    int key = static_cast<int>(values.size());
    values.push_back(label);
    keys.emplace(label, key);
    return key;
}

int LabelMap::keyOf(const std::string& label) const {
    auto it = keys.find(label);
    if (it == keys.end()) {
        throw UnseenLabelError(label);
    }
    return it->second;
}

bool LabelMap::contains(const std::string& label) const {
    return keys.count(label) != 0;
}

const std::string& LabelMap::valueOf(int key) const {
    if (key < 0 || key >= size()) {
        throw std::out_of_range("Class key out of range: " + std::to_string(key));
    }
    return values[key];
}
