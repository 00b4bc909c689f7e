/**
 * =============================================================================
 * LabelMap.hpp - String Label <-> Dense Class Key Encoding
 * =============================================================================
 *
 * The trainer works with integer class keys 0, 1, ..., K-1, not with
 * strings. LabelMap is built once from the training labels and then used in
 * both directions:
 *
 *   "toaster"      -> 0     (encode, before training / evaluation)
 *   "not-toaster"  -> 1
 *   0              -> "toaster"   (decode, after prediction)
 *
 * Keys are assigned in order of first occurrence in the training data, so
 * the same training file always yields the same encoding.
 *
 * @file LabelMap.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

class LabelMap {
public:
    LabelMap() = default;

    /**
     * Build the map from labels in order of appearance.
     * Duplicates get the key of their first occurrence.
     *
     * @example
     * LabelMap map = LabelMap::fromLabels({"b", "a", "b", "c"});
     * // map.keyOf("b") == 0, map.keyOf("a") == 1, map.keyOf("c") == 2
     */
    static LabelMap fromLabels(const std::vector<std::string>& labels);

    /**
     * Adds a label if it is new.
     * @return The label's key
     */
    int add(const std::string& label);

    /**
     * @return The key of the label
     * @throws UnseenLabelError if the label was never added
     */
    int keyOf(const std::string& label) const;

    /** @return true if the label has a key */
    bool contains(const std::string& label) const;

    /**
     * @return The label of a key
     * @throws std::out_of_range if key is not in [0, size())
     */
    const std::string& valueOf(int key) const;

    int size() const { return static_cast<int>(values.size()); }

    /** Labels indexed by key */
    const std::vector<std::string>& labels() const { return values; }

private:
    std::vector<std::string> values;
    std::unordered_map<std::string, int> keys;
};
