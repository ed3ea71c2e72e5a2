#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "fragpipe/render/image.hpp"

namespace fragpipe {

/**
 * Images rendered so far, keyed by pass name, in render order.
 *
 * Entries are written once and never replaced or removed.
 */
class PassResults {
public:
    // Throws DuplicatePassNameError if the name is already present
    void insert(const std::string& name, Image image);

    bool contains(const std::string& name) const;

    // nullptr when absent
    const Image* find(const std::string& name) const;

    // Throws UnresolvedPassReferenceError when absent
    const Image& at(const std::string& name) const;

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    // Pass names in insertion order
    const std::vector<std::string>& names() const { return order_; }

private:
    std::unordered_map<std::string, Image> images_;
    std::vector<std::string> order_;
};

} // namespace fragpipe
