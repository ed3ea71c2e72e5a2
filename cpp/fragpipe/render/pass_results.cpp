#include "pass_results.hpp"
#include "errors.hpp"

namespace fragpipe {

void PassResults::insert(const std::string& name, Image image) {
    auto [it, inserted] = images_.emplace(name, std::move(image));
    if (!inserted) {
        throw DuplicatePassNameError(name);
    }
    order_.push_back(name);
}

bool PassResults::contains(const std::string& name) const {
    return images_.count(name) != 0;
}

const Image* PassResults::find(const std::string& name) const {
    auto it = images_.find(name);
    return it != images_.end() ? &it->second : nullptr;
}

const Image& PassResults::at(const std::string& name) const {
    auto it = images_.find(name);
    if (it == images_.end()) {
        throw UnresolvedPassReferenceError(name, "");
    }
    return it->second;
}

} // namespace fragpipe
