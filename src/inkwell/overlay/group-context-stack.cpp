#include <inkwell/overlay/group-context-stack.h>

#include <algorithm>

namespace inkwell {
namespace overlay {

void GroupContextStack::push(const std::string& name) {
    auto it = std::find(_names.begin(), _names.end(), name);
    if (it != _names.end()) {
        _names.erase(it);
    }
    _names.insert(_names.begin(), name);
}

std::string GroupContextStack::peek() const {
    if (_names.empty()) return "";
    return _names.front();
}

std::string GroupContextStack::pop() {
    if (_names.empty()) return "";
    std::string front = std::move(_names.front());
    _names.erase(_names.begin());
    return front;
}

} // namespace overlay
} // namespace inkwell
