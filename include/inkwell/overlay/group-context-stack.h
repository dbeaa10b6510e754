#pragma once

#include <string>
#include <vector>

namespace inkwell {
namespace overlay {

// Most-recently-used list of group names. The front entry is the implicit
// target of draw commands that do not name a group. Names are unique.
class GroupContextStack {
public:
    // Move name to the front, inserting it if absent.
    void push(const std::string& name);

    // Front name, or "" when empty.
    std::string peek() const;

    // Remove and return the front name, or "" when empty.
    std::string pop();

    void clear() { _names.clear(); }

    bool empty() const { return _names.empty(); }
    size_t size() const { return _names.size(); }
    const std::vector<std::string>& names() const { return _names; }

private:
    std::vector<std::string> _names;
};

} // namespace overlay
} // namespace inkwell
