#pragma once

#include <inkwell/overlay/surface.h>
#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <list>
#include <string>
#include <unordered_map>
#include <utility>

namespace inkwell {
namespace overlay {

constexpr size_t DEFAULT_IMAGE_CACHE_SIZE = 100;

//-----------------------------------------------------------------------------
// ImageCache - decodes encoded image bytes (PNG, JPEG, BMP, ...) to RGBA8 and
// memoizes the result by the exact encoded bytes, least recently used first
// out. Failed decodes are not cached.
//-----------------------------------------------------------------------------
class ImageCache {
public:
    explicit ImageCache(size_t capacity = DEFAULT_IMAGE_CACHE_SIZE)
        : _capacity(capacity == 0 ? 1 : capacity) {}

    Result<Image::Ptr> get(const Bytes& encoded);

    size_t size() const { return _entries.size(); }
    size_t capacity() const { return _capacity; }
    size_t hits() const { return _hits; }
    size_t misses() const { return _misses; }

    void clear();

private:
    using Entry = std::pair<std::string, Image::Ptr>;

    static Result<Image::Ptr> decode(const Bytes& encoded);

    size_t _capacity;
    std::list<Entry> _entries;  // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> _index;
    size_t _hits = 0;
    size_t _misses = 0;
};

} // namespace overlay
} // namespace inkwell
