#include <inkwell/overlay/image-cache.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace inkwell {
namespace overlay {

Result<Image::Ptr> ImageCache::get(const Bytes& encoded) {
    std::string key(encoded.begin(), encoded.end());

    auto it = _index.find(key);
    if (it != _index.end()) {
        _entries.splice(_entries.begin(), _entries, it->second);
        ++_hits;
        return Ok(it->second->second);
    }

    ++_misses;
    auto image = decode(encoded);
    if (!image) {
        return image;
    }

    _entries.emplace_front(key, *image);
    _index[std::move(key)] = _entries.begin();

    while (_entries.size() > _capacity) {
        _index.erase(_entries.back().first);
        _entries.pop_back();
    }
    return image;
}

void ImageCache::clear() {
    _entries.clear();
    _index.clear();
}

Result<Image::Ptr> ImageCache::decode(const Bytes& encoded) {
    if (encoded.empty()) {
        return Err<Image::Ptr>("ImageCache::decode: empty payload");
    }

    int width, height, channels;
    uint8_t* pixels = stbi_load_from_memory(
        encoded.data(),
        static_cast<int>(encoded.size()),
        &width, &height, &channels, 4);  // Force RGBA

    if (!pixels) {
        return Err<Image::Ptr>(std::string("ImageCache::decode: stbi_load failed: ") +
                               stbi_failure_reason());
    }

    auto image = std::make_shared<Image>();
    image->width = width;
    image->height = height;
    image->rgba.assign(pixels, pixels + static_cast<size_t>(width) * height * 4);
    stbi_image_free(pixels);

    ydebug("ImageCache::decode: {}x{} ({} channels -> 4)", width, height, channels);
    return Ok(Image::Ptr(std::move(image)));
}

} // namespace overlay
} // namespace inkwell
