#pragma once
#include <imgui.h>

#include <cstdint>
#include <string>
#include <unordered_map>

/// @brief ThumbnailTextures: GL textures decoded from cached data urls, keyed like the image cache.
/// Textures not drawn for a while are released by collect().
class ThumbnailTextures
{
public:
    ThumbnailTextures() = default;
    ~ThumbnailTextures();
    ThumbnailTextures(const ThumbnailTextures&) = delete;
    ThumbnailTextures& operator=(const ThumbnailTextures&) = delete;

    /// @brief Texture: uploaded image, 0 id when decoding failed.
    struct Texture
    {
        unsigned int id = 0;
        int width = 0;
        int height = 0;
        uint64_t lastUsedFrame = 0;
    };

    // Decodes `dataUrl` on first use. Returns nullptr if it can't be decoded.
    const Texture* get(const std::string& key, const std::string& dataUrl);

    // Call once per frame after drawing
    void collect(uint64_t maxIdleFrames = 600);
    void clear();

    std::size_t size() const { return _textures.size(); }

    static ImTextureID toImTexture(const Texture& t) { return (ImTextureID)(intptr_t)t.id; }

private:
    static Texture upload(const std::string& dataUrl);

    std::unordered_map<std::string, Texture> _textures;
    uint64_t _frame = 0;
};
