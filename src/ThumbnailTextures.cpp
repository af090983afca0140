#include "ThumbnailTextures.hpp"
#include "base64.hpp"

#include <GLFW/glfw3.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#include <stb_image.h>

#include <vector>

ThumbnailTextures::~ThumbnailTextures()
{
    clear();
}

const ThumbnailTextures::Texture* ThumbnailTextures::get(const std::string& key, const std::string& dataUrl)
{
    auto it = _textures.find(key);
    if (it == _textures.end())
        it = _textures.emplace(key, upload(dataUrl)).first;
    it->second.lastUsedFrame = _frame;
    return it->second.id != 0 ? &it->second : nullptr;
}

void ThumbnailTextures::collect(uint64_t maxIdleFrames)
{
    ++_frame;
    for (auto it = _textures.begin(); it != _textures.end();)
    {
        if (_frame - it->second.lastUsedFrame > maxIdleFrames)
        {
            if (it->second.id != 0)
                glDeleteTextures(1, &it->second.id);
            it = _textures.erase(it);
        }
        else
            ++it;
    }
}

void ThumbnailTextures::clear()
{
    for (auto& kv : _textures)
    {
        if (kv.second.id != 0)
            glDeleteTextures(1, &kv.second.id);
    }
    _textures.clear();
}

ThumbnailTextures::Texture ThumbnailTextures::upload(const std::string& dataUrl)
{
    Texture tex;
    std::vector<unsigned char> bytes;
    if (!base64_decode(data_url_payload(dataUrl), bytes) || bytes.empty())
        return tex;

    int w = 0, h = 0;
    unsigned char* px = stbi_load_from_memory(bytes.data(), int(bytes.size()), &w, &h, nullptr, 4);
    if (!px)
        return tex;

    GLuint id = 0;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, px);
    stbi_image_free(px);

    tex.id = id;
    tex.width = w;
    tex.height = h;
    return tex;
}
