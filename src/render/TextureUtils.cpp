/*
 * TextureUtils.cpp
 *
 * Purpose:
 *   Implements image decoding via stb_image and 2D texture creation for the globe maps.
 */

#include "render/TextureUtils.h"

#include <iostream>

#include "stb_image.h"

namespace TextureUtils {

void PrepareDecoder() {
    stbi_set_flip_vertically_on_load(true);
}

std::optional<DecodedImage> DecodeImageFile(const std::string& path) {
    int w = 0, h = 0, comp = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &comp, 0);
    if (!data) {
        std::cerr << "[Texture] Failed to load: " << path << "\n";
        return std::nullopt;
    }

    DecodedImage img;
    img.width = w;
    img.height = h;
    img.channels = comp;
    img.pixels.assign(data, data + static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(comp));
    stbi_image_free(data);
    return img;
}

namespace {

GLenum FormatForChannels(int channels) {
    switch (channels) {
        case 1: return GL_RED;
        case 3: return GL_RGB;
        case 4: return GL_RGBA;
        default: return 0;
    }
}

// Creates a texture object from tightly packed 8-bit rows and applies the given sampling.
GLuint CreateTexture(int width, int height, GLenum format, const unsigned char* pixels,
                     GLint wrapT, GLint minFilter, GLint magFilter, bool mipmaps) {
    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);

    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(format), width, height, 0, format, GL_UNSIGNED_BYTE, pixels);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    if (mipmaps) glGenerateMipmap(GL_TEXTURE_2D);

    // Longitude wraps around the globe; latitude stops at the poles.
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, wrapT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, minFilter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, magFilter);

    glBindTexture(GL_TEXTURE_2D, 0);
    return tex;
}

} // namespace

GLuint UploadTexture2D(const DecodedImage& image) {
    if (image.width <= 0 || image.height <= 0 || image.pixels.empty()) return 0;

    GLenum format = FormatForChannels(image.channels);
    if (!format) {
        std::cerr << "[Texture] Unsupported channel count: " << image.channels << "\n";
        return 0;
    }
    return CreateTexture(image.width, image.height, format, image.pixels.data(),
                         GL_CLAMP_TO_EDGE, GL_LINEAR_MIPMAP_LINEAR, GL_LINEAR, true);
}

GLuint CreateSolidTexture2D(unsigned char r, unsigned char g, unsigned char b, unsigned char a) {
    const unsigned char pixel[4] = { r, g, b, a };
    return CreateTexture(1, 1, GL_RGBA, pixel, GL_REPEAT, GL_NEAREST, GL_NEAREST, false);
}

} // namespace TextureUtils
