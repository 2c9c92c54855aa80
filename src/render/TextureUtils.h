/*
 * TextureUtils.h
 *
 * Purpose:
 *   Texture helpers for the globe's day and night maps.
 *   Decoding (stb_image) is split from GL upload so decoding can run on a worker thread while the
 *   upload stays on the thread that owns the GL context.
 *
 * Conventions:
 *   - Images are flipped vertically at decode time (bottom row first), matching the globe's
 *     v = 0 at the south pole.
 *   - Call PrepareDecoder() once on the main thread before starting any worker decodes; the flip
 *     flag is global state inside stb_image.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <glad/glad.h>

namespace TextureUtils {

struct DecodedImage {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<unsigned char> pixels;
};

void PrepareDecoder();

// CPU only; safe to call from a worker thread. Returns nullopt (logged) on failure.
std::optional<DecodedImage> DecodeImageFile(const std::string& path);

/*
 * Uploads a decoded image into a new 2D texture with mipmaps.
 *
 * Returns:
 *   OpenGL texture ID (0 on failure).
 *
 * Notes:
 *   - Wrap S repeats (the date line is seamless), wrap T clamps (poles).
 */
GLuint UploadTexture2D(const DecodedImage& image);

// 1x1 solid RGBA texture, used as a fallback when a map is missing.
GLuint CreateSolidTexture2D(unsigned char r, unsigned char g, unsigned char b, unsigned char a = 255);

} // namespace TextureUtils
