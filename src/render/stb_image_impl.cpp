// Single translation unit that compiles the stb_image implementation.
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
