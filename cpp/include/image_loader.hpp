#ifndef STRIPSENSE_IMAGE_LOADER_HPP
#define STRIPSENSE_IMAGE_LOADER_HPP

#include "pixel_buffer.hpp"
#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace StripSense {

namespace ImageLoader {

// Longest side of the buffer the analysis runs on
constexpr int DEFAULT_WORKING_SIZE = 800;

/**
 * @brief Decode an image file from disk
 * @throws ImageLoadError when the file is missing or cannot be decoded
 */
PixelBuffer loadImage(const std::string& path);

/**
 * @brief Decode an in-memory encoded image (JPEG, PNG, ...)
 * @throws ImageLoadError on empty or undecodable input
 */
PixelBuffer decodeImage(const std::vector<uint8_t>& bytes);

// Run the decoders on a worker thread; errors surface from future::get()
std::future<PixelBuffer> loadImageAsync(const std::string& path);
std::future<PixelBuffer> decodeImageAsync(std::vector<uint8_t> bytes);

// Aspect-preserving downscale so the longest side is at most maxDimension.
// Returns the input unchanged when it is already small enough.
PixelBuffer toWorkingSize(const PixelBuffer& buffer, int maxDimension = DEFAULT_WORKING_SIZE);

} // namespace ImageLoader
} // namespace StripSense

#endif // STRIPSENSE_IMAGE_LOADER_HPP
