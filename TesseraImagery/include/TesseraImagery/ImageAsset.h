#pragma once

#include <TesseraImagery/Library.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TesseraImagery {

/**
 * @brief A decoded 8-bit image with interleaved channels, stored row-major
 * from the top-left pixel.
 */
struct TESSERAIMAGERY_API ImageAsset final {
  /**
   * @brief The width of the image in pixels.
   */
  int32_t width = 0;

  /**
   * @brief The height of the image in pixels.
   */
  int32_t height = 0;

  /**
   * @brief The number of channels per pixel: 1 (gray), 2 (gray and alpha),
   * 3 (RGB) or 4 (RGBA).
   */
  int32_t channels = 4;

  /**
   * @brief The number of bytes per channel. Only 1 is produced by the
   * decoder.
   */
  int32_t bytesPerChannel = 1;

  /**
   * @brief The pixel data, `width * height * channels * bytesPerChannel`
   * bytes.
   */
  std::vector<std::byte> pixelData;

  ImageAsset() = default;

  /**
   * @brief Creates a zero-filled image.
   */
  ImageAsset(int32_t width_, int32_t height_, int32_t channels_)
      : width(width_),
        height(height_),
        channels(channels_),
        bytesPerChannel(1),
        pixelData(
            size_t(width_) * size_t(height_) * size_t(channels_),
            std::byte(0)) {}

  /**
   * @brief Gets the number of bytes in one row of pixels.
   */
  size_t getRowStride() const noexcept {
    return size_t(this->width) * size_t(this->channels) *
           size_t(this->bytesPerChannel);
  }
};
} // namespace TesseraImagery
