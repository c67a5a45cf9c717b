#pragma once

#include <TesseraImagery/Library.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TesseraImagery {
struct ImageAsset;

/**
 * @brief Specifies a rectangle of pixels in an image.
 */
struct PixelRectangle {
  /**
   * @brief The X coordinate of the top-left corner of the rectangle.
   */
  int32_t x;

  /**
   * @brief The Y coordinate of the top-left corner of the rectangle.
   */
  int32_t y;

  /**
   * @brief The total number of pixels in the horizontal direction.
   */
  int32_t width;

  /**
   * @brief The total number of pixels in the vertical direction.
   */
  int32_t height;
};

/**
 * @brief A collection of utility functions for image manipulation operations.
 */
class TESSERAIMAGERY_API ImageManipulation {
public:
  /**
   * @brief Directly copies pixels from a source to a target, without
   * validating the provided pointers or ranges.
   *
   * @param pTarget The pointer at which to start writing pixels.
   * @param targetRowStride The number of bytes between rows in the target
   * image.
   * @param pSource The pointer at which to start reading pixels.
   * @param sourceRowStride The number of bytes between rows in the source
   * image.
   * @param sourceWidth The number of pixels to copy in the horizontal
   * direction.
   * @param sourceHeight The number of pixels to copy in the vertical
   * direction.
   * @param bytesPerPixel The number of bytes used to represent each pixel.
   */
  static void unsafeBlitImage(
      std::byte* pTarget,
      size_t targetRowStride,
      const std::byte* pSource,
      size_t sourceRowStride,
      size_t sourceWidth,
      size_t sourceHeight,
      size_t bytesPerPixel);

  /**
   * @brief Copies pixels from a source image to a target image.
   *
   * If the source and target dimensions are the same, the source pixels are
   * copied exactly into the target. If not, the source image is scaled into
   * the target rectangle.
   *
   * @param target The image in which to write pixels.
   * @param targetPixels The pixels in the target to which to write.
   * @param source The image from which to read pixels.
   * @param sourcePixels The pixels in the source from which to read.
   * @returns `true` if the copy succeeded; `false` if a rectangle lies outside
   * its image or the images have different formats.
   */
  static bool blitImage(
      ImageAsset& target,
      const PixelRectangle& targetPixels,
      const ImageAsset& source,
      const PixelRectangle& sourcePixels);

  /**
   * @brief Copies a rectangle of pixels into a new image of the same format.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the rectangle is empty or lies outside the image.
   */
  static ImageAsset crop(const ImageAsset& image, const PixelRectangle& pixels);

  /**
   * @brief Grows an image by `right` columns and `bottom` rows of zeros.
   */
  static ImageAsset pad(const ImageAsset& image, int32_t right, int32_t bottom);

  /**
   * @brief Converts an image to three RGB channels.
   *
   * Alpha is dropped and gray is replicated into each color channel.
   */
  static ImageAsset toRgb(const ImageAsset& image);

  /**
   * @brief Converts an image to `channels` channels where the conversion
   * keeps the color information: unchanged when the counts match, and RGBA
   * to RGB by dropping alpha.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::ChannelMismatch` for
   * any other combination.
   */
  static ImageAsset
  convertChannels(const ImageAsset& image, int32_t channels);

  /**
   * @brief Saves an image to a new byte buffer in PNG format.
   *
   * @param image The image to save.
   * @return The byte buffer containing the image. If the buffer is empty, the
   * image could not be written.
   */
  static std::vector<std::byte> savePng(const ImageAsset& image);

  /**
   * @brief Saves an image to an existing byte buffer in PNG format.
   *
   * @param image The image to save.
   * @param output The buffer in which to store the PNG. The image is written
   * to the end of the buffer. If the buffer size is unchanged on return, the
   * image could not be written.
   */
  static void savePng(const ImageAsset& image, std::vector<std::byte>& output);
};

} // namespace TesseraImagery
