#pragma once

#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/Library.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace TesseraImagery {

/**
 * @brief The result of reading an image with {@link ImageDecoder::readImage}.
 */
struct TESSERAIMAGERY_API ImageReaderResult {
  /**
   * @brief The decoded image, or `std::nullopt` if it could not be decoded.
   */
  std::optional<ImageAsset> image;

  /**
   * @brief Errors that occurred while decoding.
   */
  std::vector<std::string> errors;

  /**
   * @brief Warnings that occurred while decoding.
   */
  std::vector<std::string> warnings;
};

/**
 * @brief Decodes tile images.
 */
class TESSERAIMAGERY_API ImageDecoder {
public:
  /**
   * @brief Reads an image from a buffer.
   *
   * WebP, JPEG and PNG images are supported, identified by their content
   * rather than by a file extension. Every image is decoded to 8-bit RGBA.
   *
   * @param data The buffer from which to read the image.
   * @returns The result of reading the image.
   */
  static ImageReaderResult readImage(const std::span<const std::byte>& data);

  /**
   * @brief Resizes an image, without validating the provided pointers or
   * ranges.
   *
   * @param pInputPixels The input image.
   * @param inputWidth The width of the input image, in pixels.
   * @param inputHeight The height of the input image, in pixels.
   * @param inputStrideBytes The number of bytes from one row of the input
   * image to the next.
   * @param pOutputPixels The buffer into which to write the output image.
   * @param outputWidth The width of the output image, in pixels.
   * @param outputHeight The height of the output image, in pixels.
   * @param outputStrideBytes The number of bytes from one row of the output
   * image to the next.
   * @param channels The number of channels in both images.
   * @return `true` if the resize succeeded.
   */
  static bool unsafeResize(
      const std::byte* pInputPixels,
      int32_t inputWidth,
      int32_t inputHeight,
      int32_t inputStrideBytes,
      std::byte* pOutputPixels,
      int32_t outputWidth,
      int32_t outputHeight,
      int32_t outputStrideBytes,
      int32_t channels);
};

} // namespace TesseraImagery
