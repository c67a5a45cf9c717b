#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageDecoder.h>
#include <TesseraImagery/ImageManipulation.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#define STB_IMAGE_WRITE_STATIC
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

using namespace TesseraUtility;

namespace TesseraImagery {

void ImageManipulation::unsafeBlitImage(
    std::byte* pTarget,
    size_t targetRowStride,
    const std::byte* pSource,
    size_t sourceRowStride,
    size_t sourceWidth,
    size_t sourceHeight,
    size_t bytesPerPixel) {
  const size_t bytesToCopyPerRow = bytesPerPixel * sourceWidth;

  if (bytesToCopyPerRow == targetRowStride &&
      targetRowStride == sourceRowStride) {
    std::memcpy(pTarget, pSource, sourceWidth * sourceHeight * bytesPerPixel);
  } else {
    for (size_t j = 0; j < sourceHeight; ++j) {
      std::memcpy(pTarget, pSource, bytesToCopyPerRow);
      pTarget += targetRowStride;
      pSource += sourceRowStride;
    }
  }
}

bool ImageManipulation::blitImage(
    ImageAsset& target,
    const PixelRectangle& targetPixels,
    const ImageAsset& source,
    const PixelRectangle& sourcePixels) {
  if (sourcePixels.x < 0 || sourcePixels.y < 0 || sourcePixels.width < 0 ||
      sourcePixels.height < 0 ||
      (sourcePixels.x + sourcePixels.width) > source.width ||
      (sourcePixels.y + sourcePixels.height) > source.height) {
    return false;
  }

  if (targetPixels.x < 0 || targetPixels.y < 0 || targetPixels.width < 0 ||
      targetPixels.height < 0 ||
      (targetPixels.x + targetPixels.width) > target.width ||
      (targetPixels.y + targetPixels.height) > target.height) {
    return false;
  }

  if (target.channels != source.channels ||
      target.bytesPerChannel != source.bytesPerChannel) {
    return false;
  }

  const size_t bytesPerPixel =
      size_t(target.bytesPerChannel) * size_t(target.channels);
  const size_t bytesPerSourceRow = source.getRowStride();
  const size_t bytesPerTargetRow = target.getRowStride();

  if (target.pixelData.size() < bytesPerTargetRow * size_t(target.height) ||
      source.pixelData.size() < bytesPerSourceRow * size_t(source.height)) {
    return false;
  }

  std::byte* pTarget = target.pixelData.data();
  const std::byte* pSource = source.pixelData.data();
  pTarget += size_t(targetPixels.y) * bytesPerTargetRow +
             size_t(targetPixels.x) * bytesPerPixel;
  pSource += size_t(sourcePixels.y) * bytesPerSourceRow +
             size_t(sourcePixels.x) * bytesPerPixel;

  if (sourcePixels.width == targetPixels.width &&
      sourcePixels.height == targetPixels.height) {
    unsafeBlitImage(
        pTarget,
        bytesPerTargetRow,
        pSource,
        bytesPerSourceRow,
        size_t(sourcePixels.width),
        size_t(sourcePixels.height),
        bytesPerPixel);
    return true;
  }

  if (target.bytesPerChannel != 1) {
    // Only 8-bit images can be resampled.
    return false;
  }

  return ImageDecoder::unsafeResize(
      pSource,
      sourcePixels.width,
      sourcePixels.height,
      int32_t(bytesPerSourceRow),
      pTarget,
      targetPixels.width,
      targetPixels.height,
      int32_t(bytesPerTargetRow),
      target.channels);
}

/*static*/ ImageAsset ImageManipulation::crop(
    const ImageAsset& image,
    const PixelRectangle& pixels) {
  const auto fail = [&]() {
    return CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "Cannot crop {}x{} pixels at ({}, {}) from a {}x{} image.",
            pixels.width,
            pixels.height,
            pixels.x,
            pixels.y,
            image.width,
            image.height));
  };

  if (pixels.width <= 0 || pixels.height <= 0) {
    throw fail();
  }

  ImageAsset result(pixels.width, pixels.height, image.channels);
  if (!blitImage(
          result,
          PixelRectangle{0, 0, pixels.width, pixels.height},
          image,
          pixels)) {
    throw fail();
  }
  return result;
}

/*static*/ ImageAsset ImageManipulation::pad(
    const ImageAsset& image,
    int32_t right,
    int32_t bottom) {
  ImageAsset result(image.width + right, image.height + bottom, image.channels);
  unsafeBlitImage(
      result.pixelData.data(),
      result.getRowStride(),
      image.pixelData.data(),
      image.getRowStride(),
      size_t(image.width),
      size_t(image.height),
      size_t(image.channels));
  return result;
}

/*static*/ ImageAsset ImageManipulation::toRgb(const ImageAsset& image) {
  if (image.channels == 3) {
    return image;
  }

  ImageAsset result(image.width, image.height, 3);
  const size_t pixelCount = size_t(image.width) * size_t(image.height);
  const size_t sourceChannels = size_t(image.channels);
  const bool isGray = image.channels < 3;

  for (size_t i = 0; i < pixelCount; ++i) {
    const std::byte* pSource = image.pixelData.data() + i * sourceChannels;
    std::byte* pTarget = result.pixelData.data() + i * 3;
    pTarget[0] = pSource[0];
    pTarget[1] = isGray ? pSource[0] : pSource[1];
    pTarget[2] = isGray ? pSource[0] : pSource[2];
  }

  return result;
}

/*static*/ ImageAsset ImageManipulation::convertChannels(
    const ImageAsset& image,
    int32_t channels) {
  if (image.channels == channels) {
    return image;
  }
  if (image.channels == 4 && channels == 3) {
    return toRgb(image);
  }
  throw CodedError(
      ErrorCode::ChannelMismatch,
      fmt::format(
          "Cannot convert an image with {} channels to {} channels.",
          image.channels,
          channels));
}

namespace {
void writePngToVector(void* context, void* data, int size) {
  std::vector<std::byte>* pVector =
      reinterpret_cast<std::vector<std::byte>*>(context);
  size_t previousSize = pVector->size();
  pVector->resize(previousSize + size_t(size));
  std::memcpy(pVector->data() + previousSize, data, size_t(size));
}
} // namespace

/*static*/ void ImageManipulation::savePng(
    const ImageAsset& image,
    std::vector<std::byte>& output) {
  if (image.bytesPerChannel != 1) {
    // Only 8-bit images can be written.
    return;
  }

  stbi_write_png_to_func(
      writePngToVector,
      &output,
      image.width,
      image.height,
      image.channels,
      image.pixelData.data(),
      0);
}

/*static*/ std::vector<std::byte>
ImageManipulation::savePng(const ImageAsset& image) {
  std::vector<std::byte> result;
  savePng(image, result);
  return result;
}

} // namespace TesseraImagery
