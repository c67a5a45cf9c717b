#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageDecoder.h>

#include <turbojpeg.h>
#include <webp/decode.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

#define STBI_FAILURE_USERMSG

#define STB_IMAGE_STATIC
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_STATIC
#include <stb_image_resize2.h>

namespace TesseraImagery {

namespace {

bool isWebP(const std::span<const std::byte>& data) {
  if (data.size() < 12) {
    return false;
  }
  uint32_t magic1;
  uint32_t magic2;
  std::memcpy(&magic1, data.data(), sizeof(magic1));
  std::memcpy(&magic2, data.data() + 8, sizeof(magic2));
  return magic1 == 0x46464952 && magic2 == 0x50424557;
}

void decodeWebP(
    const std::span<const std::byte>& data,
    ImageReaderResult& result) {
  ImageAsset& image = *result.image;
  if (!WebPGetInfo(
          reinterpret_cast<const uint8_t*>(data.data()),
          data.size(),
          &image.width,
          &image.height)) {
    result.image.reset();
    result.errors.emplace_back("Unable to read WebP header");
    return;
  }

  image.channels = 4;
  image.bytesPerChannel = 1;
  image.pixelData.resize(image.getRowStride() * size_t(image.height));
  uint8_t* pImage = WebPDecodeRGBAInto(
      reinterpret_cast<const uint8_t*>(data.data()),
      data.size(),
      reinterpret_cast<uint8_t*>(image.pixelData.data()),
      image.pixelData.size(),
      static_cast<int>(image.getRowStride()));
  if (!pImage) {
    result.image.reset();
    result.errors.emplace_back("Unable to decode WebP");
  }
}

bool decodeJpeg(
    const std::span<const std::byte>& data,
    ImageReaderResult& result) {
  ImageAsset& image = *result.image;
  tjhandle tjInstance = tjInitDecompress();
  if (!tjInstance) {
    return false;
  }

  int inSubsamp, inColorspace;
  bool isJpeg = false;
  if (!tjDecompressHeader3(
          tjInstance,
          reinterpret_cast<const unsigned char*>(data.data()),
          static_cast<unsigned long>(data.size()), // NOLINT
          &image.width,
          &image.height,
          &inSubsamp,
          &inColorspace)) {
    isJpeg = true;
    image.bytesPerChannel = 1;
    image.channels = 4;
    image.pixelData.resize(image.getRowStride() * size_t(image.height));
    if (tjDecompress2(
            tjInstance,
            reinterpret_cast<const unsigned char*>(data.data()),
            static_cast<unsigned long>(data.size()), // NOLINT
            reinterpret_cast<unsigned char*>(image.pixelData.data()),
            image.width,
            0,
            image.height,
            TJPF_RGBA,
            0)) {
      result.errors.emplace_back(
          std::string("Unable to decode JPEG: ") + tjGetErrorStr2(tjInstance));
      result.image.reset();
    }
  }
  tjDestroy(tjInstance);
  return isJpeg;
}

void decodeWithStb(
    const std::span<const std::byte>& data,
    ImageReaderResult& result) {
  ImageAsset& image = *result.image;
  image.bytesPerChannel = 1;
  image.channels = 4;

  int channelsInFile;
  stbi_uc* pImage = stbi_load_from_memory(
      reinterpret_cast<const stbi_uc*>(data.data()),
      static_cast<int>(data.size()),
      &image.width,
      &image.height,
      &channelsInFile,
      image.channels);
  if (!pImage) {
    result.image.reset();
    result.errors.emplace_back(stbi_failure_reason());
    return;
  }

  const size_t lastByte = image.getRowStride() * size_t(image.height);
  image.pixelData.resize(lastByte);
  std::uint8_t* u8Pointer =
      reinterpret_cast<std::uint8_t*>(image.pixelData.data());
  std::copy(pImage, pImage + lastByte, u8Pointer);
  stbi_image_free(pImage);
}

} // namespace

/*static*/ ImageReaderResult
ImageDecoder::readImage(const std::span<const std::byte>& data) {
  ImageReaderResult result;
  if (data.empty()) {
    result.errors.emplace_back("Image data is empty");
    return result;
  }

  result.image.emplace();

  if (isWebP(data)) {
    decodeWebP(data, result);
    return result;
  }

  if (decodeJpeg(data, result)) {
    return result;
  }

  // Not a JPEG, so stb_image handles PNG and the remaining formats.
  result.image.emplace();
  decodeWithStb(data, result);
  return result;
}

/*static*/ bool ImageDecoder::unsafeResize(
    const std::byte* pInputPixels,
    int32_t inputWidth,
    int32_t inputHeight,
    int32_t inputStrideBytes,
    std::byte* pOutputPixels,
    int32_t outputWidth,
    int32_t outputHeight,
    int32_t outputStrideBytes,
    int32_t channels) {
  return stbir_resize_uint8_linear(
             reinterpret_cast<const unsigned char*>(pInputPixels),
             inputWidth,
             inputHeight,
             inputStrideBytes,
             reinterpret_cast<unsigned char*>(pOutputPixels),
             outputWidth,
             outputHeight,
             outputStrideBytes,
             static_cast<stbir_pixel_layout>(channels)) != nullptr;
}

} // namespace TesseraImagery
