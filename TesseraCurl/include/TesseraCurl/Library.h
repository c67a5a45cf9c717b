#pragma once

/**
 * @brief Network access to imagery tile servers using libcurl.
 */
namespace TesseraCurl {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERACURL_BUILDING
#define TESSERACURL_API __declspec(dllexport)
#else
#define TESSERACURL_API __declspec(dllimport)
#endif
#else
#define TESSERACURL_API
#endif
