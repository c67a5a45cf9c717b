#pragma once

/**
 * @brief Tile indices and index ranges of the Web Mercator tile pyramid.
 */
namespace TesseraGeometry {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAGEOMETRY_BUILDING
#define TESSERAGEOMETRY_API __declspec(dllexport)
#else
#define TESSERAGEOMETRY_API __declspec(dllimport)
#endif
#else
#define TESSERAGEOMETRY_API
#endif
