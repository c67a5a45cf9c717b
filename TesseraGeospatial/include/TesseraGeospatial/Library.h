#pragma once

/**
 * @brief Geographic bounds, Web Mercator tile mapping, affine pixel transforms
 * and GeoJSON features.
 */
namespace TesseraGeospatial {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAGEOSPATIAL_BUILDING
#define TESSERAGEOSPATIAL_API __declspec(dllexport)
#else
#define TESSERAGEOSPATIAL_API __declspec(dllimport)
#endif
#else
#define TESSERAGEOSPATIAL_API
#endif
