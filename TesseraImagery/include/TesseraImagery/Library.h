#pragma once

/**
 * @brief Tile URL providers, tile mosaics and georeferenced rasters.
 */
namespace TesseraImagery {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAIMAGERY_BUILDING
#define TESSERAIMAGERY_API __declspec(dllexport)
#else
#define TESSERAIMAGERY_API __declspec(dllimport)
#endif
#else
#define TESSERAIMAGERY_API
#endif
