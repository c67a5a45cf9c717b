#pragma once

/**
 * @brief Asynchronous tasks, futures and the network access interfaces used to
 * download imagery tiles.
 */
namespace TesseraAsync {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAASYNC_BUILDING
#define TESSERAASYNC_API __declspec(dllexport)
#else
#define TESSERAASYNC_API __declspec(dllimport)
#endif
#else
#define TESSERAASYNC_API
#endif
