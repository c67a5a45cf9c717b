#pragma once

/**
 * @brief Utility classes shared by the Tessera libraries: error reporting,
 * hashing, math helpers and URL handling.
 */
namespace TesseraUtility {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAUTILITY_BUILDING
#define TESSERAUTILITY_API __declspec(dllexport)
#else
#define TESSERAUTILITY_API __declspec(dllimport)
#endif
#else
#define TESSERAUTILITY_API
#endif
