#ifndef PL_GPIB_EXPORT_H
#define PL_GPIB_EXPORT_H

#ifdef _WIN32
#ifdef pl_gpib_core_EXPORTS
#define PL_GPIB_API __declspec(dllexport)
#else
#define PL_GPIB_API __declspec(dllimport)
#endif
#else
#define PL_GPIB_API
#endif

#endif // PL_GPIB_EXPORT_H
