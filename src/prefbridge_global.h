#ifndef PREFBRIDGE_GLOBAL_H
#define PREFBRIDGE_GLOBAL_H

#include <QtCore/qglobal.h>

#if defined(PREFBRIDGE_LIBRARY)
#  define PREFBRIDGE_EXPORT Q_DECL_EXPORT
#else
#  define PREFBRIDGE_EXPORT Q_DECL_IMPORT
#endif

#endif // PREFBRIDGE_GLOBAL_H
