#ifndef CASTOR_CORE_EXP_H_
#define CASTOR_CORE_EXP_H_

// This header is called from some non-QT projects,
// and if non C++ then Q_DECL_XXX never defined

#if defined( QT_CORE_LIB ) && defined( __cplusplus )
# include <QtCore/qglobal.h>
# ifdef CASTOR_CORE_API
#  define CASTOR_CORE_PUBLIC Q_DECL_EXPORT
# else
#  define CASTOR_CORE_PUBLIC Q_DECL_IMPORT
# endif
#else
# define CASTOR_CORE_PUBLIC
#endif

#if ((__GNUC__ > 4) || ((__GNUC__ == 4) && (__GNUC_MINOR__ >= 2)))
# define CHIDDEN     __attribute__((visibility("hidden")))
# define CUNUSED     __attribute__((unused))
#else
# define CHIDDEN
# define CUNUSED
#endif

#endif // CASTOR_CORE_EXP_H_
