#ifndef CASTOR_MEDIA_EXP_H_
#define CASTOR_MEDIA_EXP_H_

#if defined( QT_CORE_LIB ) && defined( __cplusplus )
# include <QtCore/qglobal.h>
# ifdef CASTOR_MEDIA_API
#  define CASTOR_MEDIA_PUBLIC Q_DECL_EXPORT
# else
#  define CASTOR_MEDIA_PUBLIC Q_DECL_IMPORT
# endif
#else
# define CASTOR_MEDIA_PUBLIC
#endif

#endif // CASTOR_MEDIA_EXP_H_
