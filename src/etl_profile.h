#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// ShelfSync - ETL Deterministic Profile
// No exceptions and no RTTI on either side. The firmware build additionally
// forbids the STL so every container is statically sized.

#define ETL_NO_EXCEPTIONS
#define ETL_NO_RTTI
#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP
#define ETL_CALLBACK_ON_ERROR

#if defined(ARDUINO)
  #define ETL_NO_STL
#endif

#endif
