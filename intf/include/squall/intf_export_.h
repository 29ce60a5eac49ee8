#ifndef SQUALL_INTF_EXPORT__H
#define SQUALL_INTF_EXPORT__H

/*
 * Various macros to control symbol visibility in libraries.
 */
#if defined(WIN32)
# ifdef squall_intf_EXPORTS
#   define squall_intf_export_        __declspec(dllexport)
#   define squall_intf_local_         /* nothing */
# else
#   define squall_intf_export_        __declspec(dllimport)
#   define squall_intf_local_         /* nothing */
# endif
#elif defined(__GNUC__) || defined(__clang__)
# define squall_intf_export_          __attribute__ ((visibility ("default")))
# define squall_intf_local_           __attribute__ ((visibility ("hidden")))
#else
# define squall_intf_export_          /* nothing */
# define squall_intf_local_           /* nothing */
#endif

#endif /* SQUALL_INTF_EXPORT__H */
