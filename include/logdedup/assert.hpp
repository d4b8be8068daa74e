#ifndef LOGDEDUP_ASSERT_HPP
#define LOGDEDUP_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// @{

#ifndef NDEBUG

/// LOGDEDUP_DEBUG is defined when this library is used in debug mode.
#    define LOGDEDUP_DEBUG

#endif

#ifdef LOGDEDUP_DEBUG

/// When in debug mode, check against the given condition
/// and abort the program with a message if the check fails.
/// Does nothing in release mode.
#    define LOGDEDUP_ASSERT(cond, message)                                             \
        do {                                                                           \
            if (!(cond)) {                                                             \
                ::logdedup::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
            }                                                                          \
        } while (0)

#else

#    define LOGDEDUP_ASSERT(cond, message)

#endif

/// @}

/// \cond INTERNAL
namespace logdedup::detail {

[[noreturn]] void assert_impl(const char* file, int line, const char* cond, const char* message);

} // namespace logdedup::detail
/// \endcond

#endif // LOGDEDUP_ASSERT_HPP
