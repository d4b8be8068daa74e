#ifndef LOGDEDUP_EXCEPTION_HPP
#define LOGDEDUP_EXCEPTION_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/// @defgroup exception_support Exception support macros
/// @{

/**
 * Expands to the current source location (file, line, function).
 */
#define LOGDEDUP_SOURCE_LOCATION (::logdedup::source_location(__FILE__, __LINE__, __func__))

/**
 * Augments an @ref logdedup::exception with the current source location.
 */
#define LOGDEDUP_AUGMENT_EXCEPTION(e) \
    (::logdedup::detail::with_location((e), LOGDEDUP_SOURCE_LOCATION))

/**
 * Throw the given @ref logdedup::exception with added source location information.
 */
#define LOGDEDUP_THROW(e) throw(LOGDEDUP_AUGMENT_EXCEPTION(e))

/// @}

namespace logdedup {

/**
 * Represents the source code location at which an exception was thrown.
 */
class source_location {
public:
    source_location() = default;

    source_location(const char* file, int line, const char* function)
        : m_file(file)
        , m_line(line)
        , m_function(function) {}

    const char* file() const { return m_file; }
    int line() const { return m_line; }
    const char* function() const { return m_function; }

private:
    const char* m_file = "";
    int m_line = 0;
    const char* m_function = "";
};

class exception;

namespace detail {

template<typename Exception>
Exception with_location(Exception&& e, const source_location& where) {
    static_assert(std::is_base_of<exception, std::decay_t<Exception>>::value,
                  "Exception must be derived from logdedup::exception.");
    e.set_where(where);
    return std::forward<Exception>(e);
}

} // namespace detail

/**
 * Base class for all exceptions thrown by this library.
 */
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    /**
     * Returns the source code location that threw this exception.
     *
     * \note Requires that the exception was thrown using
     * @ref LOGDEDUP_THROW, otherwise `where()` will return an empty source location.
     */
    const source_location& where() const { return m_where; }

private:
    template<typename T>
    friend T detail::with_location(T&&, const source_location&);

    void set_where(const source_location& loc) { m_where = loc; }

private:
    source_location m_where;
};

/**
 * Thrown when the content of a datastructure or of an encoded value
 * is known to be corrupted.
 */
class corruption_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when the underlying digest implementation failed to hash a key.
 */
class hash_error : public exception {
public:
    using exception::exception;
};

/**
 * Exceptions of this class or its subclasses are thrown when an object
 * is being misused, i.e. it is being passed the wrong arguments
 * or it is in the wrong state.
 */
class usage_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when an object cannot perform an operation in its current state.
 */
class bad_operation : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when an invalid argument is being passed to some operation.
 */
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

} // namespace logdedup

#endif // LOGDEDUP_EXCEPTION_HPP
