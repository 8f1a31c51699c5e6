#ifndef ANYKEY_CORE_EXCEPTION_HPP
#define ANYKEY_CORE_EXCEPTION_HPP

#include <typeinfo>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <anykey/core/type_definitions.hpp>

namespace anykey {

// All anykey errors are Boost.Exceptions, so whoever sees one on its way out
// can attach what they know about it (the transcoding stage, the key text, the
// path within a value, etc.). what() renders all of that.
struct error : virtual boost::exception, virtual std::exception
{
    char const*
    what() const noexcept override
    {
        return boost::diagnostic_information_what(*this);
    }
};

#define ANYKEY_DEFINE_EXCEPTION(id)                                           \
    struct id : ::anykey::error                                               \
    {                                                                         \
    };

#define ANYKEY_DEFINE_ERROR_INFO(T, id)                                       \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

ANYKEY_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

// Throw :x with the current stack trace attached.
#define ANYKEY_THROW(x)                                                       \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << ::anykey::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

ANYKEY_DEFINE_EXCEPTION(missing_error_info)
ANYKEY_DEFINE_ERROR_INFO(string, error_info_id)
ANYKEY_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)

// Get the :ErrorInfo attached to :e, or throw missing_error_info if there
// isn't one.
template<class ErrorInfo, class Exception>
typename ErrorInfo::value_type const&
get_required_error_info(Exception const& e)
{
    auto const* info = get_error_info<ErrorInfo>(e);
    if (info)
        return *info;
    ANYKEY_THROW(
        missing_error_info()
        << error_info_id_info(typeid(ErrorInfo).name())
        << wrapped_exception_diagnostics_info(
               boost::diagnostic_information(e)));
}

} // namespace anykey

#endif
