#ifndef ANYKEY_CORE_LOGGING_HPP
#define ANYKEY_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <anykey/core/dynamic.hpp>

namespace anykey {

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Get the "anykey" logger, registering a colored stdout logger under that
// name if no one has registered one yet.
inline std::shared_ptr<spdlog::logger>
get_anykey_logger()
{
    auto logger = spdlog::get("anykey");
    if (!logger)
        logger = spdlog::stdout_color_mt("anykey");
    return logger;
}

// Log a function call (at info level) to the "anykey" logger.
#define ANYKEY_LOG_CALL(args)                                                 \
    {                                                                         \
        auto logger = ::anykey::get_anykey_logger();                          \
        std::ostringstream stream;                                            \
        stream << __func__ args;                                              \
        logger->info(stream.str());                                           \
    }

// Log an argument to a function call.
#define ANYKEY_LOG_ARG(arg)                                                   \
    ::anykey::detail::arg_logger<                                             \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace anykey

#endif
