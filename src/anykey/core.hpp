#ifndef ANYKEY_CORE_HPP
#define ANYKEY_CORE_HPP

#include <anykey/core/dynamic.hpp>
#include <anykey/core/exception.hpp>
#include <anykey/core/omissible.hpp>
#include <anykey/core/records.hpp>
#include <anykey/core/type_definitions.hpp>
#include <anykey/core/type_interfaces.hpp>
#include <anykey/core/utilities.hpp>

#endif
