#include <anykey/core/utilities.hpp>

namespace anykey {

void
check_array_size(size_t expected_size, size_t actual_size)
{
    if (expected_size != actual_size)
    {
        ANYKEY_THROW(
            array_size_mismatch() << expected_size_info(expected_size)
                                  << actual_size_info(actual_size));
    }
}

} // namespace anykey
