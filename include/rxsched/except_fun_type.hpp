#pragma once

#include <functional>
#include <exception>

namespace rxsched {

/**
 * @brief      Type of function to be called for handling exceptions
 *
 * Backends call a handler of this type whenever the body of a scheduled task exits with an
 * exception. If a backend is not given a handler, it falls back to its own policy (see the
 * documentation of each backend).
 */
using except_fun_t = std::function<void(std::exception_ptr)>;

} // namespace rxsched
