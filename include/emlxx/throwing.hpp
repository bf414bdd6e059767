/*

throwing.hpp
------------

Helpers to bridge emlxx::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <emlxx/config.hpp>
#include <emlxx/detail/result.hpp>

namespace emlxx
{

#if !EMLXX_THROWING_ENABLED
#error "EMLXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.message().empty() ? std::string(error_code_to_string(err.code())) : err.message()),
          error_(std::move(err))
    {
    }

    [[nodiscard]] const error& info() const noexcept { return error_; }

private:
    error error_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result_void&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace emlxx
