/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Helpers to bridge exception-based code into emlxx::result.

*/

#pragma once

#include <exception>
#include <filesystem>
#include <functional>
#include <new>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <emlxx/codec/codec.hpp>
#include <emlxx/detail/error_detail.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/mime/mime.hpp>

namespace emlxx
{

[[nodiscard]] inline error from_exception(std::exception_ptr eptr, error_code fallback)
{
    if (!eptr)
        return error(fallback, "unknown exception");

    try
    {
        std::rethrow_exception(eptr);
    }
    catch (const mime_error& exc)
    {
        return error(exc.code(), exc.what(), exc.details());
    }
    catch (const codec_error& exc)
    {
        return error(error_code::mime_encoding_error, exc.what());
    }
    catch (const std::filesystem::filesystem_error& exc)
    {
        detail::error_detail detail;
        if (!exc.path1().empty())
            detail.add_path("path", exc.path1());
        if (!exc.path2().empty())
            detail.add_path("path2", exc.path2());
        detail.add_ec("errc", exc.code());
        return error(error_code::file_system_error, exc.what(), detail.str());
    }
    catch (const std::system_error& exc)
    {
        return error(fallback, exc.what(), detail::error_detail().add_ec("errc", exc.code()).str());
    }
    catch (const std::bad_alloc& exc)
    {
        return error(error_code::internal_error, exc.what());
    }
    catch (const std::exception& exc)
    {
        return error(fallback, exc.what());
    }
    catch (...)
    {
        return error(fallback, "unknown exception");
    }
}

template<class F>
[[nodiscard]] auto protect(F&& f, error_code fallback) -> result<std::invoke_result_t<F>>
{
    using ret_t = std::invoke_result_t<F>;
    try
    {
        if constexpr (std::is_void_v<ret_t>)
        {
            std::invoke(std::forward<F>(f));
            return ok();
        }
        else
        {
            return result<ret_t>(std::invoke(std::forward<F>(f)));
        }
    }
    catch (...)
    {
        return fail<ret_t>(from_exception(std::current_exception(), fallback));
    }
}

} // namespace emlxx
