/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <stdexcept>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Base class for the decoders, contains various constants and the strict mode flag shared by all of them.
**/
class EMLXX_EXPORT codec
{
public:

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Question mark character.
    **/
    static constexpr char QUESTION_MARK_CHAR = '?';

    /**
    Underscore character.
    **/
    static constexpr char UNDERSCORE_CHAR = '_';

    /**
    Methods used for the MIME header decoding.
    **/
    enum class codec_t {ASCII, BASE64, QUOTED_PRINTABLE};

    codec() : strict_mode_(false)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

    /**
    Enabling/disabling the strict mode.

    In strict mode a decoder throws on any character outside of its alphabet, otherwise such characters are skipped or kept as they are.

    @param mode True to enable strict mode, false to disable.
    **/
    void strict_mode(bool mode)
    {
        strict_mode_ = mode;
    }

    /**
    Returning the strict mode status.

    @return True if strict mode enabled, false if disabled.
    **/
    bool strict_mode() const
    {
        return strict_mode_;
    }

protected:

    /**
    Strict mode for decoding.
    **/
    bool strict_mode_;
};


/**
Error thrown by codecs.
**/
class codec_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const char* msg) : std::runtime_error(msg)
    {
    }
};


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
