//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/method.hpp>
#include <ostream>

namespace pathway {

http_method
string_to_method(
    std::string_view s) noexcept
{
    if(s.empty())
        return http_method::unknown;
    switch(s[0])
    {
    case 'C':
        if(s == "CONNECT")
            return http_method::connect;
        break;
    case 'D':
        if(s == "DELETE")
            return http_method::delete_;
        break;
    case 'G':
        if(s == "GET")
            return http_method::get;
        break;
    case 'H':
        if(s == "HEAD")
            return http_method::head;
        break;
    case 'O':
        if(s == "OPTIONS")
            return http_method::options;
        break;
    case 'P':
        if(s == "POST")
            return http_method::post;
        if(s == "PUT")
            return http_method::put;
        if(s == "PATCH")
            return http_method::patch;
        break;
    case 'T':
        if(s == "TRACE")
            return http_method::trace;
        break;
    default:
        break;
    }
    return http_method::unknown;
}

std::string_view
to_string(http_method m) noexcept
{
    switch(m)
    {
    case http_method::delete_:  return "DELETE";
    case http_method::get:      return "GET";
    case http_method::head:     return "HEAD";
    case http_method::post:     return "POST";
    case http_method::put:      return "PUT";
    case http_method::connect:  return "CONNECT";
    case http_method::options:  return "OPTIONS";
    case http_method::trace:    return "TRACE";
    case http_method::patch:    return "PATCH";
    default:
        return "";
    }
}

std::ostream&
operator<<(
    std::ostream& os,
    http_method m)
{
    return os << to_string(m);
}

} // pathway
