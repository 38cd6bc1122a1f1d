//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_CONFIG_HPP
#define PATHWAY_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace pathway {

//------------------------------------------------

# if (defined(PATHWAY_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(PATHWAY_STATIC_LINK)
#  if defined(PATHWAY_SOURCE)
#   define PATHWAY_DECL        BOOST_SYMBOL_EXPORT
#   define PATHWAY_BUILD_DLL
#  else
#   define PATHWAY_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  PATHWAY_DECL
#  define PATHWAY_DECL
# endif

#if defined(__MINGW32__)
    #define PATHWAY_SYMBOL_VISIBLE PATHWAY_DECL
#else
    #define PATHWAY_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef PATHWAY_NO_SOURCE_LOCATION
# define PATHWAY_ERR(ev) (::boost::system::error_code(ev))
# define PATHWAY_RETURN_EC(ev) return (ev)
#else
# define PATHWAY_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define PATHWAY_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // pathway

// lift boost namespaces into ours
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace pathway {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
} // pathway

#endif
