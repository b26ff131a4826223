/* ErrorHandling.hpp
Turns POSIX failures into store errors carrying the failing path
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_ERRORHANDLING_H
#define QUIRE_ERRORHANDLING_H

#include "../config.hpp"
#include <string>
#include <stdexcept>
#include <cerrno>

#ifdef QUIRE_EXCEPTION_DISABLESOURCEINFO
#define QUIRE_EXCEPTION_FILE(p) (const char *) 0
#define QUIRE_EXCEPTION_FUNCTION(p) (const char *) 0
#define QUIRE_EXCEPTION_LINE(p) 0
#else
#define QUIRE_EXCEPTION_FILE(p) __FILE__
#define QUIRE_EXCEPTION_FUNCTION(p) __func__
#define QUIRE_EXCEPTION_LINE(p) __LINE__
#endif

QUIRE_V1_NAMESPACE_BEGIN
  namespace detail{

                    /*! Throws a store_error for the errno value \em code. ENOENT and ENOTDIR become errc::not_found,
                    everything else errc::backend_io. The OS error is kept as the store_error's cause().
                    */
                    QUIRE_HEADERS_ONLY_FUNC_SPEC void int_throwOSError(const char *file, const char *function, int lineno, int code, const filesystem::path *filename=0);

#define QUIRE_ERRGOSFN(code, filename) { QUIRE_V1_NAMESPACE::detail::int_throwOSError(QUIRE_EXCEPTION_FILE(code), QUIRE_EXCEPTION_FUNCTION(code), QUIRE_EXCEPTION_LINE(code), code, &(filename)); }
            /*! Use this macro to wrap POSIX, UNIX or CLib functions taking a filename.
            */
#define QUIRE_ERRHOSFN(exp, filename)      { int __errcode=(exp); if(__errcode<0) QUIRE_ERRGOSFN(errno, filename); }
  }//namespace detail

QUIRE_V1_NAMESPACE_END
#endif
