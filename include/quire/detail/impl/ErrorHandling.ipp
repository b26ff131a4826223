/* ErrorHandling.ipp
Turns POSIX failures into store errors carrying the failing path
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../error.hpp"
#include "../Utility.hpp"
#include <cstring>
#include <iostream>

QUIRE_V1_NAMESPACE_BEGIN
  namespace detail{

            class store_category_impl : public boost::system::error_category
            {
            public:
                const char *name() const BOOST_NOEXCEPT_OR_NOTHROW override { return "quire"; }
                std::string message(int code) const override
                {
                    switch(static_cast<errc>(code))
                    {
                    case errc::invalid_identifier:
                        return "invalid record identifier";
                    case errc::not_found:
                        return "record not found";
                    case errc::already_exists:
                        return "record already exists";
                    case errc::already_borrowed:
                        return "record is already checked out";
                    case errc::malformed_record:
                        return "malformed record";
                    case errc::backend_io:
                        return "backend i/o failure";
                    case errc::reserved_namespace:
                        return "header namespace is reserved for the store";
                    case errc::store_in_use:
                        return "a store is already open on this root";
                    }
                    return "unknown store error";
                }
            };

            QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void int_throwOSError(const char *file, const char *function, int lineno, int code, const filesystem::path *filename)
            {
                using std::to_string;
                error_code ec(code, generic_category());
                std::string errstr(strerror(code));
                if(file)
                    errstr.append(" ("+to_string(code)+") in '"+std::string(file)+"':"+std::string(function)+":"+to_string(lineno));
                else
                    errstr.append(" ("+to_string(code)+")");
                errc kind=errc::backend_io;
                // Add the filename where appropriate. This helps debugging a lot.
                if(ENOENT==code || ENOTDIR==code)
                {
                    kind=errc::not_found;
                    if(filename)
                        errstr="File '"+filename->generic_string()+"' not found [Host OS Error: "+errstr+"]";
                }
                else if(EACCES==code)
                {
                    if(filename)
                        errstr="Access to '"+filename->generic_string()+"' denied [Host OS Error: "+errstr+"]";
                }
                else if(filename)
                    errstr="Operation on '"+filename->generic_string()+"' failed [Host OS Error: "+errstr+"]";
                QUIRE_THROW(store_error(kind, errstr, filename ? *filename : filesystem::path(), ec));
            }// end int_throwOSError

            QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void print_fatal_exception_message_to_stderr(const char *msg)
            {
                std::cerr << "quire: " << msg << std::endl;
            }
  }// namespace detail

  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC const boost::system::error_category &store_category() BOOST_NOEXCEPT_OR_NOTHROW
  {
      static detail::store_category_impl category;
      return category;
  }
QUIRE_V1_NAMESPACE_END
