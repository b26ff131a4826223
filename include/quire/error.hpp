/* error.hpp
The error kinds reported by the entry store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_ERROR_HPP
#define QUIRE_ERROR_HPP

#include "config.hpp"
#include "boost/throw_exception.hpp"
#include <string>

//! \def QUIRE_THROW(x) Throws x such that boost::current_exception() can capture it
#define QUIRE_THROW(x) ::boost::throw_exception(x)
#define QUIRE_RETHROW throw

QUIRE_V1_NAMESPACE_BEGIN

//! The kinds of failure the store reports. Zero is never used.
enum class errc
{
  invalid_identifier=1,   //!< A malformed or unsafe record identifier
  not_found,              //!< The operation targets a record which does not exist
  already_exists,         //!< A create collided with an existing record
  already_borrowed,       //!< The record is already checked out
  malformed_record,       //!< The stored bytes do not parse as a record
  backend_io,             //!< The backend failed to read, write, rename or remove
  reserved_namespace,     //!< An attempt to overwrite the store's own header namespace
  store_in_use            //!< Another store is already open on this root in this process
};

//! The error category of errc
QUIRE_HEADERS_ONLY_FUNC_SPEC const boost::system::error_category &store_category() BOOST_NOEXCEPT_OR_NOTHROW;

inline error_code make_error_code(errc e) BOOST_NOEXCEPT_OR_NOTHROW
{
  return error_code(static_cast<int>(e), store_category());
}

/*! \class store_error
\brief The exception type thrown for every store failure

code() compares equal to one of the errc values. Where the failure came from the
operating system, cause() holds the original error code.
*/
class QUIRE_DECL store_error : public system_error
{
  filesystem::path _path;
  error_code _cause;
public:
  store_error(errc kind, const std::string &what, filesystem::path path=filesystem::path(), error_code cause=error_code())
    : system_error(make_error_code(kind), what), _path(std::move(path)), _cause(cause) { }
  //! The kind of failure
  errc kind() const BOOST_NOEXCEPT_OR_NOTHROW { return static_cast<errc>(code().value()); }
  //! The path the failure concerns, if any
  const filesystem::path &path() const BOOST_NOEXCEPT_OR_NOTHROW { return _path; }
  //! The originating operating system error, if any
  const error_code &cause() const BOOST_NOEXCEPT_OR_NOTHROW { return _cause; }
};

QUIRE_V1_NAMESPACE_END

namespace boost { namespace system {
  template<> struct is_error_code_enum<QUIRE_V1_NAMESPACE::errc> : std::true_type { };
} }

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/ErrorHandling.ipp"
#endif

#endif
