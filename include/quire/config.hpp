/* config.hpp
Build configuration for the quire entry store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_CONFIG_HPP
#define QUIRE_CONFIG_HPP

#if !defined(QUIRE_HEADERS_ONLY) && !defined(BOOST_ALL_DYN_LINK)
#define QUIRE_HEADERS_ONLY 1
#endif

#include "boost/config.hpp"
#include "boost/filesystem/path.hpp"
#include "boost/system/error_code.hpp"
#include "boost/system/system_error.hpp"

#include <cstddef>
#include <type_traits>

//! \def QUIRE_VERSION_MAJOR The major version of the record format written into [quire] version
#define QUIRE_VERSION_MAJOR 1
#define QUIRE_VERSION_MINOR 0
#define QUIRE_VERSION_PATCH 0
#define QUIRE_VERSION_STRINGIZE2(a) #a
#define QUIRE_VERSION_STRINGIZE(a) QUIRE_VERSION_STRINGIZE2(a)
#define QUIRE_VERSION_STRING QUIRE_VERSION_STRINGIZE(QUIRE_VERSION_MAJOR) "." QUIRE_VERSION_STRINGIZE(QUIRE_VERSION_MINOR) "." QUIRE_VERSION_STRINGIZE(QUIRE_VERSION_PATCH)

//! \def QUIRE_LOCKFILE_SUFFIX Appended to a record's path to form its advisory lock file
#ifndef QUIRE_LOCKFILE_SUFFIX
#define QUIRE_LOCKFILE_SUFFIX ".quirelock"
#endif
//! \def QUIRE_TEMPFILE_SUFFIX Appended to a record's path while its new contents are being written
#ifndef QUIRE_TEMPFILE_SUFFIX
#define QUIRE_TEMPFILE_SUFFIX ".quiretmp"
#endif

#define QUIRE_V1_NAMESPACE       quire::v1
#define QUIRE_V1_NAMESPACE_BEGIN namespace quire { inline namespace v1 {
#define QUIRE_V1_NAMESPACE_END   } }

QUIRE_V1_NAMESPACE_BEGIN
  namespace filesystem = ::boost::filesystem;
  using ::boost::system::error_code;
  using ::boost::system::system_error;
  using ::boost::system::generic_category;
  using ::boost::system::system_category;
QUIRE_V1_NAMESPACE_END

///////////////////////////////////////////////////////////////////////////////
//  Set up dll import/export options
#if (defined(QUIRE_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && \
    !defined(QUIRE_STATIC_LINK)

#if defined(QUIRE_SOURCE)
#undef QUIRE_HEADERS_ONLY
#define QUIRE_DECL BOOST_SYMBOL_EXPORT
#define QUIRE_BUILD_DLL
#else
#define QUIRE_DECL BOOST_SYMBOL_IMPORT
#endif
#else
# define QUIRE_DECL
#endif // building a shared library

#if QUIRE_HEADERS_ONLY == 1
# define QUIRE_HEADERS_ONLY_FUNC_SPEC inline
# define QUIRE_HEADERS_ONLY_MEMFUNC_SPEC inline
# define QUIRE_HEADERS_ONLY_VIRTUAL_SPEC inline virtual
#else
# define QUIRE_HEADERS_ONLY_FUNC_SPEC extern QUIRE_DECL
# define QUIRE_HEADERS_ONLY_MEMFUNC_SPEC
# define QUIRE_HEADERS_ONLY_VIRTUAL_SPEC virtual
#endif

//! \def QUIRE_DECLARE_CLASS_ENUM_AS_BITFIELD(T) Gives a scoped enum the bitwise operators of a flags type
#define QUIRE_DECLARE_CLASS_ENUM_AS_BITFIELD(T) \
inline constexpr T operator&(T a, T b) \
{ \
  return static_cast<T>(static_cast<std::underlying_type<T>::type>(a) & static_cast<std::underlying_type<T>::type>(b)); \
} \
inline constexpr T operator|(T a, T b) \
{ \
  return static_cast<T>(static_cast<std::underlying_type<T>::type>(a) | static_cast<std::underlying_type<T>::type>(b)); \
} \
inline constexpr T operator~(T a) \
{ \
  return static_cast<T>(~static_cast<std::underlying_type<T>::type>(a)); \
} \
inline constexpr bool operator!(T a) \
{ \
  return 0==static_cast<std::underlying_type<T>::type>(a); \
}

#endif  /* QUIRE_CONFIG_HPP */
