/* header.hpp
The structured header tree of a record
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_HEADER_HPP
#define QUIRE_HEADER_HPP

#include "error.hpp"
#include "boost/optional.hpp"
#include "boost/variant.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

QUIRE_V1_NAMESPACE_BEGIN

class header_value;
//! An ordered sequence of header values
typedef std::vector<header_value> header_array;
//! Named header values, kept sorted by name
typedef std::map<std::string, header_value> header_table;

//! The type held by a header_value
enum class header_type
{
  string=0,
  integer,
  floating,
  boolean,
  array,
  table
};

/*! \class header_value
\brief One node of a record header: a string, integer, double, boolean, array or table

A default constructed header_value is an empty table. Typed access is through
get<T>(), which returns a null pointer if the value holds a different type.
*/
class QUIRE_DECL header_value
{
  typedef boost::variant<std::string, std::int64_t, double, bool,
    boost::recursive_wrapper<header_array>, boost::recursive_wrapper<header_table>> storage_type;
  storage_type _v;
public:
  header_value() : _v(header_table()) { }
  header_value(std::string v) : _v(std::move(v)) { }
  header_value(const char *v) : _v(std::string(v)) { }
  header_value(int v) : _v(static_cast<std::int64_t>(v)) { }
  header_value(long v) : _v(static_cast<std::int64_t>(v)) { }
  header_value(long long v) : _v(static_cast<std::int64_t>(v)) { }
  header_value(double v) : _v(v) { }
  header_value(bool v) : _v(v) { }
  header_value(header_array v) : _v(std::move(v)) { }
  header_value(header_table v) : _v(std::move(v)) { }

  //! The type of value held
  header_type type() const noexcept { return static_cast<header_type>(_v.which()); }
  bool is_string() const noexcept { return header_type::string==type(); }
  bool is_integer() const noexcept { return header_type::integer==type(); }
  bool is_floating() const noexcept { return header_type::floating==type(); }
  bool is_boolean() const noexcept { return header_type::boolean==type(); }
  bool is_array() const noexcept { return header_type::array==type(); }
  bool is_table() const noexcept { return header_type::table==type(); }

  //! A pointer to the held T, or null if something else is held
  template<class T> const T *get() const noexcept { return boost::get<T>(&_v); }
  //! \overload
  template<class T> T *get() noexcept { return boost::get<T>(&_v); }
  //! A reference to the held T. Throws boost::bad_get if something else is held.
  template<class T> const T &as() const { return boost::get<T>(_v); }
  //! \overload
  template<class T> T &as() { return boost::get<T>(_v); }

  bool operator==(const header_value &o) const { return _v==o._v; }
  bool operator!=(const header_value &o) const { return !(_v==o._v); }
};

/*! \class record_header
\brief The header of a record, addressed by dotted paths

Paths are `.` separated keys such as `contact.name.first`. A segment written `[N]`
indexes into an array. The `quire` table is reserved for the store: it always exists,
holds the record format `version` and the `modules` which own the record, and any
attempt to change it through this interface throws store_error(errc::reserved_namespace).
*/
class QUIRE_DECL record_header
{
  friend class record;
  header_table _root;
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC header_table &reserved();
public:
  //! The name of the reserved table
  static const char *reserved_name() noexcept { return "quire"; }

  //! Constructs a header holding only the reserved table
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record_header();
  record_header(const record_header &)=default;
  record_header(record_header &&)=default;
  //! Not assignable. record::set_header() replaces a header while keeping its reserved table.
  record_header &operator=(const record_header &)=delete;
  record_header &operator=(record_header &&)=delete;
  /*! Parses header text. Fills in a missing reserved table. Throws store_error(errc::malformed_record)
  if the text does not parse or if the reserved table is the wrong shape.
  */
  static QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record_header parse(const std::string &text);
  //! Deterministic text form which parse() reads back to an equal header
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string serialize() const;

  //! The value at \em path, or null
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC const header_value *read(const std::string &path) const;
  //! The value at \em path for modification, or null. Throws for reserved paths.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC header_value *read_mut(const std::string &path);
  /*! Sets the value at \em path, creating intermediate tables. Returns what was there before.
  Throws std::invalid_argument if the path runs through something which is not a table or array,
  or indexes past the end of an array.
  */
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<header_value> set(const std::string &path, header_value value);
  //! Removes the value at \em path, returning it
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<header_value> remove(const std::string &path);

  //! The whole tree, reserved table included
  const header_table &table() const noexcept { return _root; }
  //! The record format version in the reserved table
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string version() const;
  //! The module tags in the reserved table
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::vector<std::string> modules() const;

  bool operator==(const record_header &o) const { return _root==o._root; }
  bool operator!=(const record_header &o) const { return _root!=o._root; }
};

namespace detail
{
  //! Parses the TOML subset used by record headers. Throws store_error(errc::malformed_record).
  QUIRE_HEADERS_ONLY_FUNC_SPEC header_table parse_header_text(const std::string &text);
  //! Writes a table in the TOML subset, keys sorted, sub-tables as [sections]
  QUIRE_HEADERS_ONLY_FUNC_SPEC std::string serialize_header_text(const header_table &table);
}

QUIRE_V1_NAMESPACE_END

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/header.ipp"
#endif

#endif
