/* store_id.hpp
Validated, collection-relative identifiers of stored records
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_STORE_ID_HPP
#define QUIRE_STORE_ID_HPP

#include "error.hpp"
#include "boost/optional.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

QUIRE_V1_NAMESPACE_BEGIN

/*! \class store_id
\brief The name of one record, relative to a store root

A store_id is made of an optional base (the absolute root of the store it was made
for) and a local path such as `diary/2019/05/01`. The local path is never absolute,
never contains `..`, uses `/` as separator and is valid UTF-8. Comparison, ordering
and hashing look at the local path only, so ids made for different roots can be equal.

Every operation except construction is pure and cannot fail. Transformations return
new values.
*/
class QUIRE_DECL store_id
{
  boost::optional<filesystem::path> _base;
  filesystem::path _local;
  struct validated_t { };
  store_id(validated_t, boost::optional<filesystem::path> base, filesystem::path local) : _base(std::move(base)), _local(std::move(local)) { }
public:
  //! Constructs a base-less id. Throws store_error(errc::invalid_identifier) if \em local is unsafe.
  store_id(const filesystem::path &local) : store_id(validated_t(), boost::none, normalise(local)) { }
  //! \overload
  store_id(const std::string &local) : store_id(filesystem::path(local)) { }
  //! \overload
  store_id(const char *local) : store_id(filesystem::path(local)) { }
  //! Constructs an id with a base. Throws store_error(errc::invalid_identifier) if \em local is unsafe.
  store_id(filesystem::path base, const filesystem::path &local) : store_id(validated_t(), std::move(base), normalise(local)) { }

  /*! Makes the id of the record at \em full, which must lie under \em base.
  Throws store_error(errc::invalid_identifier) if it does not, or if the remainder is unsafe.
  */
  static QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store_id from_full_path(const filesystem::path &base, const filesystem::path &full);
  /*! Validates \em local, returning it normalised to `/` separators with empty and `.` segments removed.
  Throws store_error(errc::invalid_identifier) on failure.
  */
  static QUIRE_HEADERS_ONLY_MEMFUNC_SPEC filesystem::path normalise(const filesystem::path &local);

  //! The base, if any
  const boost::optional<filesystem::path> &base() const noexcept { return _base; }
  //! True if this id has a base
  bool has_base() const noexcept { return !!_base; }
  //! The collection-relative path
  const filesystem::path &local() const noexcept { return _local; }
  //! The collection-relative path as a `/` separated string
  std::string local_string() const { return _local.generic_string(); }
  //! The local path segments
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::vector<std::string> components() const;

  //! Returns a copy with the base replaced
  store_id with_base(filesystem::path base) const { return store_id(validated_t(), std::move(base), _local); }
  //! Returns a copy with the base removed
  store_id without_base() const { return store_id(validated_t(), boost::none, _local); }
  //! Returns the id of \em segment beneath this id, keeping the base
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store_id join(const filesystem::path &segment) const;

  //! The path the backend should operate on. Throws store_error(errc::invalid_identifier) if there is no base.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC filesystem::path full_path() const;

  //! True if the first local segment equals \em collection
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool is_in_collection(const std::string &collection) const;
  //! True if the leading local segments equal \em collection
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool is_in_collection(const std::vector<std::string> &collection) const;

  bool operator==(const store_id &o) const { return _local==o._local; }
  bool operator!=(const store_id &o) const { return _local!=o._local; }
  bool operator<(const store_id &o) const { return _local<o._local; }
};

//! Hashes the local path of a store_id
inline std::size_t hash_value(const store_id &id)
{
  return std::hash<filesystem::path::string_type>()(id.local().native());
}

inline std::ostream &operator<<(std::ostream &s, const store_id &id)
{
  return s << id.local_string();
}

//! Builds `module/name`, the id a per-domain module gives to one of its records
QUIRE_HEADERS_ONLY_FUNC_SPEC store_id make_module_id(const std::string &module, const filesystem::path &name);

QUIRE_V1_NAMESPACE_END

namespace std
{
  template<> struct hash<QUIRE_V1_NAMESPACE::store_id>
  {
    size_t operator()(const QUIRE_V1_NAMESPACE::store_id &id) const { return QUIRE_V1_NAMESPACE::hash_value(id); }
  };
}

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/store_id.ipp"
#endif

#endif
