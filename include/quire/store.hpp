/* store.hpp
The entry store and its checkout handles
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_STORE_HPP
#define QUIRE_STORE_HPP

#include "entry_cache.hpp"
#include "iteration.hpp"

/*! \file store.hpp
\brief Provides the store and checkout classes
*/

QUIRE_V1_NAMESPACE_BEGIN

/*! \enum store_flags
\brief Bitwise flags for opening a store
*/
enum class store_flags : unsigned
{
  none=0,          //!< Open an existing root, no cross-process locking
  create=1,        //!< Create the root directory if it is missing
  os_lockable=2,   //!< Also take the backend's advisory lock on every checked out record
  always_sync=4    //!< Have the default filesystem backend fsync() every write
};
QUIRE_DECLARE_CLASS_ENUM_AS_BITFIELD(store_flags)

/*! \class checkout
\brief Exclusive, scoped access to one record of a store

While a checkout lives no other create() or retrieve() of its record succeeds. On
destruction, or on release(), the record is written back through the cache if its
serialised form changed. A checkout is movable but not copyable, and keeps the store's
cache alive for as long as it exists. Until then the store's root counts as open.
*/
class QUIRE_DECL checkout
{
  friend class store;
  std::shared_ptr<entry_cache> _cache;
  cache_slot_ptr _slot;
  std::unique_ptr<record_lock> _lock;
  checkout(std::shared_ptr<entry_cache> cache, cache_slot_ptr slot, std::unique_ptr<record_lock> lock) : _cache(std::move(cache)), _slot(std::move(slot)), _lock(std::move(lock)) { }
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot &slot() const;
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void release_noexcept() noexcept;
public:
  checkout(checkout &&o) noexcept : _cache(std::move(o._cache)), _slot(std::move(o._slot)), _lock(std::move(o._lock)) { }
  //! Releases the record currently held before taking over \em o's
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout &operator=(checkout &&o) noexcept;
  checkout(const checkout &)=delete;
  checkout &operator=(const checkout &)=delete;
  //! Writes back and releases. Failures are printed to stderr and the entry stays dirty for the next flush.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC ~checkout();

  //! True if this handle still holds a record
  explicit operator bool() const noexcept { return !!_slot; }
  //! The id of the record held
  const store_id &id() const { return slot().rec.location(); }
  //! The record held. Throws std::logic_error if the handle is empty.
  record &get() { return slot().rec; }
  //! \overload
  const record &get() const { return slot().rec; }
  record &operator*() { return get(); }
  const record &operator*() const { return get(); }
  record *operator->() { return &get(); }
  const record *operator->() const { return &get(); }
  //! The header of the record held
  record_header &header() { return get().header(); }
  //! \overload
  const record_header &header() const { return get().header(); }
  //! The content of the record held
  const std::string &content() const { return get().content(); }
  //! Replaces the content of the record held
  void set_content(std::string content) { get().set_content(std::move(content)); }
  //! Replaces the header of the record held, keeping its reserved table
  void set_header(record_header header) { get().set_header(std::move(header)); }

  //! Writes the record back now if it changed, keeping hold of it
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void commit();
  //! Writes the record back if it changed and lets go of it. The handle is empty afterwards even if this throws.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void release();
};

/*! \class store
\brief The entry store: maps identifiers to the records beneath one root directory

Only one store may be open on a given root within a process. Records are loaded through
an entry_cache shared with the checkouts handed out, so a record read twice is parsed
once, and a record not changed is never rewritten. Destroying the store flushes any
entries whose write-back failed earlier.

\qexample{store_example}
*/
class QUIRE_DECL store
{
  filesystem::path _root;
  store_flags _flags;
  backend_ptr _backend;
  std::string _registry_key;
  std::shared_ptr<entry_cache> _cache;
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout make_checkout(cache_slot_ptr slot);
public:
  /*! Opens the store rooted at \em root. If \em backend is null the filesystem backend is used.
  Throws errc::store_in_use if this process already has a store open there, and
  errc::not_found if \em root is missing and store_flags::create was not given.
  */
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store(filesystem::path root, store_flags flags=store_flags::create, backend_ptr backend=backend_ptr(), size_t cache_capacity=0);
  store(const store &)=delete;
  store &operator=(const store &)=delete;
  //! Flushes. Failures are printed to stderr.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC ~store();

  //! The root directory
  const filesystem::path &path() const noexcept { return _root; }
  //! The flags the store was opened with
  store_flags flags() const noexcept { return _flags; }
  //! The backend
  const backend_ptr &backend() const noexcept { return _backend; }
  //! The entry cache shared with outstanding checkouts
  const std::shared_ptr<entry_cache> &cache() const noexcept { return _cache; }

  //! Creates a new empty record. Throws errc::already_borrowed or errc::already_exists.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout create(const store_id &id);
  //! Checks out an existing record. Throws errc::already_borrowed or errc::not_found.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout retrieve(const store_id &id);
  //! As retrieve(), except that a missing record returns an empty optional
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<checkout> get(const store_id &id);
  //! Writes \em c back without releasing it. \em c must have come from this store.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void update(checkout &c);
  //! Deletes a record. Throws errc::already_borrowed or errc::not_found.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void remove(const store_id &id);
  //! True if the record is cached or stored
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool exists(const store_id &id) const;
  //! Renames a record. Throws errc::already_borrowed, errc::already_exists or errc::not_found.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void move_by_id(const store_id &from, const store_id &to);
  //! Stores a copy of the record held by \em c as \em to. Throws errc::already_exists.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void save_to(const checkout &c, const store_id &to);

  //! The ids of every record in the store
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence entries() const;
  //! The ids of the records in \em collection, which may be several segments deep
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence entries(const std::string &collection) const;

  //! Writes every dirty entry, rethrowing the first failure after trying them all
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void flush();
  //! Flushes, then drops every clean entry from the cache
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void flush_cache();
  //! The number of cached entries
  size_t cache_size() const { return _cache->size(); }
};

QUIRE_V1_NAMESPACE_END

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/store.ipp"
#include "detail/impl/iteration.ipp"
#endif

#endif
