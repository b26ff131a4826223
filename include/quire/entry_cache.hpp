/* entry_cache.hpp
The process-wide owner of loaded records
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_ENTRY_CACHE_HPP
#define QUIRE_ENTRY_CACHE_HPP

#include "backend.hpp"
#include "record.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

QUIRE_V1_NAMESPACE_BEGIN

/*! \struct cache_slot
\brief A loaded record and its bookkeeping

Owned by the entry_cache. A checkout holds a reference counted pointer to its slot and
is the only thing which may modify rec while borrowed is set.
*/
struct cache_slot
{
  record rec;                //!< The record, its location carrying the store root as base
  std::string persisted;     //!< The serialised form of rec as last loaded or written
  bool has_persisted;        //!< False for a created record never yet written
  bool dirty;                //!< True if rec has changes the backend has not seen
  bool borrowed;             //!< True while a checkout exists
  explicit cache_slot(record r) : rec(std::move(r)), has_persisted(false), dirty(false), borrowed(false) { }
};
//! A shared pointer to a cache slot
typedef std::shared_ptr<cache_slot> cache_slot_ptr;

/*! \class entry_cache
\brief Maps store_id to loaded records, loading lazily and writing back on demand

All member functions are thread safe. Load failures leave the cache unchanged; write
failures leave the entry dirty so a later flush can retry. Flushing a clean entry never
writes. Borrowed (checked out) entries are never evicted, flushed behind their holder's
back, or removed.
*/
class QUIRE_DECL entry_cache
{
  backend_ptr _backend;
  filesystem::path _root;
  size_t _capacity;
  mutable std::mutex _lock;
  std::unordered_map<store_id, cache_slot_ptr> _slots;

  filesystem::path full_path(const store_id &id) const { return _root/id.local(); }
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr load(const store_id &id);
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void write(cache_slot &slot, const std::string &bytes);
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void shrink();
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool occupied(const filesystem::path &where) const;
public:
  //! Constructs a cache of records beneath \em root. A non-zero \em capacity bounds the clean entries kept.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entry_cache(backend_ptr backend, filesystem::path root, size_t capacity=0);

  //! The backend
  const backend_ptr &backend() const noexcept { return _backend; }
  //! The store root
  const filesystem::path &root() const noexcept { return _root; }
  //! The maximum number of entries kept after a release, zero for no limit
  size_t capacity() const noexcept { return _capacity; }

  //! The number of cached entries
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t size() const;
  //! True if \em id has a cache entry
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool contains(const store_id &id) const;
  //! True if \em id is checked out
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool is_borrowed(const store_id &id) const;
  //! True if \em id has unflushed changes
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool is_dirty(const store_id &id) const;
  //! True if \em id is cached or exists on the backend
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool exists(const store_id &id) const;

  //! Returns the cached entry, loading it through the backend if necessary
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr get_or_load(const store_id &id);
  //! Marks a cached entry as changed. Throws errc::not_found if \em id is not cached.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void mark_dirty(const store_id &id);
  //! Writes one dirty, unborrowed entry. Returns true if a write was performed.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool flush(const store_id &id);
  //! Writes every dirty, unborrowed entry, attempting all before rethrowing the first failure
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void flush_all();
  //! Drops a clean, unborrowed entry without writing. Returns true if dropped.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool evict(const store_id &id);
  //! Drops every clean, unborrowed entry, returning how many went
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t evict_clean();
  /*! Deletes \em id from the backend and the cache, dirty or not. Throws errc::already_borrowed
  if checked out and errc::not_found if neither cached nor on the backend.
  */
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void remove(const store_id &id);

  //! Loads if necessary and marks borrowed. Throws errc::already_borrowed or errc::not_found.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr checkout(const store_id &id);
  //! Inserts a new empty record marked borrowed. Throws errc::already_borrowed or errc::already_exists.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr checkout_new(const store_id &id);
  /*! Writes a checked out record back if its bytes changed. With \em release the borrow ends
  whether or not the write succeeds; a failed write leaves the entry dirty and is rethrown.
  */
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void check_in(const cache_slot_ptr &slot, bool release);
  //! Ends a borrow without writing. A record which was never persisted is discarded.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void cancel_checkout(const cache_slot_ptr &slot);

  /*! Renames \em from to \em to on the backend, writing out pending changes first.
  Throws errc::already_borrowed, errc::already_exists or errc::not_found.
  */
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void rename(const store_id &from, const store_id &to);
  //! Writes a copy of \em rec as the new record \em to. Throws errc::already_exists.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void save_as(const record &rec, const store_id &to);
};

QUIRE_V1_NAMESPACE_END

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/entry_cache.ipp"
#endif

#endif
