/* backend.hpp
Pluggable raw byte storage beneath the entry store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_BACKEND_HPP
#define QUIRE_BACKEND_HPP

#include "error.hpp"
#include <memory>
#include <string>

QUIRE_V1_NAMESPACE_BEGIN

class backend;
//! A shared, internally synchronised backend
typedef std::shared_ptr<backend> backend_ptr;

/*! \class path_enumerator
\brief A lazy walk over the record files beneath a directory

Yields the full paths of regular files only, never directories nor the store's own
lock and temporary files. Not restartable.
*/
class QUIRE_DECL path_enumerator
{
public:
  virtual ~path_enumerator() { }
  /*! Fetches the next path into \em out, returning false at the end. Throws store_error
  if the walk fails part way; the enumerator is then at its end.
  */
  virtual bool next(filesystem::path &out)=0;
};

/*! \class record_lock
\brief An advisory, cross-process lock on one record, released on destruction
*/
class QUIRE_DECL record_lock
{
public:
  virtual ~record_lock() { }
};

/*! \class backend
\brief Raw file operations on full paths

Every operation may fail. Failures are thrown as store_error naming the path concerned,
with errc::not_found where the path does not exist and errc::backend_io otherwise; the
operating system's own error is kept as store_error::cause(). A backend caches nothing.

\qexample{backend_example}
*/
class QUIRE_DECL backend
{
public:
  virtual ~backend() { }
  /*! Prepares the store root. If it does not exist it is created when \em create is true,
  else errc::not_found is thrown.
  */
  virtual void open_root(const filesystem::path &root, bool create)=0;
  //! A key identifying \em root among all the roots this kind of backend could open
  virtual std::string registry_key(const filesystem::path &root) const=0;
  //! Reads the whole of a file
  virtual std::string read(const filesystem::path &path) const=0;
  //! Replaces the whole of a file with \em bytes, creating parent directories. Readers see the old or new bytes, never a mix.
  virtual void write(const filesystem::path &path, const std::string &bytes)=0;
  //! Removes a file
  virtual void remove(const filesystem::path &path)=0;
  //! Renames a file, creating parent directories of the destination
  virtual void rename(const filesystem::path &from, const filesystem::path &to)=0;
  //! Copies a file, creating parent directories of the destination
  virtual void copy(const filesystem::path &from, const filesystem::path &to)=0;
  //! True if a file exists at \em path
  virtual bool exists(const filesystem::path &path) const=0;
  //! True if a directory exists at \em path
  virtual bool is_directory(const filesystem::path &path) const=0;
  //! Starts a recursive walk of the files beneath \em dir. A missing \em dir yields nothing.
  virtual std::unique_ptr<path_enumerator> list(const filesystem::path &dir) const=0;
  /*! Takes the advisory lock on \em path without blocking, throwing errc::already_borrowed if
  someone else holds it.
  */
  virtual std::unique_ptr<record_lock> lock_record(const filesystem::path &path)=0;
};

/*! \class inmemory_backend
\brief A backend keeping files in a process-local map, for deterministic tests

Directories are implicit in the stored paths. write_count() counts the writes performed
so tests can observe when the store touches its backend.
*/
class QUIRE_DECL inmemory_backend : public backend
{
  struct impl;
  std::shared_ptr<impl> p;
public:
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC inmemory_backend();
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC ~inmemory_backend();
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC void open_root(const filesystem::path &root, bool create) override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC std::string registry_key(const filesystem::path &root) const override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC std::string read(const filesystem::path &path) const override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC void write(const filesystem::path &path, const std::string &bytes) override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC void remove(const filesystem::path &path) override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC void rename(const filesystem::path &from, const filesystem::path &to) override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC void copy(const filesystem::path &from, const filesystem::path &to) override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC bool exists(const filesystem::path &path) const override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC bool is_directory(const filesystem::path &path) const override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC std::unique_ptr<path_enumerator> list(const filesystem::path &dir) const override;
  QUIRE_HEADERS_ONLY_VIRTUAL_SPEC std::unique_ptr<record_lock> lock_record(const filesystem::path &path) override;
  //! The number of successful write() calls so far
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t write_count() const;
};

//! Makes a backend operating on real files. With \em always_sync every write is fsync()ed before it replaces the old file.
QUIRE_HEADERS_ONLY_FUNC_SPEC backend_ptr make_filesystem_backend(bool always_sync=false);
//! Makes a new, empty in-memory backend
QUIRE_HEADERS_ONLY_FUNC_SPEC std::shared_ptr<inmemory_backend> make_inmemory_backend();

QUIRE_V1_NAMESPACE_END

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/backend.ipp"
#endif

#endif
