/* backend.ipp
Pluggable raw byte storage beneath the entry store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../backend.hpp"
#include "../Utility.hpp"
#include "boost/filesystem/operations.hpp"

#include <cstring>
#include <map>
#include <mutex>
#include <unordered_set>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

// Open file description locks are per open file, not per process, so two handles
// within one process conflict the same as two processes do
#ifdef F_OFD_SETLK
# define QUIRE_F_SETLK F_OFD_SETLK
#else
# define QUIRE_F_SETLK F_SETLK
#endif
#ifndef O_CLOEXEC
# define O_CLOEXEC 0
#endif

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  inline bool is_store_private_name(const std::string &name)
  {
    static const size_t locklen=strlen(QUIRE_LOCKFILE_SUFFIX), templen=strlen(QUIRE_TEMPFILE_SUFFIX);
    if(name.size()>=locklen && 0==name.compare(name.size()-locklen, locklen, QUIRE_LOCKFILE_SUFFIX))
      return true;
    if(name.size()>=templen && 0==name.compare(name.size()-templen, templen, QUIRE_TEMPFILE_SUFFIX))
      return true;
    return false;
  }

  inline void throw_filesystem_error(const char *what, const filesystem::path &path, const error_code &ec)
  {
    errc kind=(ec==boost::system::errc::no_such_file_or_directory || ec==boost::system::errc::not_a_directory) ? errc::not_found : errc::backend_io;
    QUIRE_THROW(store_error(kind, std::string(what)+" '"+path.generic_string()+"' [Host OS Error: "+ec.message()+"]", path, ec));
  }

  inline void create_parent_directories(const filesystem::path &path)
  {
    filesystem::path parent(path.parent_path());
    if(parent.empty())
      return;
    error_code ec;
    filesystem::create_directories(parent, ec);
    if(ec)
      throw_filesystem_error("Failed to create directory", parent, ec);
  }

  // Walks a directory tree yielding record files only
  class posix_path_enumerator : public path_enumerator
  {
    filesystem::path _dir;
    filesystem::recursive_directory_iterator _it;
    bool _started;
    void fail(const char *what, const filesystem::path &path, const error_code &ec)
    {
      _it=filesystem::recursive_directory_iterator();
      throw_filesystem_error(what, path, ec);
    }
  public:
    explicit posix_path_enumerator(filesystem::path dir) : _dir(std::move(dir)), _started(false) { }
    virtual bool next(filesystem::path &out) override final
    {
      static const filesystem::recursive_directory_iterator end;
      error_code ec;
      if(!_started)
      {
        _started=true;
        filesystem::file_status st(filesystem::status(_dir, ec));
        if(filesystem::file_not_found==st.type() || (!ec && !filesystem::is_directory(st)))
          return false;
        if(ec)
          fail("Failed to enumerate", _dir, ec);
        _it=filesystem::recursive_directory_iterator(_dir, ec);
        if(ec)
          fail("Failed to enumerate", _dir, ec);
      }
      else if(end!=_it)
      {
        _it.increment(ec);
        if(ec)
          fail("Failed to enumerate", _dir, ec);
      }
      for(; end!=_it; _it.increment(ec))
      {
        if(ec)
          fail("Failed to enumerate", _dir, ec);
        if(end==_it)
          break;
        filesystem::path p(_it->path());
        std::string name(p.filename().string());
        filesystem::file_status st(_it->status(ec));
        if(ec)
          fail("Failed to stat", p, ec);
        // Hidden directories such as .git never hold records
        if(filesystem::is_directory(st))
        {
          if(!name.empty() && '.'==name[0])
            _it.disable_recursion_pending();
          continue;
        }
        if(!filesystem::is_regular_file(st) || name.empty() || '.'==name[0] || is_store_private_name(name))
          continue;
        out=std::move(p);
        return true;
      }
      if(ec)
        fail("Failed to enumerate", _dir, ec);
      return false;
    }
  };

  // An advisory lock on <record>.quirelock, taken without blocking
  struct posix_record_lock : public record_lock
  {
    filesystem::path path, lockfilepath;
    int h;
    posix_record_lock(filesystem::path p) : path(std::move(p)), lockfilepath(path), h(-1)
    {
      lockfilepath+=QUIRE_LOCKFILE_SUFFIX;
      create_parent_directories(lockfilepath);
      for(size_t attempt=0;; attempt++)
      {
        QUIRE_ERRHOSFN(h=::open(lockfilepath.c_str(), O_CREAT|O_RDWR|O_CLOEXEC, 0600), lockfilepath);
        struct flock l;
        memset(&l, 0, sizeof(l));
        l.l_type=F_WRLCK;
        l.l_whence=SEEK_SET;
        l.l_start=0;
        l.l_len=0;
        int retcode;
        while(-1==(retcode=fcntl(h, QUIRE_F_SETLK, &l)) && EINTR==errno);
        if(-1==retcode)
        {
          int code=errno;
          ::close(h);
          h=-1;
          if(EAGAIN==code || EACCES==code)
            QUIRE_THROW(store_error(errc::already_borrowed, "Record '"+path.generic_string()+"' is locked by another process", path, error_code(code, generic_category())));
          QUIRE_ERRGOSFN(code, lockfilepath);
        }
        // Between the time of opening the lock file and locking it did someone else delete it
        // or even delete and recreate it?
        struct stat before, after;
        if(-1!=fstat(h, &before) && -1!=lstat(lockfilepath.c_str(), &after) && before.st_ino==after.st_ino)
          break;
        ::close(h);
        h=-1;
        if(attempt>=16)
          QUIRE_THROW(store_error(errc::backend_io, "Lock file '"+lockfilepath.generic_string()+"' keeps being replaced", lockfilepath));
      }
      QUIRE_DEBUG_PRINT("L %s\n", lockfilepath.c_str());
    }
    ~posix_record_lock()
    {
      // Unlinking while still holding the lock means anyone who opened the old file fails the inode check
      if(-1==::unlink(lockfilepath.c_str()) && ENOENT!=errno)
      {
        QUIRE_DEBUG_PRINT("E failed to unlink %s errno=%d\n", lockfilepath.c_str(), errno);
      }
      ::close(h);
      QUIRE_DEBUG_PRINT("U %s\n", lockfilepath.c_str());
    }
  };

  // Operates on real files with POSIX calls
  class posix_backend : public backend
  {
    bool _always_sync;
    void sync_directory(const filesystem::path &dir)
    {
      int h;
      QUIRE_ERRHOSFN(h=::open(dir.empty() ? "." : dir.c_str(), O_RDONLY|O_CLOEXEC), dir);
      auto unh=detail::Undoer([h]{ ::close(h); });
      QUIRE_ERRHOSFN(::fsync(h), dir);
    }
  public:
    explicit posix_backend(bool always_sync) : _always_sync(always_sync) { }
    virtual void open_root(const filesystem::path &root, bool create) override final
    {
      error_code ec;
      filesystem::file_status st(filesystem::status(root, ec));
      if(filesystem::file_not_found==st.type())
      {
        if(!create)
          QUIRE_THROW(store_error(errc::not_found, "Store root '"+root.generic_string()+"' does not exist", root, ec));
        filesystem::create_directories(root, ec);
        if(ec)
          throw_filesystem_error("Failed to create store root", root, ec);
        return;
      }
      if(ec)
        throw_filesystem_error("Failed to open store root", root, ec);
      if(!filesystem::is_directory(st))
        QUIRE_THROW(store_error(errc::backend_io, "Store root '"+root.generic_string()+"' is not a directory", root));
    }
    virtual std::string registry_key(const filesystem::path &root) const override final
    {
      error_code ec;
      filesystem::path canonical(filesystem::weakly_canonical(filesystem::absolute(root), ec));
      if(ec)
        throw_filesystem_error("Failed to resolve store root", root, ec);
      return "file://"+canonical.generic_string();
    }
    virtual std::string read(const filesystem::path &path) const override final
    {
      int h;
      QUIRE_ERRHOSFN(h=::open(path.c_str(), O_RDONLY|O_CLOEXEC), path);
      auto unh=detail::Undoer([h]{ ::close(h); });
      struct stat s;
      QUIRE_ERRHOSFN(::fstat(h, &s), path);
      // Only regular files hold records
      if(S_ISDIR(s.st_mode))
        QUIRE_THROW(store_error(errc::not_found, "File '"+path.generic_string()+"' is a directory", path, error_code(EISDIR, generic_category())));
      std::string ret;
      char buffer[65536];
      for(;;)
      {
        ssize_t bytes=::read(h, buffer, sizeof(buffer));
        if(bytes<0)
        {
          if(EINTR==errno)
            continue;
          QUIRE_ERRGOSFN(errno, path);
        }
        if(0==bytes)
          break;
        ret.append(buffer, (size_t) bytes);
      }
      QUIRE_DEBUG_PRINT("R %s (%u bytes)\n", path.c_str(), (unsigned) ret.size());
      return ret;
    }
    virtual void write(const filesystem::path &path, const std::string &bytes) override final
    {
      create_parent_directories(path);
      filesystem::path temppath(path);
      temppath+="."+std::to_string(::getpid())+QUIRE_TEMPFILE_SUFFIX;
      int h;
      QUIRE_ERRHOSFN(h=::open(temppath.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0666), temppath);
      auto untemp=detail::Undoer([&h, &temppath]{
        if(-1!=h)
          ::close(h);
        ::unlink(temppath.c_str());
      });
      const char *p=bytes.data();
      size_t left=bytes.size();
      while(left)
      {
        ssize_t written=::write(h, p, left);
        if(written<0)
        {
          if(EINTR==errno)
            continue;
          QUIRE_ERRGOSFN(errno, temppath);
        }
        p+=written;
        left-=(size_t) written;
      }
      if(_always_sync)
        QUIRE_ERRHOSFN(::fsync(h), temppath);
      int retcode=::close(h);
      h=-1;
      if(-1==retcode)
        QUIRE_ERRGOSFN(errno, temppath);
      QUIRE_ERRHOSFN(::rename(temppath.c_str(), path.c_str()), path);
      untemp.dismiss();
      if(_always_sync)
        sync_directory(path.parent_path());
      QUIRE_DEBUG_PRINT("W %s (%u bytes)\n", path.c_str(), (unsigned) bytes.size());
    }
    virtual void remove(const filesystem::path &path) override final
    {
      QUIRE_ERRHOSFN(::unlink(path.c_str()), path);
      QUIRE_DEBUG_PRINT("D %s\n", path.c_str());
    }
    virtual void rename(const filesystem::path &from, const filesystem::path &to) override final
    {
      // Make sure the source exists before creating directories for the destination
      struct stat s;
      QUIRE_ERRHOSFN(::stat(from.c_str(), &s), from);
      create_parent_directories(to);
      QUIRE_ERRHOSFN(::rename(from.c_str(), to.c_str()), from);
      QUIRE_DEBUG_PRINT("M %s => %s\n", from.c_str(), to.c_str());
    }
    virtual void copy(const filesystem::path &from, const filesystem::path &to) override final
    {
      write(to, read(from));
    }
    virtual bool exists(const filesystem::path &path) const override final
    {
      struct stat s;
      if(-1==::stat(path.c_str(), &s))
      {
        if(ENOENT==errno || ENOTDIR==errno)
          return false;
        QUIRE_ERRGOSFN(errno, path);
      }
      return S_ISREG(s.st_mode);
    }
    virtual bool is_directory(const filesystem::path &path) const override final
    {
      struct stat s;
      if(-1==::stat(path.c_str(), &s))
      {
        if(ENOENT==errno || ENOTDIR==errno)
          return false;
        QUIRE_ERRGOSFN(errno, path);
      }
      return S_ISDIR(s.st_mode);
    }
    virtual std::unique_ptr<path_enumerator> list(const filesystem::path &dir) const override final
    {
      return detail::make_unique<posix_path_enumerator>(dir);
    }
    virtual std::unique_ptr<record_lock> lock_record(const filesystem::path &path) override final
    {
      return detail::make_unique<posix_record_lock>(path);
    }
  };

  // Yields a snapshot of paths
  class snapshot_path_enumerator : public path_enumerator
  {
    std::vector<filesystem::path> _paths;
    size_t _idx;
  public:
    explicit snapshot_path_enumerator(std::vector<filesystem::path> paths) : _paths(std::move(paths)), _idx(0) { }
    virtual bool next(filesystem::path &out) override final
    {
      if(_idx>=_paths.size())
        return false;
      out=std::move(_paths[_idx++]);
      return true;
    }
  };
}

struct inmemory_backend::impl
{
  std::mutex lock;
  std::map<filesystem::path, std::string> files;
  std::unordered_set<filesystem::path, filesystem_hash> locked;
  size_t writes;
  impl() : writes(0) { }
  static filesystem::path key(const filesystem::path &p) { return p.lexically_normal(); }
  static void not_found(const filesystem::path &p)
  {
    QUIRE_THROW(store_error(errc::not_found, "File '"+p.generic_string()+"' not found", p, error_code(ENOENT, generic_category())));
  }
  // Emulates an advisory lock file
  struct held_lock : public record_lock
  {
    std::shared_ptr<impl> p;
    filesystem::path path;
    held_lock(std::shared_ptr<impl> _p, filesystem::path _path) : p(std::move(_p)), path(std::move(_path)) { }
    ~held_lock()
    {
      std::lock_guard<std::mutex> g(p->lock);
      p->locked.erase(path);
    }
  };
};

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC inmemory_backend::inmemory_backend() : p(std::make_shared<impl>())
{
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC inmemory_backend::~inmemory_backend()
{
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void inmemory_backend::open_root(const filesystem::path &, bool)
{
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string inmemory_backend::registry_key(const filesystem::path &root) const
{
  return "memory://"+std::to_string((size_t) p.get())+"/"+impl::key(root).generic_string();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string inmemory_backend::read(const filesystem::path &path) const
{
  std::lock_guard<std::mutex> g(p->lock);
  auto it=p->files.find(impl::key(path));
  if(p->files.end()==it)
    impl::not_found(path);
  return it->second;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void inmemory_backend::write(const filesystem::path &path, const std::string &bytes)
{
  std::lock_guard<std::mutex> g(p->lock);
  p->files[impl::key(path)]=bytes;
  p->writes++;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void inmemory_backend::remove(const filesystem::path &path)
{
  std::lock_guard<std::mutex> g(p->lock);
  if(!p->files.erase(impl::key(path)))
    impl::not_found(path);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void inmemory_backend::rename(const filesystem::path &from, const filesystem::path &to)
{
  std::lock_guard<std::mutex> g(p->lock);
  auto it=p->files.find(impl::key(from));
  if(p->files.end()==it)
    impl::not_found(from);
  std::string bytes(std::move(it->second));
  p->files.erase(it);
  p->files[impl::key(to)]=std::move(bytes);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void inmemory_backend::copy(const filesystem::path &from, const filesystem::path &to)
{
  std::lock_guard<std::mutex> g(p->lock);
  auto it=p->files.find(impl::key(from));
  if(p->files.end()==it)
    impl::not_found(from);
  p->files[impl::key(to)]=it->second;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool inmemory_backend::exists(const filesystem::path &path) const
{
  std::lock_guard<std::mutex> g(p->lock);
  return p->files.count(impl::key(path))>0;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool inmemory_backend::is_directory(const filesystem::path &path) const
{
  // Directories exist only as the parents of files
  filesystem::path k(impl::key(path));
  std::string prefix(k.generic_string());
  if(prefix.empty() || '/'!=prefix.back())
    prefix.push_back('/');
  std::lock_guard<std::mutex> g(p->lock);
  auto it=p->files.upper_bound(k);
  return p->files.end()!=it && 0==it->first.generic_string().compare(0, prefix.size(), prefix);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::unique_ptr<path_enumerator> inmemory_backend::list(const filesystem::path &dir) const
{
  std::string prefix(impl::key(dir).generic_string());
  while(!prefix.empty() && '/'==prefix.back())
    prefix.pop_back();
  prefix.push_back('/');
  std::vector<filesystem::path> paths;
  {
    std::lock_guard<std::mutex> g(p->lock);
    for(auto &i : p->files)
    {
      std::string name(i.first.generic_string());
      if(0!=name.compare(0, prefix.size(), prefix) || detail::is_store_private_name(name))
        continue;
      // As on disk, hidden files and anything beneath a hidden directory are not records
      if(std::string::npos!=name.find("/.", prefix.size()-1))
        continue;
      paths.push_back(i.first);
    }
  }
  return detail::make_unique<detail::snapshot_path_enumerator>(std::move(paths));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::unique_ptr<record_lock> inmemory_backend::lock_record(const filesystem::path &path)
{
  filesystem::path k(impl::key(path));
  std::lock_guard<std::mutex> g(p->lock);
  if(!p->locked.insert(k).second)
    QUIRE_THROW(store_error(errc::already_borrowed, "Record '"+path.generic_string()+"' is locked by another holder", path));
  return detail::make_unique<impl::held_lock>(p, k);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t inmemory_backend::write_count() const
{
  std::lock_guard<std::mutex> g(p->lock);
  return p->writes;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC backend_ptr make_filesystem_backend(bool always_sync)
{
  return std::make_shared<detail::posix_backend>(always_sync);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::shared_ptr<inmemory_backend> make_inmemory_backend()
{
  return std::make_shared<inmemory_backend>();
}

QUIRE_V1_NAMESPACE_END
