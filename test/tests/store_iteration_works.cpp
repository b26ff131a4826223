#include "test_functions.hpp"
#include <set>

namespace
{
  // The kind of store_error a failure item carries, empty for a value
  template<class T> boost::optional<QUIRE_V1_NAMESPACE::errc> failure_kind(const QUIRE_V1_NAMESPACE::outcome<T> &o)
  {
    if(o.has_value())
      return boost::none;
    try
    {
      o.value();
    }
    catch(const QUIRE_V1_NAMESPACE::store_error &e)
    {
      return e.kind();
    }
    return boost::none;
  }

  std::set<std::string> local_names(const std::vector<QUIRE_V1_NAMESPACE::store_id> &ids)
  {
    std::set<std::string> ret;
    for(auto &i : ids)
      ret.insert(i.local_string());
    return ret;
  }

  void make_record(QUIRE_V1_NAMESPACE::store &s, const char *id, const char *kind, const char *content)
  {
    auto c=s.create(id);
    c.header().set("kind", kind);
    c.set_content(content);
  }
}

QUIRE_AUTO_TEST_CASE(store_iteration_works, "Tests that store entries enumerate and filter lazily", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  store s("/iter", store_flags::create, b);
  make_record(s, "a/1", "todo", "first");
  make_record(s, "a/2", "note", "second");
  make_record(s, "b/1", "todo", "third");

  std::cout << "Checking enumeration is complete" << std::endl;
  auto all=local_names(s.entries().collect());
  BOOST_CHECK(all==(std::set<std::string>{ "a/1", "a/2", "b/1" }));
  BOOST_CHECK(local_names(s.entries("a").collect())==(std::set<std::string>{ "a/1", "a/2" }));
  BOOST_CHECK(s.entries("nothing/here").collect().empty());
  QUIRE_CHECK_ERRC(s.entries("../a"), errc::invalid_identifier);

  std::cout << "Checking the id filters" << std::endl;
  BOOST_CHECK(local_names(s.entries().in_collection("a").collect())==(std::set<std::string>{ "a/1", "a/2" }));
  BOOST_CHECK(local_names(s.entries().in_collection("b").collect())==(std::set<std::string>{ "b/1" }));
  BOOST_CHECK(local_names(s.entries().find_by_id_substr("/1").collect())==(std::set<std::string>{ "a/1", "b/1" }));
  BOOST_CHECK(local_names(s.entries().find_by_id_startswith("b").collect())==(std::set<std::string>{ "b/1" }));
  BOOST_CHECK(s.entries().find_by_id_startswith("c").collect().empty());

  std::cout << "Checking the ids carry the store root" << std::endl;
  for(auto &i : s.entries())
  {
    BOOST_REQUIRE(i.has_value());
    BOOST_CHECK(i.value().has_base());
    BOOST_CHECK(i.value().base()==filesystem::path("/iter"));
  }

  std::cout << "Checking records retrieved in a loop write back as the loop advances" << std::endl;
  size_t visited=0;
  for(auto &i : s.entries().into_retrieve_iter(s))
  {
    BOOST_REQUIRE(i.has_value());
    checkout &c=i.value();
    c.set_content(c.content()+"!");
    ++visited;
  }
  BOOST_CHECK(visited==3);
  BOOST_CHECK(s.retrieve("a/1").content()=="first!");
  BOOST_CHECK(s.retrieve("b/1").content()=="third!");

  std::cout << "Checking where_header" << std::endl;
  {
    auto todos=where_header(s.entries().into_retrieve_iter(s), "kind", [](const header_value &v) {
      return v.is_string() && "todo"==v.as<std::string>();
    }).collect();
    std::set<std::string> names;
    for(auto &c : todos)
      names.insert(c.id().local_string());
    BOOST_CHECK(names==(std::set<std::string>{ "a/1", "b/1" }));
    // Records kept by the filter are still held
    QUIRE_CHECK_ERRC(s.retrieve("a/1"), errc::already_borrowed);
    BOOST_CHECK_NO_THROW(s.retrieve("a/2"));
  }
  BOOST_CHECK(where_header(s.entries().into_retrieve_iter(s), "missing.key", [](const header_value &) { return true; }).collect().empty());

  std::cout << "Checking into_get_iter skips records deleted after enumeration" << std::endl;
  {
    auto seq=s.entries("a").into_get_iter(s);
    s.remove("a/2");
    size_t present=0, gone=0;
    for(auto &i : seq)
    {
      BOOST_REQUIRE(i.has_value());
      if(i.value())
        ++present;
      else
        ++gone;
    }
    BOOST_CHECK(present==1);
    BOOST_CHECK(gone==1);
  }
}

QUIRE_AUTO_TEST_CASE(store_iteration_errors, "Tests that bad entries become failure items without ending the sequence", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  store s("/itererr", store_flags::create, b);
  make_record(s, "a/1", "todo", "first");
  make_record(s, "a/2", "todo", "second");
  b->write("/itererr/a/bad", "---\nnot toml at all\n---\n");
  // Not valid UTF-8, so not a usable identifier
  b->write("/itererr/a/latin1-\xe9t\xe9", "junk");
  // The store's own files are never listed
  b->write("/itererr/a/half-written" QUIRE_TEMPFILE_SUFFIX, "junk");

  std::cout << "Checking an unusable name is a failure item" << std::endl;
  {
    size_t values=0;
    std::multiset<errc> failures;
    for(auto &i : s.entries())
    {
      if(i.has_value())
        ++values;
      else
        failures.insert(*failure_kind(i));
    }
    BOOST_CHECK(values==3);
    BOOST_CHECK(failures==(std::multiset<errc>{ errc::invalid_identifier }));
    QUIRE_CHECK_ERRC(s.entries().collect(), errc::invalid_identifier);
  }

  std::cout << "Checking an unparseable record is a failure item" << std::endl;
  {
    size_t values=0;
    std::multiset<errc> failures;
    for(auto &i : s.entries().into_retrieve_iter(s))
    {
      if(i.has_value())
        ++values;
      else
        failures.insert(*failure_kind(i));
    }
    BOOST_CHECK(values==2);
    BOOST_CHECK(failures==(std::multiset<errc>{ errc::invalid_identifier, errc::malformed_record }));
  }

  std::cout << "Checking a held record fails only its own item" << std::endl;
  {
    auto held=s.retrieve("a/1");
    std::multiset<errc> failures;
    size_t values=0;
    for(auto &i : s.entries().find_by_id_substr("a/").into_retrieve_iter(s))
    {
      if(i.has_value())
        ++values;
      else
        failures.insert(*failure_kind(i));
    }
    BOOST_CHECK(values==1);
    BOOST_CHECK(failures==(std::multiset<errc>{ errc::invalid_identifier, errc::already_borrowed, errc::malformed_record }));
  }

  std::cout << "Checking into_delete_iter" << std::endl;
  {
    auto held=s.retrieve("a/2");
    std::vector<store_id> deleted;
    size_t failed=0;
    for(auto &i : s.entries("a").find_by_id_startswith("a/").into_delete_iter(s))
    {
      if(i.has_value())
        deleted.push_back(i.value());
      else
        ++failed;
    }
    // The bad record can be deleted even though it cannot be read
    BOOST_CHECK(local_names(deleted)==(std::set<std::string>{ "a/1", "a/bad" }));
    BOOST_CHECK(failed==2);
    BOOST_CHECK(!s.exists("a/1"));
    BOOST_CHECK(!s.exists("a/bad"));
    BOOST_CHECK(s.exists("a/2"));
  }
}

QUIRE_AUTO_TEST_CASE(store_iteration_backends_agree, "Tests that both backends enumerate the same records from the same files", 20)
{
  using namespace QUIRE_V1_NAMESPACE;
  scratch_dir dir;
  auto mem=make_inmemory_backend();
  std::vector<std::pair<filesystem::path, backend_ptr>> roots={
    { filesystem::path("/agree"), mem },
    { dir.path, make_filesystem_backend() }
  };
  for(auto &r : roots)
  {
    const filesystem::path &root=r.first;
    const backend_ptr &b=r.second;
    std::cout << "Checking enumeration under " << root << std::endl;
    store s(root, store_flags::create, b);
    make_record(s, "notes/visible", "note", "seen");
    QUIRE_CHECK_ERRC(s.create("notes/.draft"), errc::invalid_identifier);
    QUIRE_CHECK_ERRC(s.create(".git/notes"), errc::invalid_identifier);
    // Files put there by other tools
    b->write(root/"notes"/".hidden", "x");
    b->write(root/".git"/"HEAD", "ref");
    b->write(root/"notes"/("visible" QUIRE_TEMPFILE_SUFFIX), "x");
    b->write(root/"notes"/("visible" QUIRE_LOCKFILE_SUFFIX), "");
    BOOST_CHECK(local_names(s.entries().collect())==(std::set<std::string>{ "notes/visible" }));
    BOOST_CHECK(local_names(s.entries("notes").collect())==(std::set<std::string>{ "notes/visible" }));
  }
}
