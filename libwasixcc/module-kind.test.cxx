// file      : libwasixcc/module-kind.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/module-kind.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace wasixcc
{
  int
  main (int, char*[])
  {
    using mk = module_kind;

    // Predicates.
    //
    {
      assert (!requires_pic (mk::static_main));
      assert ( requires_pic (mk::dynamic_main));
      assert ( requires_pic (mk::shared_library));
      assert (!requires_pic (mk::object_file));

      assert ( linkable (mk::static_main));
      assert ( linkable (mk::dynamic_main));
      assert ( linkable (mk::shared_library));
      assert (!linkable (mk::object_file));

      assert ( executable (mk::static_main));
      assert ( executable (mk::dynamic_main));
      assert (!executable (mk::shared_library));
      assert (!executable (mk::object_file));
    }

    // Names.
    //
    {
      for (mk k: {mk::static_main,
                  mk::dynamic_main,
                  mk::shared_library,
                  mk::object_file})
      {
        optional<mk> p (parse_module_kind (to_string (k)));
        assert (p && *p == k);
      }

      ostringstream os;
      os << mk::shared_library;
      assert (os.str () == "shared-library");

      assert (!parse_module_kind (""));
      assert (!parse_module_kind ("static_main"));
      assert (!parse_module_kind ("Static-Main"));
      assert (!parse_module_kind ("executable"));
    }

    // Output extension.
    //
    {
      auto ek = [] (const char* p) {return extension_module_kind (path (p));};

      auto is = [&ek] (const char* p, mk k)
      {
        optional<mk> r (ek (p));
        return r && *r == k;
      };

      assert (is ("foo.o",     mk::object_file));
      assert (is ("out/foo.o", mk::object_file));
      assert (is ("libfoo.so", mk::shared_library));
      assert (!ek ("foo"));
      assert (!ek ("foo.wasm"));
      assert (!ek ("foo.so.1"));
      assert (!ek ("foo.obj"));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return wasixcc::main (argc, argv);
}
