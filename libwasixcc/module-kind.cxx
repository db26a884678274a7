// file      : libwasixcc/module-kind.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/module-kind.hxx>

#include <cstring> // strcmp()

using namespace std;

namespace wasixcc
{
  const char*
  to_string (module_kind k) noexcept
  {
    switch (k)
    {
    case module_kind::static_main:    return "static-main";
    case module_kind::dynamic_main:   return "dynamic-main";
    case module_kind::shared_library: return "shared-library";
    case module_kind::object_file:    return "object-file";
    }

    return ""; // Can't happen.
  }

  optional<module_kind>
  parse_module_kind (const string& s)
  {
    if (s == "static-main")    return module_kind::static_main;
    if (s == "dynamic-main")   return module_kind::dynamic_main;
    if (s == "shared-library") return module_kind::shared_library;
    if (s == "object-file")    return module_kind::object_file;

    return nullopt;
  }

  optional<module_kind>
  extension_module_kind (const path& f)
  {
    const char* e (f.extension_cstring ());

    if (e != nullptr)
    {
      if (strcmp (e, "o") == 0)  return module_kind::object_file;
      if (strcmp (e, "so") == 0) return module_kind::shared_library;
    }

    return nullopt;
  }
}
