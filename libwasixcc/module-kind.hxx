// file      : libwasixcc/module-kind.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_MODULE_KIND_HXX
#define LIBWASIXCC_MODULE_KIND_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

namespace wasixcc
{
  // Kind of the module being produced.
  //
  // The static main is an executable with all the imports resolved at link
  // time. The dynamic main is a position-independent executable that can
  // load shared libraries at runtime. The object file is a relocatable
  // object that is never linked by us.
  //
  enum class module_kind: uint8_t
  {
    static_main,
    dynamic_main,
    shared_library,
    object_file
  };

  // Return true if the code must be compiled and linked position-independent.
  //
  inline bool
  requires_pic (module_kind k)
  {
    return k == module_kind::dynamic_main || k == module_kind::shared_library;
  }

  // Return true if the module is produced by the linker.
  //
  inline bool
  linkable (module_kind k)
  {
    return k != module_kind::object_file;
  }

  inline bool
  executable (module_kind k)
  {
    return k == module_kind::static_main || k == module_kind::dynamic_main;
  }

  // Return the module kind name as used in the MODULE_KIND setting (for
  // example, static-main).
  //
  const char*
  to_string (module_kind) noexcept;

  inline ostream&
  operator<< (ostream& os, module_kind k) {return os << to_string (k);}

  // Parse the module kind name returning nullopt if it is not recognized.
  //
  optional<module_kind>
  parse_module_kind (const string&);

  // Infer the module kind from the output file extension: .o is the object
  // file and .so is the shared library. Return nullopt for any other or no
  // extension.
  //
  optional<module_kind>
  extension_module_kind (const path& output);
}

#endif // LIBWASIXCC_MODULE_KIND_HXX
