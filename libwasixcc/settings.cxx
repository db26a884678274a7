// file      : libwasixcc/settings.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/settings.hxx>

#include <libwasixcc/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace wasixcc
{
  environment
  process_environment ()
  {
    return [] (const string& n) {return getenv (n);};
  }

  bool
  setting_argument (const string& a)
  {
    if (a.size () < 4 || a[0] != '-' || a[1] != 's')
      return false;

    size_t i (2);
    for (; i != a.size (); ++i)
    {
      char c (a[i]);

      if (c == '=')
        break;

      if (!((c >= 'A' && c <= 'Z') || digit (c) || c == '_'))
        return false;
    }

    return i != 2 && i != a.size ();
  }

  pair<strings, strings>
  separate_settings_arguments (const strings& args)
  {
    pair<strings, strings> r;

    for (const string& a: args)
      (setting_argument (a) ? r.first : r.second).push_back (a);

    return r;
  }

  optional<string>
  lookup_setting (const char* n, const strings& ss, const environment& env)
  {
    string p ("-s");
    p += n;
    p += '=';

    for (const string& s: ss)
    {
      if (s.compare (0, p.size (), p) == 0)
        return string (s, p.size ());
    }

    string v (setting_env_prefix);
    v += n;

    return env (v);
  }

  bool
  parse_bool_setting (const char* n, const string& v)
  {
    string s (trim (string (v)));

    if (icasecmp (s, "1") == 0    ||
        icasecmp (s, "true") == 0 ||
        icasecmp (s, "yes") == 0)
      return true;

    if (icasecmp (s, "0") == 0     ||
        icasecmp (s, "false") == 0 ||
        icasecmp (s, "no") == 0)
      return false;

    fail << "invalid " << n << " value '" << v << "'" <<
      info << "expected 1, true, yes or 0, false, no" << endf;
  }

  strings
  parse_list_setting (const string& v)
  {
    strings r;

    string s (trim (string (v)));
    string e;

    auto add = [&r, &e] ()
    {
      trim (e);

      if (!e.empty ())
        r.push_back (move (e));

      e.clear ();
    };

    for (size_t i (0), n (s.size ()); i != n; ++i)
    {
      char c (s[i]);

      if (c == '\\' && i + 1 != n && s[i + 1] == ':')
      {
        e += ':';
        ++i;
      }
      else if (c == ':')
        add ();
      else
        e += c;
    }

    add ();
    return r;
  }

  path llvm_location::
  tool_path (const char* t) const
  {
    if (directory)
      return *directory / path (t);

    string n (t);
    n += '-';
    n += to_string (version);
    return path (move (n));
  }

  ostream&
  operator<< (ostream& os, const llvm_location& l)
  {
    if (l.directory)
      os << *l.directory;
    else
      os << "PATH (-" << l.version << " suffix)";

    return os;
  }

  const dir_path& user_settings::
  sysroot () const
  {
    if (!sysroot_location)
      fail << "sysroot is not specified" <<
        info << "set it with -sSYSROOT=<dir> or the " << setting_env_prefix
             << "SYSROOT environment variable";

    return *sysroot_location;
  }

  ostream&
  operator<< (ostream& os, const user_settings& s)
  {
    os << "llvm: " << s.llvm << ", sysroot: ";

    if (s.sysroot_location)
      os << *s.sysroot_location;
    else
      os << "<none>";

    os << ", kind: ";

    if (s.kind)
      os << *s.kind;
    else
      os << "<none>";

    os << ", wasm-exceptions: " << s.wasm_exceptions
       << ", pic: " << s.pic
       << ", force-wasm-opt: " << s.force_wasm_opt;

    return os;
  }

  // Parse the directory setting value returning nullopt if it is empty.
  //
  static optional<dir_path>
  parse_dir_setting (const char* n, const string& v)
  {
    optional<dir_path> r;

    try
    {
      dir_path d (trim (string (v)));

      if (!d.empty ())
        r = move (d);
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << n << " value '" << e.path << "'";
    }

    return r;
  }

  llvm_location
  resolve_llvm_location (const strings& ss, const environment& env)
  {
    llvm_location r;

    if (optional<string> v = lookup_setting ("LLVM_LOCATION", ss, env))
      r.directory = parse_dir_setting ("LLVM_LOCATION", *v);

    return r;
  }

  user_settings
  resolve_settings (const strings& ss, const environment& env)
  {
    tracer trace ("resolve_settings");

    user_settings r;
    r.llvm = resolve_llvm_location (ss, env);

    auto lookup = [&ss, &env] (const char* n)
    {
      return lookup_setting (n, ss, env);
    };

    if (optional<string> v = lookup ("SYSROOT"))
      r.sysroot_location = parse_dir_setting ("SYSROOT", *v);

    if (optional<string> v = lookup ("COMPILER_FLAGS"))
      r.compiler_flags = parse_list_setting (*v);

    if (optional<string> v = lookup ("LINKER_FLAGS"))
      r.linker_flags = parse_list_setting (*v);

    if (optional<string> v = lookup ("WASM_OPT_FLAGS"))
      r.wasm_opt_flags = parse_list_setting (*v);

    if (optional<string> v = lookup ("FORCE_WASM_OPT"))
      r.force_wasm_opt = parse_bool_setting ("FORCE_WASM_OPT", *v);

    if (optional<string> v = lookup ("MODULE_KIND"))
    {
      r.kind = parse_module_kind (trim (string (*v)));

      if (!r.kind)
        fail << "invalid MODULE_KIND value '" << *v << "'" <<
          info << "expected static-main, dynamic-main, shared-library, or "
               << "object-file";
    }

    if (optional<string> v = lookup ("WASM_EXCEPTIONS"))
      r.wasm_exceptions = parse_bool_setting ("WASM_EXCEPTIONS", *v);

    if (optional<string> v = lookup ("PIC"))
      r.pic = parse_bool_setting ("PIC", *v);

    if (optional<string> v = lookup ("INCLUDE_CPP_STD"))
      r.include_cpp_std = parse_bool_setting ("INCLUDE_CPP_STD", *v);

    l4 ([&]{trace << r;});

    return r;
  }

  uint16_t
  resolve_verbosity (const strings& ss, const environment& env)
  {
    uint16_t r (1);

    if (optional<string> v = lookup_setting ("VERBOSITY", ss, env))
    {
      optional<uint64_t> n (parse_number (trim (string (*v)), 6));

      if (!n)
        fail << "invalid VERBOSITY value '" << *v << "'" <<
          info << "expected integer between 0 and 6";

      r = static_cast<uint16_t> (*n);
    }

    return r;
  }
}
