// file      : libwasixcc/command.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/command.hxx>

#include <iostream> // cout

#include <libwasixcc/pipeline.hxx>
#include <libwasixcc/filesystem.hxx>
#include <libwasixcc/diagnostics.hxx>

using namespace std;

namespace wasixcc
{
  const char* const command_names[7] = {
    "cc", "++", "cc++", "ar", "nm", "ranlib", "ld"};

  const char*
  to_string (command c) noexcept
  {
    switch (c)
    {
    case command::cc:     return "cc";
    case command::cxx:    return "cc++";
    case command::ld:     return "ld";
    case command::ar:     return "ar";
    case command::nm:     return "nm";
    case command::ranlib: return "ranlib";
    }

    return ""; // Can't happen.
  }

  optional<string>
  command_name (const path& p)
  {
    string n (p.leaf ().string ());

#ifdef _WIN32
    {
      path l (n);
      if (l.extension () == "exe")
        n = l.base ().string ();
    }
#endif

    if (n.compare (0, 6, "wasix-") == 0)
      return string (n, 6);

    if (n.compare (0, 5, "wasix") == 0)
      return string (n, 5);

    return nullopt;
  }

  optional<command>
  parse_command (const string& n)
  {
    if (n == "cc")                return command::cc;
    if (n == "++" || n == "cc++") return command::cxx;
    if (n == "ld")                return command::ld;
    if (n == "ar")                return command::ar;
    if (n == "nm")                return command::nm;
    if (n == "ranlib")            return command::ranlib;

    return nullopt;
  }

  void
  run_command (command c,
               const strings& args,
               const environment& env,
               tool_runner& tr)
  {
    switch (c)
    {
    case command::cc:     run_compiler (args, false, env, tr);        break;
    case command::cxx:    run_compiler (args, true, env, tr);         break;
    case command::ld:     run_linker (args, env, tr);                 break;
    case command::ar:     run_passthrough ("llvm-ar", args, env, tr); break;
    case command::nm:     run_passthrough ("llvm-nm", args, env, tr); break;
    case command::ranlib:
      run_passthrough ("llvm-ranlib", args, env, tr);
      break;
    }
  }

  void
  install_executables (const dir_path& d, const path& x)
  {
    // Resolve the executable before touching the directory since it may be
    // running through one of the links we are about to replace.
    //
    path t (x);

    try
    {
      t.realize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid executable path '" << e.path << "'";
    }
    catch (const system_error& e)
    {
      fail << "unable to resolve executable path " << x << ": " << e;
    }

    mkdir_p (d, 3);

    for (const char* c: command_names)
    {
      path l (d / path (string ("wasix") + c));

      rmfile (l, 3);
      make_symlink (t, l, 3);

      cout << "created command " << l << endl;
    }
  }
}
